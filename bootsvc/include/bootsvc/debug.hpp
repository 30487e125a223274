#pragma once

#include <frg/formatting.hpp>
#include <frg/list.hpp>
#include <frg/logging.hpp>
#include <frg/string.hpp>

namespace bootsvc {

struct LogSink {
	void operator()(const char *c);
};

struct PanicSink {
	void operator()(const char *c);
	[[noreturn]] void finalize(bool);
};

extern frg::stack_buffer_logger<LogSink, 128> infoLogger;
extern frg::stack_buffer_logger<PanicSink, 128> panicLogger;

// Character device that receives all log output before the LogHandlers do,
// for example a serial port that works without boot services.
// It is the only output for messages emitted before a LogHandler is enabled.
using DebugOutput = void (*)(char c);

// Returns the previous output. Passing nullptr removes the output.
DebugOutput setDebugOutput(DebugOutput output);

// Receives all text emitted through the loggers.
// Messages may arrive in several pieces; each message ends with a newline.
struct LogHandler {
	virtual void emit(frg::string_view text) = 0;

	frg::default_list_hook<LogHandler> hook;
	bool active{false};
};

void enableLogHandler(LogHandler *handler);
void disableLogHandler(LogHandler *handler);

} // namespace bootsvc
