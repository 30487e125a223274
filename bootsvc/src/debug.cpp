#include <utility>

#include <frg/manual_box.hpp>

#include <bootsvc/debug.hpp>

namespace bootsvc {

namespace {

using HandlerList = frg::intrusive_list<
    LogHandler,
    frg::locate_member<LogHandler, frg::default_list_hook<LogHandler>, &LogHandler::hook>>;

HandlerList &accessHandlerList() {
	static frg::eternal<HandlerList> singleton;
	return *singleton;
}

constinit DebugOutput debugOutput = nullptr;

// Set while a panic message is passed to the handlers.
// A handler that panics itself only reaches the debug output.
constinit bool emittingPanic = false;

void emitText(frg::string_view text, bool toHandlers) {
	// The debug output goes first, a handler might not return.
	if (debugOutput) {
		for (size_t i = 0; i < text.size(); i++)
			debugOutput(text[i]);
	}

	if (!toHandlers)
		return;
	for (auto *handler : accessHandlerList())
		handler->emit(text);
}

} // anonymous namespace

constinit frg::stack_buffer_logger<LogSink, 128> infoLogger;
constinit frg::stack_buffer_logger<PanicSink, 128> panicLogger;

extern "C" void frg_panic(const char *cstring) {
	panicLogger() << "bootsvc: frg panic: " << cstring << frg::endlog;
}

DebugOutput setDebugOutput(DebugOutput output) { return std::exchange(debugOutput, output); }

void LogSink::operator()(const char *c) {
	emitText(c, true);
	emitText("\n", true);
}

void PanicSink::operator()(const char *c) {
	if (emittingPanic) {
		emitText(c, false);
		return;
	}

	emittingPanic = true;
	emitText(c, true);
	emittingPanic = false;
}

void PanicSink::finalize(bool) {
	emitText("\n", !emittingPanic);

	while (true)
		asm volatile("" : : : "memory");
}

void enableLogHandler(LogHandler *handler) {
	if (handler->active)
		return;

	accessHandlerList().push_back(handler);
	handler->active = true;
}

void disableLogHandler(LogHandler *handler) {
	if (!handler->active)
		return;

	auto &handlerList = accessHandlerList();
	handlerList.erase(handlerList.iterator_to(handler));
	handler->active = false;
}

} // namespace bootsvc
