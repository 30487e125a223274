#include <assert.h>
#include <string>

#include <bootsvc/console.hpp>
#include <bootsvc/debug.hpp>

#include "expect-halt.hpp"
#include "stub-firmware.hpp"
#include "testsuite.hpp"

namespace {

std::string debugText;

void appendDebugText(char c) { debugText.push_back(c); }

struct PipeLogHandler final : bootsvc::LogHandler {
	void emit(frg::string_view text) override {
		for (size_t i = 0; i < text.size(); i++)
			halt_detail::writeToPipe(text[i]);
	}
};

struct PanickingLogHandler final : bootsvc::LogHandler {
	void emit(frg::string_view) override {
		bootsvc::panicLogger() << "bootsvc-tests: handler panicked" << frg::endlog;
	}
};

} // anonymous namespace

DEFINE_TEST(log_handlers_receive_messages, ([] {
	CaptureLogHandler first;
	{
		CaptureLogHandler second;
		bootsvc::infoLogger() << "bootsvc-tests: value " << 42 << frg::endlog;
		assert(second.text == "bootsvc-tests: value 42\n");
	}
	assert(first.text == "bootsvc-tests: value 42\n");

	bootsvc::infoLogger() << "bootsvc-tests: hex 0x" << frg::hex_fmt{0x1f} << frg::endlog;
	assert(first.text.ends_with("bootsvc-tests: hex 0x1f\n"));
}))

DEFINE_TEST(log_handler_enabled_once, ([] {
	CaptureLogHandler capture;
	bootsvc::enableLogHandler(&capture);
	assert(capture.active);

	bootsvc::infoLogger() << "once" << frg::endlog;
	assert(capture.text == "once\n");

	bootsvc::disableLogHandler(&capture);
	assert(!capture.active);
	bootsvc::infoLogger() << "twice" << frg::endlog;
	assert(capture.text == "once\n");

	// The destructor tolerates handlers that are already disabled.
}))

DEFINE_TEST(console_log_handler, ([] {
	StubConsole console;
	bootsvc::ConsoleLogHandler handler{bootsvc::TextOutput{console.protocol()}};
	bootsvc::enableLogHandler(&handler);

	bootsvc::infoLogger() << "first\nsecond" << frg::endlog;
	assert(console.output == u"first\r\nsecond\r\n");
	// One call per line and one for the rest of each piece.
	assert(console.outputCalls == 3);

	// Output failures drop the text.
	console.outputStatus = bootsvc::status::deviceError.value();
	bootsvc::infoLogger() << "lost" << frg::endlog;
	assert(console.output == u"first\r\nsecond\r\n");

	bootsvc::disableLogHandler(&handler);
}))

DEFINE_TEST(console_log_handler_long_text, ([] {
	StubConsole console;
	bootsvc::ConsoleLogHandler handler{bootsvc::TextOutput{console.protocol()}};

	std::string text(300, 'x');
	handler.emit(frg::string_view{text.data(), text.size()});
	assert(console.output == std::u16string(300, u'x'));
	assert(console.outputCalls == 3);

	handler.emit(frg::string_view{"a\nb\n"});
	assert(console.output.ends_with(u"xa\r\nb\r\n"));
	assert(console.outputCalls == 5);
}))

DEFINE_TEST(debug_output_receives_messages, ([] {
	debugText.clear();
	auto previous = bootsvc::setDebugOutput(appendDebugText);

	// No handler is enabled at this point.
	bootsvc::infoLogger() << "bootsvc-tests: early " << 7 << frg::endlog;
	assert(debugText == "bootsvc-tests: early 7\n");

	{
		CaptureLogHandler capture;
		bootsvc::infoLogger() << "bootsvc-tests: both" << frg::endlog;
		assert(capture.text == "bootsvc-tests: both\n");
	}
	assert(debugText == "bootsvc-tests: early 7\nbootsvc-tests: both\n");

	assert(bootsvc::setDebugOutput(previous) == appendDebugText);
	bootsvc::infoLogger() << "bootsvc-tests: gone" << frg::endlog;
	assert(debugText.find("gone") == std::string::npos);
}))

DEFINE_TEST(panic_without_handlers, ([] {
	expectHalt([] {
		bootsvc::panicLogger() << "bootsvc-tests: early panic 0x" << frg::hex_fmt{0x2a}
		                       << frg::endlog;
	}, "bootsvc-tests: early panic 0x2a\n");
}))

DEFINE_TEST(panic_reaches_log_handlers, ([] {
	expectHalt([] {
		// Only the handler writes to the parent.
		bootsvc::setDebugOutput(nullptr);
		static PipeLogHandler handler;
		bootsvc::enableLogHandler(&handler);

		bootsvc::panicLogger() << "bootsvc-tests: through the handler" << frg::endlog;
	}, "bootsvc-tests: through the handler\n");
}))

DEFINE_TEST(panic_inside_log_handler_halts, ([] {
	auto text = runHalting([] {
		static PanickingLogHandler handler;
		bootsvc::enableLogHandler(&handler);
		bootsvc::infoLogger() << "bootsvc-tests: before" << frg::endlog;
	});

	auto before = text.find("bootsvc-tests: before");
	auto panicked = text.find("bootsvc-tests: handler panicked\n");
	assert(before != std::string::npos);
	assert(panicked != std::string::npos);
	assert(before < panicked);
}))
