#include <assert.h>

#include <bootsvc/console.hpp>
#include <bootsvc/system-table.hpp>

#include "expect-halt.hpp"
#include "stub-firmware.hpp"
#include "testsuite.hpp"

DEFINE_TEST(text_output_strings, ([] {
	StubConsole console;
	bootsvc::TextOutput out{console.protocol()};

	assert(out.outputString(u"Hello"));
	assert(out.outputString(u", world\r\n"));
	assert(console.output == u"Hello, world\r\n");

	assert(out.testString(u"plain"));
	assert_status(out.testString(u"☃"), bootsvc::status::unsupported);

	assert(out.reset());
	assert(console.output.empty());
}))

DEFINE_TEST(text_output_requires_terminator, ([] {
	expectHalt([] {
		StubConsole console;
		bootsvc::TextOutput out{console.protocol()};
		const char16_t unterminated[] = {u'o', u'k'};
		out.outputString(unterminated);
	}, "String passed to outputString() is not NUL-terminated");

	expectHalt([] {
		StubConsole console;
		bootsvc::TextOutput out{console.protocol()};
		const char16_t unterminated[] = {u'o', u'k'};
		out.testString(unterminated);
	}, "String passed to testString() is not NUL-terminated");
}))

DEFINE_TEST(text_output_modes, ([] {
	StubConsole console;
	bootsvc::TextOutput out{console.protocol()};

	assert(out.modeCount() == 2);
	assert(out.currentMode() == 0);

	auto size = out.queryMode(1);
	assert(size);
	assert(size->columns == 80);
	assert(size->rows == 50);
	assert_status(out.queryMode(2), bootsvc::status::unsupported);

	assert(out.setMode(1));
	assert(out.currentMode() == 1);
	assert_status(out.setMode(4), bootsvc::status::unsupported);
}))

DEFINE_TEST(text_output_cursor, ([] {
	StubConsole console;
	bootsvc::TextOutput out{console.protocol()};

	assert(out.setCursorPosition(3, 10));
	assert(console.cursorRow == 3);
	assert(console.cursorColumn == 10);
	assert_status(out.setCursorPosition(30, 0), bootsvc::status::unsupported);

	assert(out.clearScreen());
	assert(console.clears == 1);
	assert(console.cursorRow == 0);

	assert(out.setAttribute(0x1F));
	assert(console.attribute == 0x1F);

	assert(out.enableCursor(false));
	assert(!console.mode.cursor_visible);
}))

DEFINE_TEST(text_input, ([] {
	StubKeyboard keyboard;
	bootsvc::TextInput in{keyboard.protocol()};

	keyboard.keys.push_back({0, u'a'});
	keyboard.keys.push_back({0x17, 0});

	auto key = in.readKeystroke();
	assert(key);
	assert(key->scan_code == 0);
	assert(key->unicode_char == u'a');

	key = in.readKeystroke();
	assert(key);
	assert(key->scan_code == 0x17);

	assert_status(in.readKeystroke(), bootsvc::status::notReady);

	keyboard.keys.push_back({0, u'b'});
	assert(in.reset());
	assert(keyboard.resets == 1);
	assert_status(in.readKeystroke(), bootsvc::status::notReady);
}))

DEFINE_TEST(system_table_consoles, ([] {
	StubFirmware fw;
	StubConsole console;
	StubKeyboard keyboard;
	fw.systemTable.con_out = console.protocol();
	fw.systemTable.con_in = keyboard.protocol();

	bootsvc::SystemTable st{&fw.systemTable};
	assert(st.conOut().raw() == console.protocol());
	assert(st.conIn().raw() == keyboard.protocol());
	assert(!st.stdErr());

	assert(st.conOut().outputString(u"x"));
	assert(console.output == u"x");
}))
