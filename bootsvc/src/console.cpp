#include <frg/array.hpp>

#include <bootsvc/console.hpp>

namespace bootsvc {

namespace {

void requireTerminator(std::span<const char16_t> string, const char *function) {
	for (auto c : string) {
		if (!c)
			return;
	}
	panicLogger() << "bootsvc: String passed to " << function << "() is not NUL-terminated"
	              << frg::endlog;
}

} // anonymous namespace

Result<void> TextOutput::reset(bool extendedVerification) const {
	return fromRaw(protocol_->reset(protocol_, extendedVerification)).toResult();
}

Result<void> TextOutput::outputString(std::span<const char16_t> string) const {
	requireTerminator(string, "outputString");
	return fromRaw(protocol_->output_string(protocol_, const_cast<char16_t *>(string.data())))
	    .toResult();
}

Result<void> TextOutput::testString(std::span<const char16_t> string) const {
	requireTerminator(string, "testString");
	return fromRaw(protocol_->test_string(protocol_, const_cast<char16_t *>(string.data())))
	    .toResult();
}

Result<WindowSize> TextOutput::queryMode(size_t mode) const {
	WindowSize size{0, 0};
	return fromRaw(protocol_->query_mode(protocol_, mode, &size.columns, &size.rows))
	    .toResult(size);
}

Result<void> TextOutput::setMode(size_t mode) const {
	return fromRaw(protocol_->set_mode(protocol_, mode)).toResult();
}

Result<void> TextOutput::setAttribute(size_t attribute) const {
	return fromRaw(protocol_->set_attribute(protocol_, attribute)).toResult();
}

Result<void> TextOutput::clearScreen() const {
	return fromRaw(protocol_->clear_screen(protocol_)).toResult();
}

Result<void> TextOutput::setCursorPosition(size_t row, size_t column) const {
	return fromRaw(protocol_->set_cursor_position(protocol_, column, row)).toResult();
}

Result<void> TextOutput::enableCursor(bool visible) const {
	return fromRaw(protocol_->enable_cursor(protocol_, visible)).toResult();
}

Result<void> TextInput::reset(bool extendedVerification) const {
	return fromRaw(protocol_->reset(protocol_, extendedVerification)).toResult();
}

Result<efi_input_key> TextInput::readKeystroke() const {
	efi_input_key key{0, 0};
	return fromRaw(protocol_->read_key_stroke(protocol_, &key)).toResult(key);
}

void ConsoleLogHandler::emit(frg::string_view text) {
	frg::array<char16_t, 128> buffer;
	size_t n = 0;

	for (size_t i = 0; i < text.size(); i++) {
		auto c = text[i];
		if (c == '\n') {
			buffer[n++] = u'\r';
			buffer[n++] = u'\n';
		} else {
			buffer[n++] = static_cast<char16_t>(c);
		}

		// Flush at line ends and at the end of the text, or once "\r\n" plus NUL might not fit.
		if (c == '\n' || i + 1 == text.size() || n + 3 > buffer.size()) {
			buffer[n] = 0;
			auto printed = output_.outputString({buffer.data(), n + 1});
			n = 0;

			// There is nowhere else to report the failure; drop the rest of the text.
			if (!printed)
				return;
		}
	}
}

} // namespace bootsvc
