#pragma once

#include <span>

#include <bootsvc/debug.hpp>
#include <bootsvc/efi.hpp>
#include <bootsvc/status.hpp>

namespace bootsvc {

struct WindowSize {
	size_t columns;
	size_t rows;
};

// Wrapper around EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL.
struct TextOutput {
	explicit TextOutput(efi_simple_text_output_protocol *protocol)
	: protocol_{protocol} { }

	efi_simple_text_output_protocol *raw() const { return protocol_; }
	explicit operator bool() const { return protocol_; }

	Result<void> reset(bool extendedVerification = false) const;

	// The string must contain a NUL terminator; firmware reads up to it.
	Result<void> outputString(std::span<const char16_t> string) const;
	// Checks whether every character of string can be rendered.
	Result<void> testString(std::span<const char16_t> string) const;

	Result<WindowSize> queryMode(size_t mode) const;
	Result<void> setMode(size_t mode) const;
	// Number of modes and the active mode; -1 if none is active.
	int32_t modeCount() const { return protocol_->mode->max_mode; }
	int32_t currentMode() const { return protocol_->mode->mode; }

	Result<void> setAttribute(size_t attribute) const;
	Result<void> clearScreen() const;
	Result<void> setCursorPosition(size_t row, size_t column) const;
	Result<void> enableCursor(bool visible) const;

private:
	efi_simple_text_output_protocol *protocol_;
};

// Wrapper around EFI_SIMPLE_TEXT_INPUT_PROTOCOL.
struct TextInput {
	explicit TextInput(efi_simple_text_input_protocol *protocol)
	: protocol_{protocol} { }

	efi_simple_text_input_protocol *raw() const { return protocol_; }
	explicit operator bool() const { return protocol_; }

	Result<void> reset(bool extendedVerification = false) const;
	// NOT_READY if no keystroke is pending.
	Result<efi_input_key> readKeystroke() const;
	// Signalled once a keystroke is available, usable with waitForEvent().
	efi_event waitForKey() const { return protocol_->wait_for_key; }

private:
	efi_simple_text_input_protocol *protocol_;
};

// Forwards log output to a firmware text output.
// Must be disabled before boot services are exited.
struct ConsoleLogHandler final : LogHandler {
	explicit ConsoleLogHandler(TextOutput output)
	: output_{output} { }

	void emit(frg::string_view text) override;

private:
	TextOutput output_;
};

} // namespace bootsvc
