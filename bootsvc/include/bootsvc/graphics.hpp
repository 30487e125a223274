#pragma once

#include <span>

#include <bootsvc/boot-services.hpp>
#include <bootsvc/efi.hpp>
#include <bootsvc/protocol.hpp>
#include <bootsvc/status.hpp>

namespace bootsvc {

// Wrapper around EFI_GRAPHICS_OUTPUT_PROTOCOL.
struct GraphicsOutput {
	GraphicsOutput(BootServices bs, Proto<efi_graphics_output_protocol> protocol)
	: bs_{bs}, protocol_{protocol} { }

	Proto<efi_graphics_output_protocol> protocol() const { return protocol_; }

	uint32_t modeCount() const { return protocol_->mode->max_mode; }
	uint32_t currentMode() const { return protocol_->mode->mode; }
	const efi_graphics_output_mode_information &currentModeInfo() const {
		return *protocol_->mode->info;
	}

	efi_physical_addr framebufferBase() const { return protocol_->mode->framebuffer_base; }
	size_t framebufferSize() const { return protocol_->mode->framebuffer_size; }

	// Returns a copy of the information; firmware's allocation is freed.
	Result<efi_graphics_output_mode_information> queryMode(uint32_t mode) const;
	// Changes the mode and clears the screen to black.
	Result<void> setMode(uint32_t mode) const;

	// Fills a rectangle of the screen with a single pixel value.
	Result<void> fill(efi_graphics_output_blt_pixel pixel, size_t x, size_t y, size_t width,
			size_t height) const;

private:
	BootServices bs_;
	Proto<efi_graphics_output_protocol> protocol_;
};

// Resolves the first graphics output of the system.
Result<GraphicsOutput> findGraphicsOutput(BootServices bs);

// EDID blocks that are attached to the handle of a graphics output.
// NOT_FOUND if the handle carries no EDID or the EDID is empty.
Result<std::span<const uint8_t>> discoveredEdid(BootServices bs, Handle handle);
Result<std::span<const uint8_t>> activeEdid(BootServices bs, Handle handle);

} // namespace bootsvc
