#pragma once

#include <span>

#include <bootsvc/boot-services.hpp>
#include <bootsvc/debug.hpp>
#include <bootsvc/efi.hpp>
#include <bootsvc/protocol.hpp>
#include <bootsvc/status.hpp>

namespace bootsvc {

// Wrapper around EFI_BLOCK_IO_PROTOCOL.
// Transfers always address the media that is currently present.
struct BlockDevice {
	BlockDevice(Handle handle, Proto<efi_block_io_protocol> protocol)
	: handle_{handle}, protocol_{protocol} { }

	Handle handle() const { return handle_; }
	Proto<efi_block_io_protocol> protocol() const { return protocol_; }

	const efi_block_io_media &media() const { return *protocol_->media; }
	uint64_t revision() const { return protocol_->revision; }

	// Fields that were added in later revisions of the protocol.
	bool hasRevision2Media() const { return revision() >= EFI_BLOCK_IO_PROTOCOL_REVISION2; }
	bool hasRevision3Media() const { return revision() >= EFI_BLOCK_IO_PROTOCOL_REVISION3; }

	Result<void> reset(bool extendedVerification = false) const;
	// buffer.size() must be a multiple of the block size.
	Result<void> readBlocks(efi_lba lba, std::span<std::byte> buffer) const;
	Result<void> writeBlocks(efi_lba lba, std::span<const std::byte> buffer) const;
	Result<void> flushBlocks() const;

private:
	Handle handle_;
	Proto<efi_block_io_protocol> protocol_;
};

// Calls fn(BlockDevice) for every handle that implements EFI_BLOCK_IO_PROTOCOL.
// Handles whose protocol cannot be resolved are skipped.
template<typename F>
Result<size_t> enumerateBlockDevices(BootServices bs, F fn) {
	auto handles = bs.handlesByProtocol<efi_block_io_protocol>();
	if (!handles)
		return std::unexpected{handles.error()};

	size_t n = 0;
	for (auto handle : *handles) {
		auto protocol = bs.protocolForHandle<efi_block_io_protocol>(handle);
		if (!protocol) {
			infoLogger() << "bootsvc: Skipping block device 0x"
			             << frg::hex_fmt{reinterpret_cast<uintptr_t>(handle.raw())}
			             << ", status 0x" << frg::hex_fmt{protocol.error().value()} << frg::endlog;
			continue;
		}
		fn(BlockDevice{handle, *protocol});
		n++;
	}
	return n;
}

} // namespace bootsvc
