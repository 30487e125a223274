#include <bootsvc/block-io.hpp>

namespace bootsvc {

namespace {

bool isBlockMultiple(const efi_block_io_media &media, size_t size) {
	return media.block_size && !(size % media.block_size);
}

} // anonymous namespace

Result<void> BlockDevice::reset(bool extendedVerification) const {
	return fromRaw(protocol_->reset(protocol_.get(), extendedVerification)).toResult();
}

Result<void> BlockDevice::readBlocks(efi_lba lba, std::span<std::byte> buffer) const {
	if (!isBlockMultiple(media(), buffer.size()))
		return std::unexpected{status::badBufferSize};

	return fromRaw(protocol_->read_blocks(
	                   protocol_.get(), media().media_id, lba, buffer.size(), buffer.data()
	               ))
	    .toResult();
}

Result<void> BlockDevice::writeBlocks(efi_lba lba, std::span<const std::byte> buffer) const {
	if (!isBlockMultiple(media(), buffer.size()))
		return std::unexpected{status::badBufferSize};
	if (media().read_only)
		return std::unexpected{status::writeProtected};

	return fromRaw(protocol_->write_blocks(
	                   protocol_.get(),
	                   media().media_id,
	                   lba,
	                   buffer.size(),
	                   const_cast<std::byte *>(buffer.data())
	               ))
	    .toResult();
}

Result<void> BlockDevice::flushBlocks() const {
	return fromRaw(protocol_->flush_blocks(protocol_.get())).toResult();
}

} // namespace bootsvc
