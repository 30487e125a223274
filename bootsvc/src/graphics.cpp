#include <bootsvc/debug.hpp>
#include <bootsvc/graphics.hpp>

namespace bootsvc {

namespace {

template<typename P>
Result<std::span<const uint8_t>> edidFor(BootServices bs, Handle handle) {
	auto edid = bs.protocolForHandle<P>(handle);
	if (!edid)
		return std::unexpected{edid.error()};
	if (!(*edid)->size_of_edid || !(*edid)->edid)
		return std::unexpected{status::notFound};
	return std::span<const uint8_t>{(*edid)->edid, (*edid)->size_of_edid};
}

} // anonymous namespace

Result<efi_graphics_output_mode_information> GraphicsOutput::queryMode(uint32_t mode) const {
	size_t size = 0;
	efi_graphics_output_mode_information *info = nullptr;

	auto s = fromRaw(protocol_->query_mode(protocol_.get(), mode, &size, &info));
	if (!s.isSuccess())
		return std::unexpected{s};
	if (!info)
		return std::unexpected{status::notFound};

	if (size < sizeof(efi_graphics_output_mode_information))
		panicLogger() << "bootsvc: Mode information of size " << size
		              << " is smaller than efi_graphics_output_mode_information" << frg::endlog;

	auto copy = *info;
	BOOTSVC_CHECK(fromRaw(bs_.raw()->free_pool(info)));
	return copy;
}

Result<void> GraphicsOutput::setMode(uint32_t mode) const {
	return fromRaw(protocol_->set_mode(protocol_.get(), mode)).toResult();
}

Result<void> GraphicsOutput::fill(efi_graphics_output_blt_pixel pixel, size_t x, size_t y,
		size_t width, size_t height) const {
	return fromRaw(protocol_->blt(
	                   protocol_.get(), &pixel, EfiBltVideoFill, 0, 0, x, y, width, height, 0
	               ))
	    .toResult();
}

Result<GraphicsOutput> findGraphicsOutput(BootServices bs) {
	auto gop = bs.firstProtocol<efi_graphics_output_protocol>();
	if (!gop)
		return std::unexpected{gop.error()};

	if ((*gop)->mode->info->version != 0)
		infoLogger() << "bootsvc: Unexpected mode information version "
		             << (*gop)->mode->info->version << frg::endlog;

	infoLogger() << "bootsvc: Framebuffer " << (*gop)->mode->info->horizontal_resolution << "x"
	             << (*gop)->mode->info->vertical_resolution << " address=0x"
	             << frg::hex_fmt{(*gop)->mode->framebuffer_base} << frg::endlog;
	return GraphicsOutput{bs, *gop};
}

Result<std::span<const uint8_t>> discoveredEdid(BootServices bs, Handle handle) {
	return edidFor<efi_edid_discovered_protocol>(bs, handle);
}

Result<std::span<const uint8_t>> activeEdid(BootServices bs, Handle handle) {
	return edidFor<efi_edid_active_protocol>(bs, handle);
}

} // namespace bootsvc
