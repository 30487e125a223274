#include <assert.h>

#include <bootsvc/graphics.hpp>

#include "expect-halt.hpp"
#include "stub-firmware.hpp"
#include "testsuite.hpp"

DEFINE_TEST(graphics_output_modes, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	assert_status(bootsvc::findGraphicsOutput(bs), bootsvc::status::notFound);

	StubGraphics gop;
	fw.install(fw.newHandle(), efi_graphics_output_protocol::guid, gop.protocol());

	auto output = bootsvc::findGraphicsOutput(bs);
	assert(output);
	assert(output->modeCount() == 3);
	assert(output->currentMode() == 0);
	assert(output->currentModeInfo().horizontal_resolution == 640);
	assert(output->framebufferBase() == gop.mode.framebuffer_base);
	assert(output->framebufferSize() == gop.mode.framebuffer_size);

	auto info = output->queryMode(2);
	assert(info);
	assert(info->horizontal_resolution == 1024);
	assert(info->vertical_resolution == 768);
	assert(info->pixel_format == PixelBlueGreenRedReserved8BitPerColor);
	// Firmware's copy of the information is freed.
	assert(fw.livePools() == 0);

	assert_status(output->queryMode(7), bootsvc::status::invalidParameter);

	assert(output->setMode(1));
	assert(output->currentMode() == 1);
	assert(output->currentModeInfo().horizontal_resolution == 800);
	assert_status(output->setMode(3), bootsvc::status::unsupported);
}))

DEFINE_TEST(graphics_output_fill, ([] {
	StubFirmware fw;
	StubGraphics gop;
	fw.install(fw.newHandle(), efi_graphics_output_protocol::guid, gop.protocol());

	auto output = bootsvc::findGraphicsOutput(fw.bootServices());
	assert(output);

	efi_graphics_output_blt_pixel red{};
	red.red = 0xFF;
	assert(output->fill(red, 10, 10, 4, 4));
	assert(gop.pixel(10, 10).red == 0xFF);
	assert(gop.pixel(13, 13).red == 0xFF);
	assert(gop.pixel(14, 13).red == 0);
	assert(gop.pixel(9, 9).red == 0);

	assert_status(output->fill(red, 630, 0, 20, 1), bootsvc::status::invalidParameter);
}))

DEFINE_TEST(graphics_output_edid, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	uint8_t block[128] = {0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x00};
	efi_edid_discovered_protocol discovered{sizeof(block), block};
	efi_edid_active_protocol active{0, nullptr};

	auto h = fw.newHandle();
	fw.install(h, efi_edid_discovered_protocol::guid, &discovered);

	auto edid = bootsvc::discoveredEdid(bs, bootsvc::Handle{h});
	assert(edid);
	assert(edid->size() == 128);
	assert(edid->data() == block);
	assert((*edid)[1] == 0xFF);

	assert_status(bootsvc::activeEdid(bs, bootsvc::Handle{h}), bootsvc::status::unsupported);

	fw.install(h, efi_edid_active_protocol::guid, &active);
	assert_status(bootsvc::activeEdid(bs, bootsvc::Handle{h}), bootsvc::status::notFound);
}))

DEFINE_TEST(graphics_output_short_mode_information, ([] {
	expectHalt([] {
		StubFirmware fw;
		StubGraphics gop;
		fw.install(fw.newHandle(), efi_graphics_output_protocol::guid, gop.protocol());
		gop.reportedInfoSize = 8;

		auto output = bootsvc::findGraphicsOutput(fw.bootServices());
		assert(output);
		output->queryMode(1);
	}, "Mode information of size 8 is smaller than efi_graphics_output_mode_information");
}))
