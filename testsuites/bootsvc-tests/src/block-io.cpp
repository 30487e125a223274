#include <assert.h>
#include <vector>

#include <bootsvc/block-io.hpp>

#include "stub-firmware.hpp"
#include "testsuite.hpp"

DEFINE_TEST(enumerate_block_devices, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	StubDisk disk{512, 64};
	StubDisk legacy{4096, 8, EFI_BLOCK_IO_PROTOCOL_REVISION2};
	StubDisk broken{512, 1};
	auto h1 = fw.newHandle();
	auto h2 = fw.newHandle();
	fw.install(h1, efi_block_io_protocol::guid, disk.protocol());
	fw.install(h2, efi_block_io_protocol::guid, legacy.protocol());
	fw.install(fw.newHandle(), efi_block_io_protocol::guid, broken.protocol(),
			bootsvc::status::deviceError.value());

	std::vector<bootsvc::BlockDevice> devices;
	auto n = bootsvc::enumerateBlockDevices(bs, [&] (bootsvc::BlockDevice device) {
		devices.push_back(device);
	});
	assert(n);
	assert(*n == 2);
	assert(devices.size() == 2);
	assert(devices[0].handle() == bootsvc::Handle{h1});
	assert(devices[0].media().block_size == 512);
	assert(devices[0].media().last_block == 63);
	assert(devices[0].hasRevision3Media());
	assert(devices[1].handle() == bootsvc::Handle{h2});
	assert(devices[1].hasRevision2Media());
	assert(!devices[1].hasRevision3Media());
	assert(fw.livePools() == 0);
}))

DEFINE_TEST(enumerate_block_devices_none, ([] {
	StubFirmware fw;

	size_t calls = 0;
	auto n = bootsvc::enumerateBlockDevices(fw.bootServices(), [&] (bootsvc::BlockDevice) {
		calls++;
	});
	assert_status(n, bootsvc::status::notFound);
	assert(!calls);
}))

DEFINE_TEST(block_device_transfers, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	StubDisk disk{512, 64};
	auto h = fw.newHandle();
	fw.install(h, efi_block_io_protocol::guid, disk.protocol());
	auto protocol = bs.protocolForHandle<efi_block_io_protocol>(bootsvc::Handle{h});
	assert(protocol);
	bootsvc::BlockDevice device{bootsvc::Handle{h}, *protocol};

	std::vector<std::byte> out(1024, std::byte{0x5A});
	assert(device.writeBlocks(3, out));
	assert(disk.data[3 * 512] == std::byte{0x5A});
	assert(disk.data[5 * 512] == std::byte{0});

	std::vector<std::byte> in(1024);
	assert(device.readBlocks(3, in));
	assert(in == out);

	// Partial blocks are rejected before firmware is asked.
	std::vector<std::byte> partial(100);
	assert_status(device.readBlocks(0, partial), bootsvc::status::badBufferSize);

	assert_status(device.readBlocks(63, in), bootsvc::status::invalidParameter);

	assert(device.flushBlocks());
	assert(disk.flushes == 1);
	assert(device.reset());

	disk.media.read_only = true;
	assert_status(device.writeBlocks(0, out), bootsvc::status::writeProtected);

	disk.media.media_id = 2;
	assert(device.media().media_id == 2);
	assert(device.readBlocks(0, in));
}))
