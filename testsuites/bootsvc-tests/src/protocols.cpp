#include <assert.h>

#include <bootsvc/boot-services.hpp>
#include <bootsvc/riscv.hpp>

#include "stub-firmware.hpp"
#include "testsuite.hpp"

namespace {

struct DummyProtocol {
	static constexpr efi_guid guid = {0x0a1b2c3d, 0x4e5f, 0x6071, {0x82, 0x93, 0xa4, 0xb5, 0xc6, 0xd7, 0xe8, 0xf9}};

	int value;
};

static_assert(bootsvc::Protocol<DummyProtocol>);
static_assert(bootsvc::Protocol<efi_block_io_protocol>);
static_assert(!bootsvc::Protocol<efi_memory_descriptor>);

efi_status getBootHartId(riscv_efi_boot_protocol *, size_t *boot_hart_id) {
	*boot_hart_id = 3;
	return 0;
}

} // anonymous namespace

DEFINE_TEST(handles_by_protocol, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	DummyProtocol a{1}, b{2};
	auto h1 = fw.newHandle();
	auto h2 = fw.newHandle();
	fw.install(h1, DummyProtocol::guid, &a);
	fw.install(h2, DummyProtocol::guid, &b);
	fw.install(h2, efi_block_io_protocol::guid, nullptr);

	{
		auto handles = bs.handlesByProtocol<DummyProtocol>();
		assert(handles);
		assert(handles->size() == 2);
		assert((*handles)[0] == bootsvc::Handle{h1});
		assert((*handles)[1] == bootsvc::Handle{h2});
		assert(fw.locateHandleCalls == 2);
		assert(fw.livePools() == 1);
	}
	assert(fw.livePools() == 0);
}))

DEFINE_TEST(handles_by_protocol_not_found, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	auto handles = bs.handlesByProtocol<DummyProtocol>();
	assert_status(handles, bootsvc::status::notFound);
	assert(fw.livePools() == 0);

	// Zero matches reported as success are still NOT_FOUND.
	fw.locateHandleStatus = bootsvc::status::success.value();
	fw.protocols.clear();
	handles = bs.handlesByGuid(DummyProtocol::guid);
	assert_status(handles, bootsvc::status::notFound);
}))

DEFINE_TEST(handles_by_protocol_propagates_failure, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	fw.locateHandleStatus = bootsvc::status::deviceError.value();
	auto handles = bs.handlesByProtocol<DummyProtocol>();
	assert_status(handles, bootsvc::status::deviceError);
}))

DEFINE_TEST(protocol_for_handle, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	DummyProtocol a{7};
	auto h = fw.newHandle();
	fw.install(h, DummyProtocol::guid, &a);

	auto proto = bs.protocolForHandle<DummyProtocol>(bootsvc::Handle{h});
	assert(proto);
	assert(proto->get() == &a);
	assert((*proto)->value == 7);
	assert((**proto).value == 7);

	// The handle does not implement the protocol.
	auto missing = bs.protocolForHandle<DummyProtocol>(bootsvc::Handle{fw.newHandle()});
	assert_status(missing, bootsvc::status::unsupported);
}))

DEFINE_TEST(protocol_with_null_interface, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	auto h = fw.newHandle();
	fw.install(h, DummyProtocol::guid, nullptr);

	auto proto = bs.protocolForHandle<DummyProtocol>(bootsvc::Handle{h});
	assert_status(proto, bootsvc::status::notFound);
	auto first = bs.firstProtocol<DummyProtocol>();
	assert_status(first, bootsvc::status::notFound);
}))

DEFINE_TEST(first_protocol_uses_locate_protocol, ([] {
	StubFirmware fw{EFI_1_10_SYSTEM_TABLE_REVISION};
	auto bs = fw.bootServices();

	DummyProtocol a{1}, b{2};
	fw.install(fw.newHandle(), DummyProtocol::guid, &a);
	fw.install(fw.newHandle(), DummyProtocol::guid, &b);

	auto first = bs.firstProtocol<DummyProtocol>();
	assert(first);
	assert(first->get() == &a);
	assert(fw.locateProtocolCalls == 1);
	assert(fw.locateHandleCalls == 0);

	fw.protocols.clear();
	first = bs.firstProtocol<DummyProtocol>();
	assert_status(first, bootsvc::status::notFound);
}))

DEFINE_TEST(first_protocol_fallback, ([] {
	StubFirmware fw{EFI_1_02_SYSTEM_TABLE_REVISION};
	auto bs = fw.bootServices();

	DummyProtocol a{1};
	auto h = fw.newHandle();
	fw.install(h, DummyProtocol::guid, &a);

	auto first = bs.firstProtocol<DummyProtocol>();
	auto direct = bs.protocolForHandle<DummyProtocol>(bootsvc::Handle{h});
	assert(first);
	assert(direct);
	assert(*first == *direct);
	assert(fw.locateProtocolCalls == 0);
	assert(fw.locateHandleCalls == 2);
	assert(fw.livePools() == 0);
}))

DEFINE_TEST(first_protocol_fallback_not_found, ([] {
	StubFirmware fw{EFI_1_02_SYSTEM_TABLE_REVISION};
	auto bs = fw.bootServices();

	auto first = bs.firstProtocol<DummyProtocol>();
	assert_status(first, bootsvc::status::notFound);
	assert(fw.locateProtocolCalls == 0);
}))

DEFINE_TEST(first_protocol_fallback_uses_first_handle_only, ([] {
	StubFirmware fw{EFI_1_02_SYSTEM_TABLE_REVISION};
	auto bs = fw.bootServices();

	DummyProtocol a{1}, b{2};
	fw.install(fw.newHandle(), DummyProtocol::guid, &a, bootsvc::status::deviceError.value());
	fw.install(fw.newHandle(), DummyProtocol::guid, &b);

	auto first = bs.firstProtocol<DummyProtocol>();
	assert_status(first, bootsvc::status::deviceError);
	assert(fw.handleProtocolCalls == 1);
	assert(fw.livePools() == 0);
}))

DEFINE_TEST(riscv_boot_hart_id, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	auto missing = bootsvc::bootHartId(bs);
	assert_status(missing, bootsvc::status::notFound);

	riscv_efi_boot_protocol protocol{};
	protocol.revision = 1;
	protocol.get_boot_hartid = getBootHartId;
	fw.install(fw.newHandle(), riscv_efi_boot_protocol::guid, &protocol);

	auto hart = bootsvc::bootHartId(bs);
	assert(hart);
	assert(*hart == 3);
}))
