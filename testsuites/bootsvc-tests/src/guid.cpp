#include <assert.h>
#include <stdint.h>

#include <bootsvc/efi.hpp>
#include <bootsvc/protocol.hpp>

#include "testsuite.hpp"

static_assert(sizeof(efi_guid) == 16);
static_assert(alignof(efi_guid) == 8);

DEFINE_TEST(guid_equality, ([] {
	efi_guid a = ACPI_20_TABLE_GUID;
	efi_guid b = a;

	assert(a == a);
	assert(a == b);
	assert(b == a);
	assert(ACPI_TABLE_GUID != ACPI_20_TABLE_GUID);
	assert(efi_block_io_protocol::guid != efi_simple_text_output_protocol::guid);
}))

DEFINE_TEST(guid_single_byte_difference, ([] {
	const efi_guid a = EFI_DTB_TABLE_GUID;

	for (size_t i = 0; i < sizeof(efi_guid); i++) {
		efi_guid c = a;
		reinterpret_cast<uint8_t *>(&c)[i] ^= 0x01;
		assert(!(a == c));
		assert(!(c == a));
	}
}))

DEFINE_TEST(handle_equality, ([] {
	int x, y;
	bootsvc::Handle a{&x};
	bootsvc::Handle b{&x};
	bootsvc::Handle c{&y};

	assert(a == b);
	assert(a != c);
	assert(a.raw() == &x);
}))
