#pragma once

#include <bootsvc/boot-services.hpp>
#include <bootsvc/config-table.hpp>
#include <bootsvc/efi.hpp>

namespace bootsvc {

struct TextOutput;
struct TextInput;

// View of the system table that firmware passes to the image entry point.
struct SystemTable {
	explicit SystemTable(const efi_system_table *table)
	: table_{table} { }

	const efi_system_table *raw() const { return table_; }
	uint32_t revision() const { return table_->hdr.revision; }

	const char16_t *firmwareVendor() const { return table_->firmware_vendor; }
	uint32_t firmwareRevision() const { return table_->firmware_revision; }

	BootServices bootServices() const;
	ConfigTable configTable() const;

	TextOutput conOut() const;
	TextOutput stdErr() const;
	TextInput conIn() const;

private:
	const efi_system_table *table_;
};

} // namespace bootsvc
