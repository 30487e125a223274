#include <bootsvc/config-table.hpp>
#include <bootsvc/debug.hpp>

namespace bootsvc {

namespace {

struct NamedTable {
	efi_guid guid;
	const char *name;
};

constexpr NamedTable namedTables[] = {
	{ACPI_TABLE_GUID, "ACPI 1.0"},
	{ACPI_20_TABLE_GUID, "ACPI 2.0"},
	{SAL_SYSTEM_TABLE_GUID, "SAL system table"},
	{SMBIOS_TABLE_GUID, "SMBIOS"},
	{SMBIOS3_TABLE_GUID, "SMBIOS3"},
	{MPS_TABLE_GUID, "MPS"},
	{EFI_JSON_CONFIG_DATA_TABLE_GUID, "JSON config data"},
	{EFI_JSON_CAPSULE_DATA_TABLE_GUID, "JSON capsule data"},
	{EFI_JSON_CAPSULE_RESULT_TABLE_GUID, "JSON capsule result"},
	{EFI_DTB_TABLE_GUID, "DTB"},
	{EFI_RT_PROPERTIES_TABLE_GUID, "RT properties"},
	{EFI_MEMORY_ATTRIBUTES_TABLE_GUID, "memory attributes"},
};

} // anonymous namespace

std::optional<void *> ConfigTable::find(const efi_guid &guid) const {
	for (const auto &entry : entries_) {
		if (entry.vendor_guid == guid)
			return entry.vendor_table;
	}
	return std::nullopt;
}

void logConfigTable(const ConfigTable &table) {
	for (const auto &entry : table) {
		for (const auto &named : namedTables) {
			if (entry.vendor_guid != named.guid)
				continue;
			infoLogger() << "bootsvc: Found " << named.name << " table at 0x"
			             << frg::hex_fmt{reinterpret_cast<uintptr_t>(entry.vendor_table)}
			             << frg::endlog;
		}
	}
}

} // namespace bootsvc
