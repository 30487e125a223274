#include <assert.h>
#include <string>

#include <bootsvc/config-table.hpp>
#include <bootsvc/system-table.hpp>

#include "stub-firmware.hpp"
#include "testsuite.hpp"

DEFINE_TEST(config_table_find, ([] {
	int acpi, smbios, dtb, duplicate;
	const efi_configuration_table entries[] = {
		{ACPI_TABLE_GUID, &acpi},
		{SMBIOS3_TABLE_GUID, &smbios},
		{EFI_DTB_TABLE_GUID, &dtb},
		{SMBIOS3_TABLE_GUID, &duplicate},
	};
	bootsvc::ConfigTable table{entries};
	assert(table.size() == 4);

	for (size_t k = 0; k < 3; k++) {
		auto found = table.find(entries[k].vendor_guid);
		assert(found);
		assert(*found == entries[k].vendor_table);
	}

	// The first match wins.
	assert(table.find(SMBIOS3_TABLE_GUID) == &smbios);

	assert(!table.find(ACPI_20_TABLE_GUID));
	assert(!bootsvc::ConfigTable{}.find(ACPI_TABLE_GUID));
}))

DEFINE_TEST(config_table_rt_properties, ([] {
	efi_rt_properties_table properties{};
	properties.version = 1;
	properties.length = sizeof(properties);
	properties.runtime_services_supported = EFI_RT_SUPPORTED_GET_TIME | EFI_RT_SUPPORTED_RESET_SYSTEM;

	const efi_configuration_table entries[] = {
		{EFI_RT_PROPERTIES_TABLE_GUID, &properties},
	};
	bootsvc::ConfigTable table{entries};

	auto found = table.findAs<efi_rt_properties_table>(EFI_RT_PROPERTIES_TABLE_GUID);
	assert(found);
	assert((*found)->runtime_services_supported & EFI_RT_SUPPORTED_RESET_SYSTEM);
	assert(!((*found)->runtime_services_supported & EFI_RT_SUPPORTED_SET_VARIABLE));
	assert(!table.findAs<efi_rt_properties_table>(EFI_MEMORY_ATTRIBUTES_TABLE_GUID));
}))

DEFINE_TEST(system_table_config_table, ([] {
	StubFirmware fw;
	bootsvc::SystemTable st{&fw.systemTable};

	assert(st.configTable().size() == 0);

	int dtb;
	efi_configuration_table entries[] = {
		{ACPI_20_TABLE_GUID, nullptr},
		{EFI_DTB_TABLE_GUID, &dtb},
	};
	fw.systemTable.configuration_table = entries;
	fw.systemTable.number_of_table_entries = 2;

	assert(st.configTable().find(EFI_DTB_TABLE_GUID) == &dtb);
	assert(st.bootServices().raw() == &fw.table);
	assert(st.revision() == EFI_2_10_SYSTEM_TABLE_REVISION);
	assert(std::u16string{st.firmwareVendor()} == u"bootsvc stub");

	CaptureLogHandler capture;
	bootsvc::logConfigTable(st.configTable());
	assert(capture.text.find("ACPI 2.0") != std::string::npos);
	assert(capture.text.find("DTB") != std::string::npos);
}))
