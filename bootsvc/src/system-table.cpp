#include <bootsvc/console.hpp>
#include <bootsvc/debug.hpp>
#include <bootsvc/system-table.hpp>

namespace bootsvc {

BootServices SystemTable::bootServices() const {
	if (!table_->boot_services)
		panicLogger() << "bootsvc: System table has no boot services" << frg::endlog;
	return BootServices{table_->boot_services};
}

ConfigTable SystemTable::configTable() const {
	if (!table_->configuration_table)
		return {};
	return ConfigTable{{table_->configuration_table, table_->number_of_table_entries}};
}

TextOutput SystemTable::conOut() const { return TextOutput{table_->con_out}; }

TextOutput SystemTable::stdErr() const { return TextOutput{table_->std_err}; }

TextInput SystemTable::conIn() const { return TextInput{table_->con_in}; }

} // namespace bootsvc
