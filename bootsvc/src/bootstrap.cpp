#include <bootsvc/bootstrap.hpp>
#include <bootsvc/debug.hpp>

namespace bootsvc {

namespace {

struct BootstrapState {
	efi_handle image{nullptr};
	const efi_system_table *table{nullptr};
};

constinit BootstrapState state;

void requireBootstrap(const char *accessor) {
	if (!state.table)
		panicLogger() << "bootsvc: " << accessor << "() called before bootstrap()" << frg::endlog;
}

} // anonymous namespace

void bootstrap(efi_handle image, const efi_system_table *table) {
	if (state.table)
		panicLogger() << "bootsvc: bootstrap() called twice" << frg::endlog;
	if (!image)
		panicLogger() << "bootsvc: bootstrap() without an image handle" << frg::endlog;
	if (!table)
		panicLogger() << "bootsvc: bootstrap() without a system table" << frg::endlog;

	state.image = image;
	state.table = table;

	infoLogger() << "bootsvc: Firmware revision 0x" << frg::hex_fmt{table->hdr.revision}
	             << ", " << table->number_of_table_entries << " configuration tables"
	             << frg::endlog;
}

bool isBootstrapped() { return state.table; }

SystemTable systemTable() {
	requireBootstrap("systemTable");
	return SystemTable{state.table};
}

Handle imageHandle() {
	requireBootstrap("imageHandle");
	return Handle{state.image};
}

BootServices bootServices() {
	requireBootstrap("bootServices");
	return systemTable().bootServices();
}

} // namespace bootsvc
