#include <assert.h>

#include <bootsvc/bootstrap.hpp>
#include <bootsvc/config.hpp>

#include "expect-halt.hpp"
#include "stub-firmware.hpp"
#include "testsuite.hpp"

// These tests share the bootstrapped firmware and depend on running in this order.

DEFINE_TEST(bootstrap_accessors_require_bootstrap, ([] {
	assert(!bootsvc::isBootstrapped());

	expectHalt([] { bootsvc::systemTable(); }, "systemTable() called before bootstrap()");
	expectHalt([] { bootsvc::imageHandle(); }, "imageHandle() called before bootstrap()");
	expectHalt([] { bootsvc::bootServices(); }, "bootServices() called before bootstrap()");
}))

DEFINE_TEST(bootstrap_requires_image_and_table, ([] {
	expectHalt([] {
		StubFirmware fw;
		bootsvc::bootstrap(nullptr, &fw.systemTable);
	}, "bootstrap() without an image handle");

	expectHalt([] {
		StubFirmware fw;
		bootsvc::bootstrap(fw.imageHandle, nullptr);
	}, "bootstrap() without a system table");
}))

DEFINE_TEST(bootstrap_accessors, ([] {
	auto &fw = bootstrappedFirmware();

	assert(bootsvc::isBootstrapped());
	assert(bootsvc::systemTable().raw() == &fw.systemTable);
	assert(bootsvc::systemTable().revision() == EFI_2_10_SYSTEM_TABLE_REVISION);
	assert(bootsvc::imageHandle() == bootsvc::Handle{fw.imageHandle});
	assert(bootsvc::bootServices().raw() == &fw.table);
}))

DEFINE_TEST(bootstrap_only_once, ([] {
	expectHalt([] {
		auto &fw = bootstrappedFirmware();
		bootsvc::bootstrap(fw.imageHandle, &fw.systemTable);
	}, "bootstrap() called twice");
}))

DEFINE_TEST(bootstrap_load_boot_config, ([] {
	auto &fw = bootstrappedFirmware();

	static const char16_t options[] = u"bootsvc.map-margin=32 bootsvc.exit-retries=1";
	static efi_loaded_image_protocol image{};
	image.load_options = const_cast<char16_t *>(options);
	image.load_options_size = sizeof(options);
	fw.install(fw.imageHandle, efi_loaded_image_protocol::guid, &image);

	auto config = bootsvc::loadBootConfig();
	assert(config);
	assert(config->mapMargin == 32);
	assert(config->exitRetries == 1);

	assert(bootsvc::applyBootConfig(*config));
	assert(fw.watchdogTimeout == 0);
}))

DEFINE_TEST(bootstrap_exit_boot_services, ([] {
	auto &fw = bootstrappedFirmware();

	bootsvc::BootConfig config;
	config.mapMargin = 32;
	config.exitRetries = 1;

	fw.growOnExit = 1;
	auto view = bootsvc::exitBootServices(config);
	assert(view);
	assert(fw.exited);
	assert(fw.exitBootServicesCalls == 2);
	assert(view->size() == 6);
	assert(view->mapKey() == fw.mapKey);
	assert(fw.poolCallsAfterExit == 0);
}))
