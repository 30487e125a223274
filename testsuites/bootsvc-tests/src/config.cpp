#include <assert.h>
#include <iterator>
#include <string>

#include <bootsvc/config.hpp>

#include "stub-firmware.hpp"
#include "testsuite.hpp"

namespace {

efi_loaded_image_protocol loadedImageWith(const char16_t *options, size_t length) {
	efi_loaded_image_protocol image{};
	image.revision = 0x1000;
	image.load_options = const_cast<char16_t *>(options);
	image.load_options_size = length * sizeof(char16_t);
	return image;
}

} // anonymous namespace

DEFINE_TEST(boot_config_defaults, ([] {
	auto config = bootsvc::parseBootConfig("");
	assert(!config.useConOut);
	assert(!config.keepWatchdog);
	assert(config.mapMargin == bootsvc::defaultMapMargin);
	assert(config.exitRetries == 4);
}))

DEFINE_TEST(boot_config_flags, ([] {
	auto config = bootsvc::parseBootConfig("quiet bootsvc.conout bootsvc.keep-watchdog");
	assert(config.useConOut);
	assert(config.keepWatchdog);
	assert(config.mapMargin == bootsvc::defaultMapMargin);
}))

DEFINE_TEST(boot_config_numbers, ([] {
	auto config = bootsvc::parseBootConfig("bootsvc.map-margin=16 bootsvc.exit-retries=0");
	assert(config.mapMargin == 16);
	assert(config.exitRetries == 0);
	assert(!config.useConOut);
}))

DEFINE_TEST(boot_config_invalid_number, ([] {
	CaptureLogHandler capture;
	auto config = bootsvc::parseBootConfig("bootsvc.map-margin=lots bootsvc.exit-retries=2");
	assert(config.mapMargin == bootsvc::defaultMapMargin);
	assert(config.exitRetries == 2);
	assert(capture.text.find("Ignoring invalid value 'lots' for bootsvc.map-margin")
	       != std::string::npos);
}))

DEFINE_TEST(boot_config_from_load_options, ([] {
	StubFirmware fw;

	const char16_t options[] = u"loader.efi bootsvc.conout bootsvc.exit-retries=7";
	auto image = loadedImageWith(options, std::size(options));
	fw.install(fw.imageHandle, efi_loaded_image_protocol::guid, &image);

	CaptureLogHandler capture;
	auto config = bootsvc::loadBootConfig(fw.bootServices(), bootsvc::Handle{fw.imageHandle});
	assert(config);
	assert(config->useConOut);
	assert(!config->keepWatchdog);
	assert(config->exitRetries == 7);
	assert(capture.text.find("Command line 'loader.efi bootsvc.conout bootsvc.exit-retries=7'")
	       != std::string::npos);
	// The ASCII copy was returned to the pool.
	assert(fw.livePools() == 0);
}))

DEFINE_TEST(boot_config_stops_at_unprintable, ([] {
	StubFirmware fw;

	const char16_t options[] = u"bootsvc.keep-watchdogébootsvc.conout";
	auto image = loadedImageWith(options, std::size(options) - 1);
	fw.install(fw.imageHandle, efi_loaded_image_protocol::guid, &image);

	auto config = bootsvc::loadBootConfig(fw.bootServices(), bootsvc::Handle{fw.imageHandle});
	assert(config);
	assert(config->keepWatchdog);
	assert(!config->useConOut);
}))

DEFINE_TEST(boot_config_without_loaded_image, ([] {
	StubFirmware fw;

	auto config = bootsvc::loadBootConfig(fw.bootServices(), bootsvc::Handle{fw.imageHandle});
	assert_status(config, bootsvc::status::unsupported);
}))

DEFINE_TEST(apply_boot_config_watchdog, ([] {
	StubFirmware fw;
	bootsvc::SystemTable st{&fw.systemTable};

	bootsvc::BootConfig keep;
	keep.keepWatchdog = true;
	assert(bootsvc::applyBootConfig(keep, st));
	assert(fw.watchdogTimeout == 300);

	assert(bootsvc::applyBootConfig(bootsvc::BootConfig{}, st));
	assert(fw.watchdogTimeout == 0);
}))

DEFINE_TEST(apply_boot_config_console, ([] {
	StubFirmware fw;
	StubConsole console;
	bootsvc::SystemTable st{&fw.systemTable};

	bootsvc::BootConfig config;
	config.useConOut = true;

	// There is no console to log to.
	assert_status(bootsvc::applyBootConfig(config, st), bootsvc::status::unsupported);

	fw.systemTable.con_out = console.protocol();
	assert(bootsvc::applyBootConfig(config, st));

	bootsvc::infoLogger() << "bootsvc-tests: on the console" << frg::endlog;
	assert(console.output.find(u"bootsvc-tests: on the console\r\n") != std::u16string::npos);

	bootsvc::detachConsoleLog();
	auto before = console.output;
	bootsvc::infoLogger() << "bootsvc-tests: not on the console" << frg::endlog;
	assert(console.output == before);
}))
