#include <frg/array.hpp>
#include <frg/cmdline.hpp>
#include <frg/manual_box.hpp>

#include <bootsvc/bootstrap.hpp>
#include <bootsvc/config.hpp>
#include <bootsvc/console.hpp>
#include <bootsvc/debug.hpp>

namespace bootsvc {

namespace {

frg::manual_box<ConsoleLogHandler> consoleLog;

void parseNumber(const char *option, frg::string_view value, size_t &out) {
	if (!value.size())
		return;

	auto n = value.to_number<size_t>();
	if (!n) {
		infoLogger() << "bootsvc: Ignoring invalid value '" << value << "' for " << option
		             << frg::endlog;
		return;
	}
	out = n.value();
}

} // anonymous namespace

BootConfig parseBootConfig(frg::string_view cmdline) {
	BootConfig config;
	frg::string_view mapMargin;
	frg::string_view exitRetries;

	frg::array args = {
	    frg::option{"bootsvc.conout", frg::store_true(config.useConOut)},
	    frg::option{"bootsvc.keep-watchdog", frg::store_true(config.keepWatchdog)},
	    frg::option{"bootsvc.map-margin", frg::as_string_view(mapMargin)},
	    frg::option{"bootsvc.exit-retries", frg::as_string_view(exitRetries)},
	};
	frg::parse_arguments(cmdline, args);

	parseNumber("bootsvc.map-margin", mapMargin, config.mapMargin);
	parseNumber("bootsvc.exit-retries", exitRetries, config.exitRetries);
	return config;
}

Result<BootConfig> loadBootConfig(BootServices bs, Handle image) {
	auto loadedImage = bs.protocolForHandle<efi_loaded_image_protocol>(image);
	if (!loadedImage)
		return std::unexpected{loadedImage.error()};

	// Convert the command line to ASCII.
	auto length = (*loadedImage)->load_options_size / sizeof(char16_t);
	auto ascii = bs.allocatePoolBuffer<char>(EfiLoaderData, length + 1);
	if (!ascii)
		return std::unexpected{ascii.error()};

	auto options = static_cast<const char16_t *>((*loadedImage)->load_options);
	size_t i = 0;
	for (; i < length; i++) {
		auto c = options[i];
		// Only printable ASCII characters are used, the first other character ends the line.
		if (c < 0x20 || c > 0x7E)
			break;
		(*ascii)[i] = static_cast<char>(c);
	}
	(*ascii)[i] = '\0';

	frg::string_view cmdline{ascii->data(), i};
	infoLogger() << "bootsvc: Command line '" << cmdline << "'" << frg::endlog;
	return parseBootConfig(cmdline);
}

Result<BootConfig> loadBootConfig() { return loadBootConfig(bootServices(), imageHandle()); }

Result<void> applyBootConfig(const BootConfig &config, SystemTable st) {
	if (config.useConOut && !consoleLog.valid()) {
		auto conOut = st.conOut();
		if (!conOut)
			return std::unexpected{status::unsupported};
		consoleLog.initialize(conOut);
		enableLogHandler(consoleLog.get());
	}

	if (!config.keepWatchdog) {
		auto disabled = st.bootServices().setWatchdogTimer(0);
		if (!disabled)
			return disabled;
	}

	infoLogger() << "bootsvc: Map margin " << config.mapMargin << ", " << config.exitRetries
	             << " exit retries" << frg::endlog;
	return {};
}

Result<void> applyBootConfig(const BootConfig &config) {
	return applyBootConfig(config, systemTable());
}

void detachConsoleLog() {
	if (!consoleLog.valid())
		return;
	disableLogHandler(consoleLog.get());
	consoleLog.destruct();
}

Result<MemoryMapView> exitBootServices(const BootConfig &config) {
	detachConsoleLog();
	return bootServices().terminateBootServices(imageHandle(), config.mapMargin, config.exitRetries);
}

} // namespace bootsvc
