#pragma once

#include <frg/string.hpp>

#include <bootsvc/boot-services.hpp>
#include <bootsvc/protocol.hpp>
#include <bootsvc/status.hpp>
#include <bootsvc/system-table.hpp>

namespace bootsvc {

// Options that are taken from the load options of the image.
//   bootsvc.conout          mirror log output to the firmware console
//   bootsvc.keep-watchdog   do not disable the firmware watchdog
//   bootsvc.map-margin=N    initial over-allocation of the memory map, in descriptors
//   bootsvc.exit-retries=N  attempts to refresh a stale memory map key
struct BootConfig {
	bool useConOut{false};
	bool keepWatchdog{false};
	size_t mapMargin{defaultMapMargin};
	size_t exitRetries{4};
};

BootConfig parseBootConfig(frg::string_view cmdline);

// Reads the load options of the image through EFI_LOADED_IMAGE_PROTOCOL.
Result<BootConfig> loadBootConfig(BootServices bs, Handle image);
// Same as above, for the bootstrapped image.
Result<BootConfig> loadBootConfig();

// Sets up console logging and the watchdog as requested.
Result<void> applyBootConfig(const BootConfig &config, SystemTable st);
Result<void> applyBootConfig(const BootConfig &config);

// Stops logging to the firmware console; required before boot services are exited.
void detachConsoleLog();

// Exits boot services for the bootstrapped image with the configured margin and retries.
Result<MemoryMapView> exitBootServices(const BootConfig &config);

} // namespace bootsvc
