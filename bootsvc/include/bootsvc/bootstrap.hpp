#pragma once

#include <bootsvc/boot-services.hpp>
#include <bootsvc/efi.hpp>
#include <bootsvc/protocol.hpp>
#include <bootsvc/system-table.hpp>

namespace bootsvc {

// Records the image handle and system table that were passed to the entry point.
// Must be called exactly once, before any of the accessors below.
void bootstrap(efi_handle image, const efi_system_table *table);

bool isBootstrapped();

// All of these panic if bootstrap() was not called yet.
SystemTable systemTable();
Handle imageHandle();
BootServices bootServices();

} // namespace bootsvc
