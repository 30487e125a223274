#pragma once

#include <bootsvc/boot-services.hpp>
#include <bootsvc/status.hpp>

namespace bootsvc {

// Asks the RISC-V boot protocol for the hart that runs the boot loader.
Result<size_t> bootHartId(BootServices bs);

} // namespace bootsvc
