#include <bootsvc/debug.hpp>
#include <bootsvc/riscv.hpp>

namespace bootsvc {

Result<size_t> bootHartId(BootServices bs) {
	auto protocol = bs.firstProtocol<riscv_efi_boot_protocol>();
	if (!protocol)
		return std::unexpected{protocol.error()};

	size_t hartId = 0;
	auto s = fromRaw((*protocol)->get_boot_hartid(protocol->get(), &hartId));
	if (!s.isSuccess())
		return std::unexpected{s};

	infoLogger() << "bootsvc: Boot hart ID is " << hartId << frg::endlog;
	return hartId;
}

} // namespace bootsvc
