#include <bootsvc/boot-services.hpp>
#include <bootsvc/debug.hpp>
#include <bootsvc/memory-map.hpp>

namespace bootsvc {

bool isUsableAfterExit(const efi_memory_descriptor &descriptor) {
	switch (descriptor.type) {
		case EfiConventionalMemory:
		case EfiBootServicesCode:
		case EfiBootServicesData:
			return true;
		default:
			return false;
	}
}

efi_physical_addr endAddress(const efi_memory_descriptor &descriptor) {
	return descriptor.physical_start + descriptor.number_of_pages * EFI_PAGE_SIZE;
}

void logMemoryMap(const MemoryMapView &view) {
	infoLogger() << "bootsvc: Memory map with " << view.size() << " entries, key 0x"
	             << frg::hex_fmt{view.mapKey()} << frg::endlog;
	for (const auto &entry : view) {
		infoLogger() << "\ttype=" << entry.type << " base=0x" << frg::hex_fmt{entry.physical_start}
		             << " length=0x" << frg::hex_fmt{entry.number_of_pages * EFI_PAGE_SIZE}
		             << " usable=" << (isUsableAfterExit(entry) ? "true" : "false") << frg::endlog;
	}
}

Result<MemoryMapInfo> BootServices::memoryMapInfo() const {
	MemoryMapInfo info;

	auto s = fromRaw(table_->get_memory_map(
	    &info.bufferSize, nullptr, &info.mapKey, &info.descriptorSize, &info.descriptorVersion
	));
	if (s == status::bufferTooSmall)
		return info;

	if (s.isSuccess()) {
		panicLogger() << "bootsvc: GetMemoryMap() succeeded with an empty buffer" << frg::endlog;
		__builtin_unreachable();
	}
	return std::unexpected{s};
}

Result<MemoryMapInfo> BootServices::fillMemoryMap(std::span<std::byte> buffer) const {
	MemoryMapInfo info;
	info.bufferSize = buffer.size();

	auto s = fromRaw(table_->get_memory_map(
	    &info.bufferSize,
	    reinterpret_cast<efi_memory_descriptor *>(buffer.data()),
	    &info.mapKey,
	    &info.descriptorSize,
	    &info.descriptorVersion
	));
	if (!s.isSuccess())
		return std::unexpected{s};

	if (!info.bufferSize)
		panicLogger() << "bootsvc: Firmware returned an empty memory map" << frg::endlog;
	if (info.descriptorSize < sizeof(efi_memory_descriptor))
		panicLogger() << "bootsvc: Memory descriptor size " << info.descriptorSize
		              << " is smaller than efi_memory_descriptor" << frg::endlog;
	if (info.bufferSize > buffer.size())
		panicLogger() << "bootsvc: Firmware wrote 0x" << frg::hex_fmt{info.bufferSize}
		              << " bytes into a buffer of 0x" << frg::hex_fmt{buffer.size()} << frg::endlog;

	return info;
}

Result<MemoryMapInfo> BootServices::memoryMap(std::span<std::byte> buffer) const {
	auto info = fillMemoryMap(buffer);
	if (!info && info.error() == status::bufferTooSmall)
		infoLogger() << "bootsvc: Memory map grew beyond 0x" << frg::hex_fmt{buffer.size()}
		             << " bytes since it was probed" << frg::endlog;
	return info;
}

Result<MemoryMap> BootServices::retrieveMemoryMap(efi_memory_type poolType, size_t margin) const {
	while (margin <= maxMapMargin) {
		auto probed = memoryMapInfo();
		if (!probed)
			return std::unexpected{probed.error()};

		// Allocating the buffer can itself grow the memory map, hence the margin.
		auto size = probed->bufferSize + margin * probed->descriptorSize;
		auto buffer = allocatePoolBuffer<std::byte>(poolType, size);
		if (!buffer)
			return std::unexpected{buffer.error()};

		auto filled = memoryMap(buffer->span());
		if (filled)
			return MemoryMap{std::move(*buffer), *filled};
		if (filled.error() != status::bufferTooSmall)
			return std::unexpected{filled.error()};

		margin = margin ? margin * 2 : 1;
	}

	infoLogger() << "bootsvc: Giving up on retrieving the memory map" << frg::endlog;
	return std::unexpected{status::bufferTooSmall};
}

} // namespace bootsvc
