#pragma once

#include <cstddef>
#include <iterator>
#include <span>

#include <bootsvc/efi.hpp>
#include <bootsvc/pool.hpp>

namespace bootsvc {

// Result of a GetMemoryMap() call.
// mapKey identifies the state of the memory map at the time of the call;
// it becomes stale as soon as firmware changes the map.
struct MemoryMapInfo {
	size_t bufferSize{0};
	size_t mapKey{0};
	size_t descriptorSize{0};
	uint32_t descriptorVersion{0};
};

// Descriptors of a memory map, laid out with the stride reported by firmware.
struct MemoryMapView {
	struct iterator {
		using iterator_category = std::forward_iterator_tag;
		using value_type = efi_memory_descriptor;
		using difference_type = ptrdiff_t;
		using pointer = const efi_memory_descriptor *;
		using reference = const efi_memory_descriptor &;

		iterator() = default;

		iterator(const std::byte *p, size_t stride)
		: p_{p}, stride_{stride} { }

		reference operator*() const { return *reinterpret_cast<pointer>(p_); }
		pointer operator->() const { return reinterpret_cast<pointer>(p_); }

		iterator &operator++() {
			p_ += stride_;
			return *this;
		}

		iterator operator++(int) {
			auto copy = *this;
			++(*this);
			return copy;
		}

		friend bool operator==(const iterator &a, const iterator &b) { return a.p_ == b.p_; }

	private:
		const std::byte *p_{nullptr};
		size_t stride_{0};
	};

	MemoryMapView() = default;

	MemoryMapView(std::span<const std::byte> buffer, const MemoryMapInfo &info)
	: buffer_{buffer.first(info.bufferSize)}, info_{info} { }

	const MemoryMapInfo &info() const { return info_; }
	size_t mapKey() const { return info_.mapKey; }

	size_t size() const {
		if (!info_.descriptorSize)
			return 0;
		return info_.bufferSize / info_.descriptorSize;
	}

	const efi_memory_descriptor &operator[](size_t n) const {
		return *reinterpret_cast<const efi_memory_descriptor *>(
		    buffer_.data() + n * info_.descriptorSize
		);
	}

	iterator begin() const { return {buffer_.data(), info_.descriptorSize}; }
	iterator end() const {
		return {buffer_.data() + size() * info_.descriptorSize, info_.descriptorSize};
	}

private:
	std::span<const std::byte> buffer_;
	MemoryMapInfo info_;
};

// Memory map that owns its pool buffer.
struct MemoryMap {
	PoolBuffer<std::byte> buffer;
	MemoryMapInfo info;

	MemoryMapView view() const { return {buffer.span(), info}; }
	size_t mapKey() const { return info.mapKey; }
};

// Whether firmware may hand out memory of this type once boot services have been exited.
bool isUsableAfterExit(const efi_memory_descriptor &descriptor);

// Physical end address (exclusive) of a descriptor.
efi_physical_addr endAddress(const efi_memory_descriptor &descriptor);

void logMemoryMap(const MemoryMapView &view);

} // namespace bootsvc
