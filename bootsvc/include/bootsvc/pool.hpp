#pragma once

#include <span>
#include <utility>

#include <bootsvc/efi.hpp>
#include <bootsvc/status.hpp>

namespace bootsvc {

// Array of T allocated from the firmware pool.
// The allocation is returned to the pool on destruction unless it was released.
template<typename T>
struct PoolBuffer {
	friend void swap(PoolBuffer &a, PoolBuffer &b) {
		using std::swap;
		swap(a.bs_, b.bs_);
		swap(a.data_, b.data_);
		swap(a.size_, b.size_);
	}

	PoolBuffer() = default;

	PoolBuffer(const efi_boot_services *bs, T *data, size_t size)
	: bs_{bs}, data_{data}, size_{size} { }

	PoolBuffer(const PoolBuffer &) = delete;

	PoolBuffer(PoolBuffer &&other)
	: PoolBuffer{} {
		swap(*this, other);
	}

	~PoolBuffer() {
		if (data_)
			BOOTSVC_CHECK(fromRaw(bs_->free_pool(data_)));
	}

	PoolBuffer &operator=(PoolBuffer other) {
		swap(*this, other);
		return *this;
	}

	T *data() const { return data_; }
	size_t size() const { return size_; }
	bool empty() const { return !size_; }

	T &operator[](size_t n) const { return data_[n]; }

	T *begin() const { return data_; }
	T *end() const { return data_ + size_; }

	std::span<T> span() const { return {data_, size_}; }

	// Firmware may fill less than was allocated.
	void truncate(size_t size) {
		if (size < size_)
			size_ = size;
	}

	// Gives up ownership. Required once boot services have been exited.
	T *release() {
		size_ = 0;
		return std::exchange(data_, nullptr);
	}

private:
	const efi_boot_services *bs_{nullptr};
	T *data_{nullptr};
	size_t size_{0};
};

} // namespace bootsvc
