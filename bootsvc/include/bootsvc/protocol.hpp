#pragma once

#include <concepts>

#include <bootsvc/efi.hpp>

namespace bootsvc {

struct BootServices;

// Opaque reference to a firmware-managed object. Never owned.
struct Handle {
	constexpr explicit Handle(efi_handle raw)
	: raw_{raw} { }

	constexpr efi_handle raw() const { return raw_; }

	friend constexpr bool operator==(Handle, Handle) = default;

private:
	efi_handle raw_;
};

// Firmware fills arrays of efi_handle that are viewed as arrays of Handle.
static_assert(sizeof(Handle) == sizeof(efi_handle));
static_assert(alignof(Handle) == alignof(efi_handle));

using Event = efi_event;

// A firmware interface layout that can be resolved by its GUID.
template<typename P>
concept Protocol = requires {
	{ P::guid } -> std::convertible_to<const efi_guid &>;
};

// Typed pointer to a firmware interface. Does not own the interface.
// Only obtainable through the resolution functions of BootServices.
template<Protocol P>
struct Proto {
	P *get() const { return ptr_; }
	P *operator->() const { return ptr_; }
	P &operator*() const { return *ptr_; }

	friend bool operator==(Proto, Proto) = default;

private:
	friend struct BootServices;

	explicit Proto(P *ptr)
	: ptr_{ptr} { }

	P *ptr_;
};

} // namespace bootsvc
