#pragma once

#include <span>

#include <bootsvc/efi.hpp>
#include <bootsvc/memory-map.hpp>
#include <bootsvc/pool.hpp>
#include <bootsvc/protocol.hpp>
#include <bootsvc/status.hpp>

namespace bootsvc {

// Task priority levels. Raise and restore calls must nest like a stack.
enum class Tpl : efi_tpl {
	application = TPL_APPLICATION,
	callback = TPL_CALLBACK,
	notify = TPL_NOTIFY,
	highLevel = TPL_HIGH_LEVEL,
};

// LocateProtocol() is only available since EFI 1.10.
constexpr uint32_t locateProtocolRevision = EFI_1_10_SYSTEM_TABLE_REVISION;

// Number of descriptors by which the memory map buffer is over-allocated at first.
constexpr size_t defaultMapMargin = 8;
// Needing more than that would be quite unreasonable.
constexpr size_t maxMapMargin = 0x800;

// View of the boot services table.
// Every call converts the firmware status into a Result.
struct BootServices {
	explicit BootServices(const efi_boot_services *table)
	: table_{table} { }

	const efi_boot_services *raw() const { return table_; }
	uint32_t revision() const { return table_->hdr.revision; }

	// Task Priority Services

	Tpl raiseTpl(Tpl level) const;
	void restoreTpl(Tpl previous) const;

	// Memory Services

	// address is only used for AllocateMaxAddress and AllocateAddress.
	Result<efi_physical_addr> allocatePages(efi_allocate_type type, efi_memory_type memoryType,
			size_t pages, efi_physical_addr address = 0) const;
	Result<void> freePages(efi_physical_addr memory, size_t pages) const;
	Result<void *> allocatePool(efi_memory_type poolType, size_t size) const;
	Result<void> freePool(void *buffer) const;

	template<typename T>
	Result<PoolBuffer<T>> allocatePoolBuffer(efi_memory_type poolType, size_t count) const {
		auto memory = allocatePool(poolType, count * sizeof(T));
		if (!memory)
			return std::unexpected{memory.error()};
		return PoolBuffer<T>{table_, static_cast<T *>(*memory), count};
	}

	// Asks firmware for the size of the memory map. Succeeds iff firmware reports BUFFER_TOO_SMALL.
	Result<MemoryMapInfo> memoryMapInfo() const;
	// Fills buffer with the memory map. BUFFER_TOO_SMALL means that the map grew
	// since memoryMapInfo() was called; callers need to probe again.
	Result<MemoryMapInfo> memoryMap(std::span<std::byte> buffer) const;
	// Probes, allocates and fills until the map fits into the allocation.
	Result<MemoryMap> retrieveMemoryMap(efi_memory_type poolType = EfiLoaderData,
			size_t margin = defaultMapMargin) const;

	// Event & Timer Services

	Result<Event> createEvent(uint32_t type, Tpl notifyTpl,
			efi_event_notify notifyFunction = nullptr, void *notifyContext = nullptr) const;
	Result<void> setTimer(Event event, efi_timer_delay type, uint64_t triggerTime) const;
	// Blocks until one of the events is signalled. Returns its index.
	Result<size_t> waitForEvent(std::span<Event> events) const;
	Result<void> signalEvent(Event event) const;
	Result<void> closeEvent(Event event) const;
	// NOT_READY is not an error here: it means that the event is not signalled.
	Result<bool> checkEvent(Event event) const;

	// Protocol Handler Services

	Result<PoolBuffer<Handle>> handlesByGuid(const efi_guid &guid) const;
	Result<void *> interfaceForHandle(const efi_guid &guid, Handle handle) const;
	Result<void *> firstInterface(const efi_guid &guid) const;

	template<Protocol P>
	Result<PoolBuffer<Handle>> handlesByProtocol() const {
		return handlesByGuid(P::guid);
	}

	template<Protocol P>
	Result<Proto<P>> protocolForHandle(Handle handle) const {
		auto interface = interfaceForHandle(P::guid, handle);
		if (!interface)
			return std::unexpected{interface.error()};
		return Proto<P>{static_cast<P *>(*interface)};
	}

	template<Protocol P>
	Result<Proto<P>> firstProtocol() const {
		auto interface = firstInterface(P::guid);
		if (!interface)
			return std::unexpected{interface.error()};
		return Proto<P>{static_cast<P *>(*interface)};
	}

	// Image Services

	Result<Handle> loadImage(bool bootPolicy, Handle parent, efi_device_path_protocol *devicePath,
			std::span<std::byte> source) const;
	Result<void> startImage(Handle image) const;
	Result<void> unloadImage(Handle image) const;
	Result<void> exit(Handle image, Status exitStatus) const;
	// Firmware reports a stale mapKey as INVALID_PARAMETER.
	Result<void> exitBootServices(Handle image, size_t mapKey) const;
	// Retrieves the memory map and exits boot services with its key.
	// Nothing is logged once the first attempt has been made.
	// The returned map lives in memory that is no longer owned by the firmware pool.
	Result<MemoryMapView> terminateBootServices(Handle image, size_t margin = defaultMapMargin,
			size_t retries = 4) const;

	// Miscellaneous Services

	Result<uint64_t> nextMonotonicCount() const;
	Result<void> stall(size_t microseconds) const;
	// A timeout of zero disables the watchdog.
	Result<void> setWatchdogTimer(size_t timeout, uint64_t watchdogCode = 0) const;

private:
	// memoryMap() without logging, for use after a failed ExitBootServices().
	Result<MemoryMapInfo> fillMemoryMap(std::span<std::byte> buffer) const;

	const efi_boot_services *table_;
};

// Raises the task priority level for the lifetime of the guard.
struct TplGuard {
	TplGuard(BootServices bs, Tpl level)
	: bs_{bs}, previous_{bs.raiseTpl(level)} { }

	TplGuard(const TplGuard &) = delete;

	~TplGuard() {
		bs_.restoreTpl(previous_);
	}

	TplGuard &operator=(const TplGuard &) = delete;

	Tpl previous() const { return previous_; }

private:
	BootServices bs_;
	Tpl previous_;
};

} // namespace bootsvc
