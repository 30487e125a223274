#include <bootsvc/boot-services.hpp>
#include <bootsvc/debug.hpp>

namespace bootsvc {

// ------------------------------------------------------------------------
// Task Priority Services
// ------------------------------------------------------------------------

Tpl BootServices::raiseTpl(Tpl level) const {
	return static_cast<Tpl>(table_->raise_tpl(static_cast<efi_tpl>(level)));
}

void BootServices::restoreTpl(Tpl previous) const {
	table_->restore_tpl(static_cast<efi_tpl>(previous));
}

// ------------------------------------------------------------------------
// Memory Services
// ------------------------------------------------------------------------

Result<efi_physical_addr> BootServices::allocatePages(efi_allocate_type type,
		efi_memory_type memoryType, size_t pages, efi_physical_addr address) const {
	auto memory = address;
	return fromRaw(table_->allocate_pages(type, memoryType, pages, &memory)).toResult(memory);
}

Result<void> BootServices::freePages(efi_physical_addr memory, size_t pages) const {
	return fromRaw(table_->free_pages(memory, pages)).toResult();
}

Result<void *> BootServices::allocatePool(efi_memory_type poolType, size_t size) const {
	void *buffer = nullptr;
	return fromRaw(table_->allocate_pool(poolType, size, &buffer)).toResult(buffer);
}

Result<void> BootServices::freePool(void *buffer) const {
	return fromRaw(table_->free_pool(buffer)).toResult();
}

// ------------------------------------------------------------------------
// Event & Timer Services
// ------------------------------------------------------------------------

Result<Event> BootServices::createEvent(uint32_t type, Tpl notifyTpl,
		efi_event_notify notifyFunction, void *notifyContext) const {
	efi_event event = nullptr;
	return fromRaw(table_->create_event(type, static_cast<efi_tpl>(notifyTpl), notifyFunction,
			notifyContext, &event)).toResult(event);
}

Result<void> BootServices::setTimer(Event event, efi_timer_delay type, uint64_t triggerTime) const {
	return fromRaw(table_->set_timer(event, type, triggerTime)).toResult();
}

Result<size_t> BootServices::waitForEvent(std::span<Event> events) const {
	size_t index = 0;
	return fromRaw(table_->wait_for_event(events.size(), events.data(), &index)).toResult(index);
}

Result<void> BootServices::signalEvent(Event event) const {
	return fromRaw(table_->signal_event(event)).toResult();
}

Result<void> BootServices::closeEvent(Event event) const {
	return fromRaw(table_->close_event(event)).toResult();
}

Result<bool> BootServices::checkEvent(Event event) const {
	auto s = fromRaw(table_->check_event(event));
	if (s == status::notReady)
		return false;
	return s.toResult(true);
}

// ------------------------------------------------------------------------
// Protocol Handler Services
// ------------------------------------------------------------------------

Result<PoolBuffer<Handle>> BootServices::handlesByGuid(const efi_guid &guid) const {
	size_t size = 0;

	auto s = fromRaw(table_->locate_handle(ByProtocol, &guid, nullptr, &size, nullptr));
	if (s.isSuccess() || s == status::notFound)
		return std::unexpected{status::notFound};
	if (s != status::bufferTooSmall)
		return std::unexpected{s};

	auto count = (size + sizeof(Handle) - 1) / sizeof(Handle);
	auto buffer = allocatePoolBuffer<Handle>(EfiLoaderData, count);
	if (!buffer)
		return std::unexpected{buffer.error()};

	size = count * sizeof(Handle);
	s = fromRaw(table_->locate_handle(ByProtocol, &guid, nullptr, &size,
			reinterpret_cast<efi_handle *>(buffer->data())));
	if (!s.isSuccess())
		return std::unexpected{s};

	buffer->truncate(size / sizeof(Handle));
	if (buffer->empty())
		return std::unexpected{status::notFound};
	return std::move(*buffer);
}

Result<void *> BootServices::interfaceForHandle(const efi_guid &guid, Handle handle) const {
	void *interface = nullptr;

	auto s = fromRaw(table_->handle_protocol(handle.raw(), &guid, &interface));
	if (!s.isSuccess())
		return std::unexpected{s};

	// Some firmware reports success without filling in the interface.
	if (!interface)
		return std::unexpected{status::notFound};
	return interface;
}

Result<void *> BootServices::firstInterface(const efi_guid &guid) const {
	if (revision() >= locateProtocolRevision) {
		void *interface = nullptr;

		auto s = fromRaw(table_->locate_protocol(&guid, nullptr, &interface));
		if (!s.isSuccess())
			return std::unexpected{s};
		if (!interface)
			return std::unexpected{status::notFound};
		return interface;
	}

	// Before EFI 1.10, resolve the protocol on the first handle that implements it.
	// Failures on that handle are reported as-is; other handles are not tried.
	auto handles = handlesByGuid(guid);
	if (!handles)
		return std::unexpected{handles.error()};
	return interfaceForHandle(guid, (*handles)[0]);
}

// ------------------------------------------------------------------------
// Image Services
// ------------------------------------------------------------------------

Result<Handle> BootServices::loadImage(bool bootPolicy, Handle parent,
		efi_device_path_protocol *devicePath, std::span<std::byte> source) const {
	efi_handle image = nullptr;

	auto s = fromRaw(table_->load_image(bootPolicy, parent.raw(), devicePath,
			source.empty() ? nullptr : source.data(), source.size(), &image));
	if (!s.isSuccess())
		return std::unexpected{s};
	return Handle{image};
}

Result<void> BootServices::startImage(Handle image) const {
	size_t exitDataSize = 0;
	char16_t *exitData = nullptr;

	auto s = fromRaw(table_->start_image(image.raw(), &exitDataSize, &exitData));
	if (exitData) {
		infoLogger() << "bootsvc: Image returned " << exitDataSize << " bytes of exit data"
		             << frg::endlog;
		BOOTSVC_CHECK(fromRaw(table_->free_pool(exitData)));
	}
	return s.toResult();
}

Result<void> BootServices::unloadImage(Handle image) const {
	return fromRaw(table_->unload_image(image.raw())).toResult();
}

Result<void> BootServices::exit(Handle image, Status exitStatus) const {
	return fromRaw(table_->exit(image.raw(), exitStatus.value(), 0, nullptr)).toResult();
}

Result<void> BootServices::exitBootServices(Handle image, size_t mapKey) const {
	auto s = fromRaw(table_->exit_boot_services(image.raw(), mapKey));
	if (s == status::invalidParameter)
		infoLogger() << "bootsvc: Memory map key 0x" << frg::hex_fmt{mapKey} << " is stale"
		             << frg::endlog;
	return s.toResult();
}

Result<MemoryMapView> BootServices::terminateBootServices(Handle image, size_t margin,
		size_t retries) const {
	auto map = retrieveMemoryMap(EfiLoaderData, margin);
	if (!map)
		return std::unexpected{map.error()};

	// Log handlers may call into boot services, nothing is logged from here on.
	// After a failed ExitBootServices(), only GetMemoryMap() and ExitBootServices() may be called.
	auto info = map->info;
	for (size_t attempt = 0;; attempt++) {
		auto s = fromRaw(table_->exit_boot_services(image.raw(), info.mapKey));
		if (s.isSuccess()) {
			auto size = map->buffer.size();
			auto data = map->buffer.release();
			return MemoryMapView{{data, size}, info};
		}

		if (s != status::invalidParameter || attempt == retries) {
			map->buffer.release();
			return std::unexpected{s};
		}

		auto refilled = fillMemoryMap(map->buffer.span());
		if (!refilled) {
			map->buffer.release();
			return std::unexpected{refilled.error()};
		}
		info = *refilled;
	}
}

// ------------------------------------------------------------------------
// Miscellaneous Services
// ------------------------------------------------------------------------

Result<uint64_t> BootServices::nextMonotonicCount() const {
	uint64_t count = 0;
	return fromRaw(table_->get_next_monotonic_count(&count)).toResult(count);
}

Result<void> BootServices::stall(size_t microseconds) const {
	return fromRaw(table_->stall(microseconds)).toResult();
}

Result<void> BootServices::setWatchdogTimer(size_t timeout, uint64_t watchdogCode) const {
	return fromRaw(table_->set_watchdog_timer(timeout, watchdogCode, 0, nullptr)).toResult();
}

} // namespace bootsvc
