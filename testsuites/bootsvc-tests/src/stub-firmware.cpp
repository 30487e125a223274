#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iterator>
#include <utility>

#include <bootsvc/bootstrap.hpp>
#include <bootsvc/status.hpp>

#include "stub-firmware.hpp"

namespace {

StubFirmware *currentFirmware = nullptr;

constexpr efi_status raw(bootsvc::Status s) { return s.value(); }

StubFirmware::Event &eventOf(efi_event event) {
	return *static_cast<StubFirmware::Event *>(event);
}

bool touchesPoolAfterExit(StubFirmware &fw) {
	if (!fw.exited && !fw.exitFailed)
		return false;
	fw.poolCallsAfterExit++;
	return true;
}

// ------------------------------------------------------------------------
// Boot services
// ------------------------------------------------------------------------

efi_tpl raiseTpl(efi_tpl newTpl) {
	auto &fw = StubFirmware::current();
	return std::exchange(fw.tpl, newTpl);
}

void restoreTpl(efi_tpl oldTpl) { StubFirmware::current().tpl = oldTpl; }

efi_status allocatePages(efi_allocate_type type, efi_memory_type, size_t pages,
		efi_physical_addr *memory) {
	auto &fw = StubFirmware::current();
	if (!pages || type >= MaxAllocateType)
		return raw(bootsvc::status::invalidParameter);
	if (type == AllocateAddress)
		return raw(bootsvc::status::notFound);

	auto p = std::aligned_alloc(EFI_PAGE_SIZE, pages * EFI_PAGE_SIZE);
	if (!p)
		return raw(bootsvc::status::outOfResources);
	*memory = reinterpret_cast<efi_physical_addr>(p);
	fw.pages[*memory] = pages;
	return 0;
}

efi_status freePages(efi_physical_addr memory, size_t pages) {
	auto &fw = StubFirmware::current();
	auto it = fw.pages.find(memory);
	if (it == fw.pages.end() || it->second != pages)
		return raw(bootsvc::status::notFound);
	std::free(reinterpret_cast<void *>(memory));
	fw.pages.erase(it);
	return 0;
}

efi_status getMemoryMap(size_t *size, efi_memory_descriptor *map, size_t *key,
		size_t *descriptorSize, uint32_t *descriptorVersion) {
	auto &fw = StubFirmware::current();
	fw.getMemoryMapCalls++;

	if (map) {
		if (fw.growBeforeFill)
			fw.growMap(std::exchange(fw.growBeforeFill, 0));
		if (fw.growOnEveryFill)
			fw.growMap(fw.growOnEveryFill);
	}

	if (fw.emptyMap) {
		*size = 0;
		*key = fw.mapKey;
		*descriptorSize = fw.descriptorSize;
		*descriptorVersion = EFI_MEMORY_DESCRIPTOR_VERSION;
		return 0;
	}

	auto required = fw.descriptorCount * fw.descriptorSize;
	*descriptorSize = fw.descriptorSize;
	*descriptorVersion = EFI_MEMORY_DESCRIPTOR_VERSION;
	if (!map || *size < required) {
		*size = required;
		return raw(bootsvc::status::bufferTooSmall);
	}

	auto out = reinterpret_cast<std::byte *>(map);
	memset(out, 0xAA, required);
	for (size_t i = 0; i < fw.descriptorCount; i++) {
		efi_memory_descriptor descriptor{};
		descriptor.type = fw.descriptorType(i);
		descriptor.physical_start = 0x100000 + i * 0x10000;
		descriptor.number_of_pages = 16;
		descriptor.attribute = EFI_MEMORY_WB;
		memcpy(out + i * fw.descriptorSize, &descriptor,
				std::min(sizeof(descriptor), fw.descriptorSize));
	}
	*size = required;
	*key = fw.mapKey;
	return 0;
}

efi_status allocatePool(efi_memory_type, size_t size, void **buffer) {
	auto &fw = StubFirmware::current();
	if (touchesPoolAfterExit(fw))
		return raw(bootsvc::status::unsupported);
	if (fw.allocatePoolStatus)
		return fw.allocatePoolStatus;

	auto p = std::malloc(size ? size : 1);
	if (!p)
		return raw(bootsvc::status::outOfResources);
	fw.pools[p] = size;
	*buffer = p;
	return 0;
}

efi_status freePool(void *buffer) {
	auto &fw = StubFirmware::current();
	if (touchesPoolAfterExit(fw))
		return raw(bootsvc::status::unsupported);

	auto it = fw.pools.find(buffer);
	if (it == fw.pools.end())
		return raw(bootsvc::status::invalidParameter);
	std::free(buffer);
	fw.pools.erase(it);
	return 0;
}

efi_status createEvent(uint32_t type, efi_tpl notifyTpl, efi_event_notify notifyFunction,
		void *notifyContext, efi_event *event) {
	auto &fw = StubFirmware::current();
	if ((type & EVT_NOTIFY_SIGNAL) && !notifyFunction)
		return raw(bootsvc::status::invalidParameter);

	auto &created = fw.events.emplace_back();
	created.type = type;
	created.tpl = notifyTpl;
	created.notify = notifyFunction;
	created.context = notifyContext;
	*event = &created;
	return 0;
}

efi_status setTimer(efi_event event, efi_timer_delay type, uint64_t triggerTime) {
	auto &ev = eventOf(event);
	if (!(ev.type & EVT_TIMER))
		return raw(bootsvc::status::invalidParameter);

	ev.timer = type;
	ev.trigger = triggerTime;
	if (type == TimerRelative && !triggerTime)
		ev.signalled = true;
	return 0;
}

efi_status waitForEvent(size_t numberOfEvents, efi_event *event, size_t *index) {
	if (!numberOfEvents)
		return raw(bootsvc::status::invalidParameter);

	for (size_t i = 0; i < numberOfEvents; i++) {
		auto &ev = eventOf(event[i]);
		if (ev.type & EVT_NOTIFY_SIGNAL)
			return raw(bootsvc::status::invalidParameter);
		if (ev.signalled) {
			ev.signalled = false;
			*index = i;
			return 0;
		}
	}

	// Time passes until the first armed timer expires.
	for (size_t i = 0; i < numberOfEvents; i++) {
		if (eventOf(event[i]).timer != TimerCancel) {
			*index = i;
			return 0;
		}
	}
	return raw(bootsvc::status::notReady);
}

efi_status signalEvent(efi_event event) {
	auto &ev = eventOf(event);
	ev.signalled = true;
	if ((ev.type & EVT_NOTIFY_SIGNAL) && ev.notify)
		ev.notify(event, ev.context);
	return 0;
}

efi_status closeEvent(efi_event event) {
	eventOf(event).closed = true;
	return 0;
}

efi_status checkEvent(efi_event event) {
	auto &ev = eventOf(event);
	if (ev.type & EVT_NOTIFY_SIGNAL)
		return raw(bootsvc::status::invalidParameter);
	if (!ev.signalled)
		return raw(bootsvc::status::notReady);
	ev.signalled = false;
	return 0;
}

efi_status handleProtocol(efi_handle handle, const efi_guid *protocol, void **interface) {
	auto &fw = StubFirmware::current();
	fw.handleProtocolCalls++;

	for (const auto &installed : fw.protocols) {
		if (installed.handle == handle && installed.guid == *protocol) {
			*interface = installed.interface;
			return installed.status;
		}
	}
	*interface = nullptr;
	return raw(bootsvc::status::unsupported);
}

efi_status locateHandle(efi_locate_search_type searchType, const efi_guid *protocol, void *,
		size_t *bufferSize, efi_handle *buffer) {
	auto &fw = StubFirmware::current();
	fw.locateHandleCalls++;

	if (fw.locateHandleStatus)
		return *fw.locateHandleStatus;
	if (searchType != ByProtocol)
		return raw(bootsvc::status::invalidParameter);

	std::vector<efi_handle> found;
	for (const auto &installed : fw.protocols) {
		if (!(installed.guid == *protocol))
			continue;
		if (std::find(found.begin(), found.end(), installed.handle) == found.end())
			found.push_back(installed.handle);
	}
	if (found.empty())
		return raw(bootsvc::status::notFound);

	auto required = found.size() * sizeof(efi_handle);
	if (!buffer || *bufferSize < required) {
		*bufferSize = required;
		return raw(bootsvc::status::bufferTooSmall);
	}
	memcpy(buffer, found.data(), required);
	*bufferSize = required;
	return 0;
}

efi_status loadImage(bool, efi_handle, efi_device_path_protocol *devicePath, void *sourceBuffer,
		size_t sourceSize, efi_handle *imageHandle) {
	auto &fw = StubFirmware::current();
	if (!sourceBuffer && !devicePath)
		return raw(bootsvc::status::notFound);
	if (sourceBuffer && (sourceSize < 2 || memcmp(sourceBuffer, "MZ", 2)))
		return raw(bootsvc::status::loadError);

	*imageHandle = fw.newHandle();
	fw.images.push_back(*imageHandle);
	return 0;
}

efi_status startImage(efi_handle imageHandle, size_t *exitDataSize, char16_t **exitData) {
	auto &fw = StubFirmware::current();
	if (std::find(fw.images.begin(), fw.images.end(), imageHandle) == fw.images.end())
		return raw(bootsvc::status::invalidParameter);

	if (!fw.startImageExitData.empty()) {
		auto size = (fw.startImageExitData.size() + 1) * sizeof(char16_t);
		void *data = nullptr;
		if (auto s = allocatePool(EfiBootServicesData, size, &data); s)
			return s;
		memcpy(data, fw.startImageExitData.c_str(), size);
		*exitDataSize = size;
		*exitData = static_cast<char16_t *>(data);
	}
	return fw.startImageStatus;
}

efi_status exitImage(efi_handle, efi_status exitStatus, size_t, char16_t *) {
	StubFirmware::current().exitStatus = exitStatus;
	return 0;
}

efi_status unloadImage(efi_handle imageHandle) {
	auto &fw = StubFirmware::current();
	auto it = std::find(fw.images.begin(), fw.images.end(), imageHandle);
	if (it == fw.images.end())
		return raw(bootsvc::status::invalidParameter);
	fw.images.erase(it);
	return 0;
}

efi_status exitBootServices(efi_handle imageHandle, size_t mapKey) {
	auto &fw = StubFirmware::current();
	fw.exitBootServicesCalls++;

	// Something allocated memory right before the call.
	if (fw.growOnExit) {
		fw.growOnExit--;
		fw.growMap(1);
	}

	if (imageHandle != fw.imageHandle || mapKey != fw.mapKey) {
		fw.exitFailed = true;
		return raw(bootsvc::status::invalidParameter);
	}
	fw.exited = true;
	return 0;
}

efi_status getNextMonotonicCount(uint64_t *count) {
	*count = StubFirmware::current().monotonicCount++;
	return 0;
}

efi_status stall(size_t microseconds) {
	StubFirmware::current().stalled += microseconds;
	return 0;
}

efi_status setWatchdogTimer(size_t timeout, uint64_t watchdogCode, size_t, char16_t *) {
	// Codes up to 0xFFFF are reserved for firmware.
	if (watchdogCode && watchdogCode <= 0xFFFF)
		return raw(bootsvc::status::invalidParameter);
	StubFirmware::current().watchdogTimeout = timeout;
	return 0;
}

efi_status locateProtocol(const efi_guid *protocol, void *, void **interface) {
	auto &fw = StubFirmware::current();
	fw.locateProtocolCalls++;

	for (const auto &installed : fw.protocols) {
		if (installed.guid == *protocol) {
			*interface = installed.interface;
			return installed.status;
		}
	}
	*interface = nullptr;
	return raw(bootsvc::status::notFound);
}

// ------------------------------------------------------------------------
// Console
// ------------------------------------------------------------------------

using ConsoleBound = Bound<efi_simple_text_output_protocol, StubConsole>;

constexpr size_t consoleModes[][2] = {{80, 25}, {80, 50}};

efi_status consoleReset(efi_simple_text_output_protocol *self, bool) {
	auto &console = ConsoleBound::of(self);
	console.output.clear();
	return 0;
}

efi_status consoleOutputString(efi_simple_text_output_protocol *self, char16_t *string) {
	auto &console = ConsoleBound::of(self);
	console.outputCalls++;
	if (console.outputStatus)
		return console.outputStatus;
	console.output += string;
	return 0;
}

efi_status consoleTestString(efi_simple_text_output_protocol *, char16_t *string) {
	for (auto p = string; *p; p++) {
		if (*p > 0x7E)
			return raw(bootsvc::status::unsupported);
	}
	return 0;
}

efi_status consoleQueryMode(efi_simple_text_output_protocol *, size_t modeNumber,
		size_t *columns, size_t *rows) {
	if (modeNumber >= std::size(consoleModes))
		return raw(bootsvc::status::unsupported);
	*columns = consoleModes[modeNumber][0];
	*rows = consoleModes[modeNumber][1];
	return 0;
}

efi_status consoleSetMode(efi_simple_text_output_protocol *self, size_t modeNumber) {
	auto &console = ConsoleBound::of(self);
	if (modeNumber >= std::size(consoleModes))
		return raw(bootsvc::status::unsupported);
	console.mode.mode = static_cast<int32_t>(modeNumber);
	console.clears++;
	return 0;
}

efi_status consoleSetAttribute(efi_simple_text_output_protocol *self, size_t attribute) {
	auto &console = ConsoleBound::of(self);
	console.attribute = attribute;
	console.mode.attribute = static_cast<int32_t>(attribute);
	return 0;
}

efi_status consoleClearScreen(efi_simple_text_output_protocol *self) {
	auto &console = ConsoleBound::of(self);
	console.clears++;
	console.cursorRow = 0;
	console.cursorColumn = 0;
	return 0;
}

efi_status consoleSetCursorPosition(efi_simple_text_output_protocol *self, size_t column,
		size_t row) {
	auto &console = ConsoleBound::of(self);
	auto mode = consoleModes[console.mode.mode];
	if (column >= mode[0] || row >= mode[1])
		return raw(bootsvc::status::unsupported);
	console.cursorColumn = column;
	console.cursorRow = row;
	return 0;
}

efi_status consoleEnableCursor(efi_simple_text_output_protocol *self, bool visible) {
	ConsoleBound::of(self).mode.cursor_visible = visible;
	return 0;
}

// ------------------------------------------------------------------------
// Keyboard
// ------------------------------------------------------------------------

using KeyboardBound = Bound<efi_simple_text_input_protocol, StubKeyboard>;

efi_status keyboardReset(efi_simple_text_input_protocol *self, bool) {
	auto &keyboard = KeyboardBound::of(self);
	keyboard.keys.clear();
	keyboard.resets++;
	return 0;
}

efi_status keyboardReadKeyStroke(efi_simple_text_input_protocol *self, efi_input_key *key) {
	auto &keyboard = KeyboardBound::of(self);
	if (keyboard.keys.empty())
		return raw(bootsvc::status::notReady);
	*key = keyboard.keys.front();
	keyboard.keys.pop_front();
	return 0;
}

// ------------------------------------------------------------------------
// Block I/O
// ------------------------------------------------------------------------

using DiskBound = Bound<efi_block_io_protocol, StubDisk>;

efi_status checkTransfer(StubDisk &disk, uint32_t mediaId, efi_lba lba, size_t size) {
	if (mediaId != disk.media.media_id)
		return raw(bootsvc::status::mediaChanged);
	if (size % disk.media.block_size)
		return raw(bootsvc::status::badBufferSize);
	if (lba * disk.media.block_size + size > disk.data.size())
		return raw(bootsvc::status::invalidParameter);
	return 0;
}

efi_status diskReset(efi_block_io_protocol *, bool) { return 0; }

efi_status diskReadBlocks(efi_block_io_protocol *self, uint32_t mediaId, efi_lba lba,
		size_t bufferSize, void *buffer) {
	auto &disk = DiskBound::of(self);
	if (auto s = checkTransfer(disk, mediaId, lba, bufferSize); s)
		return s;
	memcpy(buffer, disk.data.data() + lba * disk.media.block_size, bufferSize);
	return 0;
}

efi_status diskWriteBlocks(efi_block_io_protocol *self, uint32_t mediaId, efi_lba lba,
		size_t bufferSize, void *buffer) {
	auto &disk = DiskBound::of(self);
	if (disk.media.read_only)
		return raw(bootsvc::status::writeProtected);
	if (auto s = checkTransfer(disk, mediaId, lba, bufferSize); s)
		return s;
	memcpy(disk.data.data() + lba * disk.media.block_size, buffer, bufferSize);
	return 0;
}

efi_status diskFlushBlocks(efi_block_io_protocol *self) {
	DiskBound::of(self).flushes++;
	return 0;
}

// ------------------------------------------------------------------------
// Graphics output
// ------------------------------------------------------------------------

using GraphicsBound = Bound<efi_graphics_output_protocol, StubGraphics>;

efi_graphics_output_mode_information makeMode(uint32_t width, uint32_t height) {
	efi_graphics_output_mode_information info{};
	info.version = 0;
	info.horizontal_resolution = width;
	info.vertical_resolution = height;
	info.pixel_format = PixelBlueGreenRedReserved8BitPerColor;
	info.pixels_per_scan_line = width;
	return info;
}

efi_status graphicsQueryMode(efi_graphics_output_protocol *self, uint32_t modeNumber,
		size_t *sizeOfInfo, efi_graphics_output_mode_information **info) {
	auto &graphics = GraphicsBound::of(self);
	if (modeNumber >= graphics.mode.max_mode)
		return raw(bootsvc::status::invalidParameter);

	void *copy = nullptr;
	if (auto s = allocatePool(EfiBootServicesData, sizeof(**info), &copy); s)
		return s;
	memcpy(copy, &graphics.modes[modeNumber], sizeof(**info));
	*sizeOfInfo = graphics.reportedInfoSize;
	*info = static_cast<efi_graphics_output_mode_information *>(copy);
	return 0;
}

efi_status graphicsSetMode(efi_graphics_output_protocol *self, uint32_t modeNumber) {
	auto &graphics = GraphicsBound::of(self);
	if (modeNumber >= graphics.mode.max_mode)
		return raw(bootsvc::status::unsupported);

	graphics.mode.mode = modeNumber;
	graphics.mode.info = &graphics.modes[modeNumber];
	std::fill(graphics.framebuffer.begin(), graphics.framebuffer.end(),
			efi_graphics_output_blt_pixel{});
	return 0;
}

efi_status graphicsBlt(efi_graphics_output_protocol *self, efi_graphics_output_blt_pixel *bltBuffer,
		efi_graphics_output_blt_operation operation, size_t, size_t, size_t destinationX,
		size_t destinationY, size_t width, size_t height, size_t) {
	auto &graphics = GraphicsBound::of(self);
	if (operation != EfiBltVideoFill)
		return raw(bootsvc::status::unsupported);

	auto info = graphics.mode.info;
	if (destinationX + width > info->horizontal_resolution
	    || destinationY + height > info->vertical_resolution)
		return raw(bootsvc::status::invalidParameter);

	for (size_t y = destinationY; y < destinationY + height; y++) {
		for (size_t x = destinationX; x < destinationX + width; x++)
			graphics.framebuffer[y * info->pixels_per_scan_line + x] = *bltBuffer;
	}
	return 0;
}

} // anonymous namespace

// ------------------------------------------------------------------------
// StubFirmware
// ------------------------------------------------------------------------

StubFirmware &StubFirmware::current() {
	if (!currentFirmware) {
		fprintf(stderr, "bootsvc-tests: Firmware call without a StubFirmware\n");
		abort();
	}
	return *currentFirmware;
}

StubFirmware::StubFirmware(uint32_t revision)
: previous_{currentFirmware} {
	currentFirmware = this;

	table.hdr.signature = EFI_BOOT_SERVICES_SIGNATURE;
	table.hdr.revision = revision;
	table.hdr.header_size = sizeof(efi_boot_services);

	table.raise_tpl = raiseTpl;
	table.restore_tpl = restoreTpl;
	table.allocate_pages = allocatePages;
	table.free_pages = freePages;
	table.get_memory_map = getMemoryMap;
	table.allocate_pool = allocatePool;
	table.free_pool = freePool;
	table.create_event = createEvent;
	table.set_timer = setTimer;
	table.wait_for_event = waitForEvent;
	table.signal_event = signalEvent;
	table.close_event = closeEvent;
	table.check_event = checkEvent;
	table.handle_protocol = handleProtocol;
	table.locate_handle = locateHandle;
	table.load_image = loadImage;
	table.start_image = startImage;
	table.exit = exitImage;
	table.unload_image = unloadImage;
	table.exit_boot_services = exitBootServices;
	table.get_next_monotonic_count = getNextMonotonicCount;
	table.stall = stall;
	table.set_watchdog_timer = setWatchdogTimer;
	table.locate_protocol = locateProtocol;

	systemTable.hdr.signature = EFI_SYSTEM_TABLE_SIGNATURE;
	systemTable.hdr.revision = revision;
	systemTable.hdr.header_size = sizeof(efi_system_table);
	systemTable.firmware_vendor = const_cast<char16_t *>(u"bootsvc stub");
	systemTable.firmware_revision = 0x10000;
	systemTable.boot_services = &table;

	imageHandle = newHandle();
}

StubFirmware::~StubFirmware() {
	// Buffers that were released by their owners.
	for (auto [p, size] : pools)
		std::free(p);
	for (auto [address, n] : pages)
		std::free(reinterpret_cast<void *>(address));

	currentFirmware = previous_;
}

efi_handle StubFirmware::newHandle() {
	return &handleStorage_.emplace_back(0);
}

void StubFirmware::install(efi_handle handle, const efi_guid &guid, void *interface,
		efi_status status) {
	protocols.push_back({handle, guid, interface, status});
}

void StubFirmware::growMap(size_t n) {
	descriptorCount += n;
	mapKey++;
}

efi_memory_type StubFirmware::descriptorType(size_t n) const {
	constexpr efi_memory_type types[] = {
		EfiConventionalMemory,
		EfiBootServicesData,
		EfiRuntimeServicesCode,
		EfiLoaderData,
		EfiACPIReclaimMemory,
	};
	return types[n % std::size(types)];
}

// ------------------------------------------------------------------------
// Protocol stubs
// ------------------------------------------------------------------------

StubConsole::StubConsole() {
	bound.stub = this;
	bound.protocol.reset = consoleReset;
	bound.protocol.output_string = consoleOutputString;
	bound.protocol.test_string = consoleTestString;
	bound.protocol.query_mode = consoleQueryMode;
	bound.protocol.set_mode = consoleSetMode;
	bound.protocol.set_attribute = consoleSetAttribute;
	bound.protocol.clear_screen = consoleClearScreen;
	bound.protocol.set_cursor_position = consoleSetCursorPosition;
	bound.protocol.enable_cursor = consoleEnableCursor;
	bound.protocol.mode = &mode;

	mode.max_mode = std::size(consoleModes);
	mode.mode = 0;
	mode.cursor_visible = true;
}

StubKeyboard::StubKeyboard() {
	bound.stub = this;
	bound.protocol.reset = keyboardReset;
	bound.protocol.read_key_stroke = keyboardReadKeyStroke;
	bound.protocol.wait_for_key = nullptr;
}

StubDisk::StubDisk(uint32_t blockSize, size_t blocks, uint64_t revision)
: data(blockSize * blocks) {
	bound.stub = this;
	bound.protocol.revision = revision;
	bound.protocol.media = &media;
	bound.protocol.reset = diskReset;
	bound.protocol.read_blocks = diskReadBlocks;
	bound.protocol.write_blocks = diskWriteBlocks;
	bound.protocol.flush_blocks = diskFlushBlocks;

	media.media_id = 1;
	media.media_present = true;
	media.block_size = blockSize;
	media.io_align = 1;
	media.last_block = blocks - 1;
	if (revision >= EFI_BLOCK_IO_PROTOCOL_REVISION2)
		media.logical_blocks_per_physical_block = 1;
	if (revision >= EFI_BLOCK_IO_PROTOCOL_REVISION3)
		media.optimal_transfer_length_granularity = 8;
}

StubGraphics::StubGraphics()
: modes{makeMode(640, 480), makeMode(800, 600), makeMode(1024, 768)},
  framebuffer(1024 * 768) {
	bound.stub = this;
	bound.protocol.query_mode = graphicsQueryMode;
	bound.protocol.set_mode = graphicsSetMode;
	bound.protocol.blt = graphicsBlt;
	bound.protocol.mode = &mode;

	mode.max_mode = modes.size();
	mode.mode = 0;
	mode.info = &modes[0];
	mode.size_of_info = sizeof(efi_graphics_output_mode_information);
	mode.framebuffer_base = reinterpret_cast<efi_physical_addr>(framebuffer.data());
	mode.framebuffer_size = framebuffer.size() * sizeof(efi_graphics_output_blt_pixel);
}

CaptureLogHandler::CaptureLogHandler() { bootsvc::enableLogHandler(this); }

CaptureLogHandler::~CaptureLogHandler() { bootsvc::disableLogHandler(this); }

void CaptureLogHandler::emit(frg::string_view text) { this->text.append(text.data(), text.size()); }

StubFirmware &bootstrappedFirmware() {
	struct Bootstrapped {
		Bootstrapped() { bootsvc::bootstrap(firmware.imageHandle, &firmware.systemTable); }

		StubFirmware firmware;
	};

	// bootstrap() cannot be undone, so this firmware stays in place until the process exits.
	static Bootstrapped singleton;
	return singleton.firmware;
}
