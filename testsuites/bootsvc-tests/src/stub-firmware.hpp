#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <bootsvc/boot-services.hpp>
#include <bootsvc/debug.hpp>
#include <bootsvc/efi.hpp>

// Host-side stand-in for the firmware tables.
// Firmware calls carry no context, so the most recently constructed
// StubFirmware receives them until it is destroyed.
struct StubFirmware {
	static StubFirmware &current();

	explicit StubFirmware(uint32_t revision = EFI_2_10_SYSTEM_TABLE_REVISION);

	StubFirmware(const StubFirmware &) = delete;

	~StubFirmware();

	StubFirmware &operator=(const StubFirmware &) = delete;

	bootsvc::BootServices bootServices() const { return bootsvc::BootServices{&table}; }

	efi_handle newHandle();
	void install(efi_handle handle, const efi_guid &guid, void *interface,
			efi_status status = 0);

	// Adds descriptors to the memory map; this invalidates the map key.
	void growMap(size_t n);
	efi_memory_type descriptorType(size_t n) const;
	size_t livePools() const { return pools.size(); }

	efi_boot_services table{};
	efi_system_table systemTable{};
	efi_handle imageHandle;

	// Memory map state.
	size_t descriptorCount{5};
	size_t descriptorSize{48};
	size_t mapKey{0x1000};
	// Descriptors that are added right before the next fill (consumed once).
	size_t growBeforeFill{0};
	// Descriptors that are added before every fill.
	size_t growOnEveryFill{0};
	// Number of ExitBootServices() calls that change the map before they check the key.
	size_t growOnExit{0};
	// GetMemoryMap() reports success with zero bytes, with or without a buffer.
	bool emptyMap{false};

	// Handle database.
	struct Installed {
		efi_handle handle;
		efi_guid guid;
		void *interface;
		efi_status status;
	};
	std::vector<Installed> protocols;
	// If set, LocateHandle() returns this status without touching its arguments.
	std::optional<efi_status> locateHandleStatus;

	// Pool allocations and their sizes.
	std::map<void *, size_t> pools;
	std::map<efi_physical_addr, size_t> pages;
	efi_status allocatePoolStatus{0};

	struct Event {
		uint32_t type;
		efi_tpl tpl;
		efi_event_notify notify;
		void *context;
		bool signalled{false};
		bool closed{false};
		efi_timer_delay timer{TimerCancel};
		uint64_t trigger{0};
	};
	std::deque<Event> events;

	// Images that were loaded through LoadImage().
	std::vector<efi_handle> images;
	efi_status startImageStatus{0};
	std::u16string startImageExitData;
	efi_status exitStatus{0};

	efi_tpl tpl{TPL_APPLICATION};
	uint64_t monotonicCount{0};
	size_t stalled{0};
	size_t watchdogTimeout{300};

	bool exited{false};
	bool exitFailed{false};
	// Pool calls after a failed or successful ExitBootServices().
	size_t poolCallsAfterExit{0};

	size_t getMemoryMapCalls{0};
	size_t exitBootServicesCalls{0};
	size_t locateHandleCalls{0};
	size_t handleProtocolCalls{0};
	size_t locateProtocolCalls{0};

private:
	StubFirmware *previous_;
	std::deque<int> handleStorage_;
};

// Protocol structure followed by a pointer to the stub that implements it.
// Firmware passes the protocol as self, which leads back to the stub.
template<typename P, typename Stub>
struct Bound {
	static Stub &of(P *self) { return *reinterpret_cast<Bound *>(self)->stub; }

	P protocol{};
	Stub *stub{nullptr};
};

// Text console that records everything written to it.
struct StubConsole {
	StubConsole();

	StubConsole(const StubConsole &) = delete;

	StubConsole &operator=(const StubConsole &) = delete;

	efi_simple_text_output_protocol *protocol() { return &bound.protocol; }

	Bound<efi_simple_text_output_protocol, StubConsole> bound;
	efi_simple_text_output_mode mode{};
	std::u16string output;
	size_t outputCalls{0};
	size_t attribute{0};
	size_t cursorRow{0};
	size_t cursorColumn{0};
	size_t clears{0};
	efi_status outputStatus{0};
};

// Keyboard that hands out queued keystrokes.
struct StubKeyboard {
	StubKeyboard();

	StubKeyboard(const StubKeyboard &) = delete;

	StubKeyboard &operator=(const StubKeyboard &) = delete;

	efi_simple_text_input_protocol *protocol() { return &bound.protocol; }

	Bound<efi_simple_text_input_protocol, StubKeyboard> bound;
	std::deque<efi_input_key> keys;
	size_t resets{0};
};

// Disk backed by host memory.
struct StubDisk {
	StubDisk(uint32_t blockSize, size_t blocks, uint64_t revision = EFI_BLOCK_IO_PROTOCOL_REVISION3);

	StubDisk(const StubDisk &) = delete;

	StubDisk &operator=(const StubDisk &) = delete;

	efi_block_io_protocol *protocol() { return &bound.protocol; }

	Bound<efi_block_io_protocol, StubDisk> bound;
	efi_block_io_media media{};
	std::vector<std::byte> data;
	size_t flushes{0};
};

struct StubGraphics {
	StubGraphics();

	StubGraphics(const StubGraphics &) = delete;

	StubGraphics &operator=(const StubGraphics &) = delete;

	efi_graphics_output_protocol *protocol() { return &bound.protocol; }
	const efi_graphics_output_blt_pixel &pixel(size_t x, size_t y) const {
		return framebuffer[y * mode.info->pixels_per_scan_line + x];
	}

	Bound<efi_graphics_output_protocol, StubGraphics> bound;
	efi_graphics_output_protocol_mode mode{};
	std::vector<efi_graphics_output_mode_information> modes;
	// Size that QueryMode() reports for the information.
	size_t reportedInfoSize{sizeof(efi_graphics_output_mode_information)};
	std::vector<efi_graphics_output_blt_pixel> framebuffer;
};

// Collects all log output.
struct CaptureLogHandler final : bootsvc::LogHandler {
	CaptureLogHandler();

	CaptureLogHandler(const CaptureLogHandler &) = delete;

	~CaptureLogHandler();

	CaptureLogHandler &operator=(const CaptureLogHandler &) = delete;

	void emit(frg::string_view text) override;

	std::string text;
};

// Firmware that bootsvc::bootstrap() was called with. Lives until the process exits.
// Created on first use; there must be no other StubFirmware alive at that point.
StubFirmware &bootstrappedFirmware();
