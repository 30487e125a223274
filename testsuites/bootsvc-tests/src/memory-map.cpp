#include <assert.h>
#include <vector>

#include <bootsvc/boot-services.hpp>
#include <bootsvc/memory-map.hpp>

#include "expect-halt.hpp"
#include "stub-firmware.hpp"
#include "testsuite.hpp"

namespace {

// Counts log messages that are emitted once ExitBootServices() has been called.
struct ExitWatchHandler final : bootsvc::LogHandler {
	explicit ExitWatchHandler(StubFirmware &fw)
	: fw{fw} {
		bootsvc::enableLogHandler(this);
	}

	ExitWatchHandler(const ExitWatchHandler &) = delete;

	~ExitWatchHandler() { bootsvc::disableLogHandler(this); }

	ExitWatchHandler &operator=(const ExitWatchHandler &) = delete;

	void emit(frg::string_view) override {
		if (fw.exitBootServicesCalls)
			emitsAfterExit++;
	}

	StubFirmware &fw;
	size_t emitsAfterExit{0};
};

} // anonymous namespace

DEFINE_TEST(memory_map_probe_is_idempotent, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	auto first = bs.memoryMapInfo();
	auto second = bs.memoryMapInfo();
	assert(first);
	assert(second);
	assert(first->bufferSize == second->bufferSize);
	assert(first->descriptorSize == second->descriptorSize);
	assert(first->descriptorVersion == EFI_MEMORY_DESCRIPTOR_VERSION);
	assert(fw.mapKey == 0x1000);
	assert(fw.livePools() == 0);
}))

DEFINE_TEST(memory_map_five_descriptors, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	auto info = bs.memoryMapInfo();
	assert(info);
	assert(info->bufferSize == 240);
	assert(info->descriptorSize == 48);

	std::vector<std::byte> buffer(info->bufferSize);
	auto filled = bs.memoryMap(buffer);
	assert(filled);
	assert(filled->bufferSize == 240);

	// The stride is larger than efi_memory_descriptor.
	bootsvc::MemoryMapView view{buffer, *filled};
	assert(view.size() == 5);

	size_t n = 0;
	for (const auto &descriptor : view) {
		assert(descriptor.type == fw.descriptorType(n));
		assert(descriptor.physical_start == 0x100000 + n * 0x10000);
		assert(descriptor.number_of_pages == 16);
		assert(descriptor.attribute == EFI_MEMORY_WB);
		n++;
	}
	assert(n == 5);
	assert(view[4].physical_start == 0x140000);

	auto exited = bs.exitBootServices(bootsvc::Handle{fw.imageHandle}, filled->mapKey);
	assert(exited);
	assert(fw.exited);
}))

DEFINE_TEST(memory_map_growth_requires_reprobe, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	auto info = bs.memoryMapInfo();
	assert(info);
	std::vector<std::byte> buffer(info->bufferSize);

	fw.growBeforeFill = 2;
	auto filled = bs.memoryMap(buffer);
	assert_status(filled, bootsvc::status::bufferTooSmall);

	auto reprobed = bs.memoryMapInfo();
	assert(reprobed);
	assert(reprobed->bufferSize == 7 * 48);

	buffer.resize(reprobed->bufferSize + bootsvc::defaultMapMargin * reprobed->descriptorSize);
	filled = bs.memoryMap(buffer);
	assert(filled);
	assert(filled->mapKey == fw.mapKey);

	bootsvc::MemoryMapView view{buffer, *filled};
	assert(view.size() == 7);
}))

DEFINE_TEST(memory_map_stale_key_is_rejected, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	auto map = bs.retrieveMemoryMap();
	assert(map);

	fw.growMap(1);
	auto exited = bs.exitBootServices(bootsvc::Handle{fw.imageHandle}, map->mapKey());
	assert_status(exited, bootsvc::status::invalidParameter);
	assert(!fw.exited);

	// Only GetMemoryMap() and ExitBootServices() may follow.
	auto refilled = bs.memoryMap(map->buffer.span());
	assert(refilled);
	exited = bs.exitBootServices(bootsvc::Handle{fw.imageHandle}, refilled->mapKey);
	assert(exited);
	map->buffer.release();
}))

DEFINE_TEST(retrieve_memory_map, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	{
		auto map = bs.retrieveMemoryMap();
		assert(map);
		assert(map->view().size() == 5);
		assert(map->mapKey() == fw.mapKey);
		assert(map->buffer.size() == 240 + bootsvc::defaultMapMargin * 48);
		assert(fw.livePools() == 1);
		assert(fw.getMemoryMapCalls == 2);
	}
	assert(fw.livePools() == 0);
}))

DEFINE_TEST(retrieve_memory_map_retries_with_larger_margin, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	// More than the initial margin.
	fw.growBeforeFill = 20;
	auto map = bs.retrieveMemoryMap();
	assert(map);
	assert(map->view().size() == 25);
	assert(fw.getMemoryMapCalls == 4);
	assert(fw.livePools() == 1);
}))

DEFINE_TEST(retrieve_memory_map_gives_up, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	fw.growOnEveryFill = 0x1000;
	auto map = bs.retrieveMemoryMap();
	assert_status(map, bootsvc::status::bufferTooSmall);
	// Margins 8, 16, ..., 0x800.
	assert(fw.getMemoryMapCalls == 18);
	assert(fw.livePools() == 0);
}))

DEFINE_TEST(retrieve_memory_map_propagates_allocation_failure, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	fw.allocatePoolStatus = bootsvc::status::outOfResources.value();
	auto map = bs.retrieveMemoryMap();
	assert_status(map, bootsvc::status::outOfResources);
	assert(fw.getMemoryMapCalls == 1);
}))

DEFINE_TEST(terminate_boot_services, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	auto view = bs.terminateBootServices(bootsvc::Handle{fw.imageHandle});
	assert(view);
	assert(fw.exited);
	assert(view->size() == 5);
	assert(view->mapKey() == fw.mapKey);
	assert(fw.exitBootServicesCalls == 1);
	assert(fw.poolCallsAfterExit == 0);
	// The buffer now belongs to the caller.
	assert(fw.livePools() == 1);
}))

DEFINE_TEST(terminate_boot_services_refreshes_stale_key, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	ExitWatchHandler watch{fw};

	fw.growOnExit = 2;
	auto view = bs.terminateBootServices(bootsvc::Handle{fw.imageHandle});
	assert(view);
	assert(fw.exited);
	assert(fw.exitBootServicesCalls == 3);
	assert(view->size() == 7);
	assert(view->mapKey() == fw.mapKey);
	assert(fw.poolCallsAfterExit == 0);
	assert(!watch.emitsAfterExit);
}))

DEFINE_TEST(terminate_boot_services_runs_out_of_retries, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	ExitWatchHandler watch{fw};

	fw.growOnExit = 10;
	auto view = bs.terminateBootServices(bootsvc::Handle{fw.imageHandle}, bootsvc::defaultMapMargin, 2);
	assert_status(view, bootsvc::status::invalidParameter);
	assert(!fw.exited);
	assert(fw.exitBootServicesCalls == 3);
	assert(fw.poolCallsAfterExit == 0);
	assert(!watch.emitsAfterExit);
}))

DEFINE_TEST(memory_descriptor_helpers, ([] {
	efi_memory_descriptor descriptor{};
	descriptor.physical_start = 0x200000;
	descriptor.number_of_pages = 4;

	assert(bootsvc::endAddress(descriptor) == 0x204000);

	descriptor.type = EfiConventionalMemory;
	assert(bootsvc::isUsableAfterExit(descriptor));
	descriptor.type = EfiBootServicesCode;
	assert(bootsvc::isUsableAfterExit(descriptor));
	descriptor.type = EfiBootServicesData;
	assert(bootsvc::isUsableAfterExit(descriptor));
	descriptor.type = EfiRuntimeServicesData;
	assert(!bootsvc::isUsableAfterExit(descriptor));
	descriptor.type = EfiACPIMemoryNVS;
	assert(!bootsvc::isUsableAfterExit(descriptor));
}))

DEFINE_TEST(memory_map_log, ([] {
	StubFirmware fw;
	CaptureLogHandler capture;

	auto map = fw.bootServices().retrieveMemoryMap();
	assert(map);
	bootsvc::logMemoryMap(map->view());

	assert(capture.text.find("Memory map with 5 entries") != std::string::npos);
	assert(capture.text.find("base=0x100000") != std::string::npos);
	assert(capture.text.find("usable=false") != std::string::npos);
}))

DEFINE_TEST(memory_map_size_query_succeeds, ([] {
	expectHalt([] {
		StubFirmware fw;
		fw.emptyMap = true;
		fw.bootServices().memoryMapInfo();
	}, "GetMemoryMap() succeeded with an empty buffer");
}))

DEFINE_TEST(memory_map_fill_is_empty, ([] {
	expectHalt([] {
		StubFirmware fw;
		std::vector<std::byte> buffer(240);
		fw.emptyMap = true;
		fw.bootServices().memoryMap(buffer);
	}, "Firmware returned an empty memory map");
}))

DEFINE_TEST(memory_map_descriptor_stride_too_small, ([] {
	expectHalt([] {
		StubFirmware fw;
		fw.descriptorSize = 16;
		auto bs = fw.bootServices();

		auto probed = bs.memoryMapInfo();
		assert(probed);
		assert(probed->bufferSize == 80);
		std::vector<std::byte> buffer(probed->bufferSize);
		bs.memoryMap(buffer);
	}, "Memory descriptor size 16 is smaller than efi_memory_descriptor");
}))
