#include <array>
#include <assert.h>

#include <bootsvc/boot-services.hpp>

#include "stub-firmware.hpp"
#include "testsuite.hpp"

namespace {

void countNotification(efi_event, void *context) {
	++*static_cast<int *>(context);
}

} // anonymous namespace

DEFINE_TEST(tpl_raise_restore, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	assert(static_cast<efi_tpl>(bootsvc::Tpl::application) == 4);
	assert(static_cast<efi_tpl>(bootsvc::Tpl::callback) == 8);
	assert(static_cast<efi_tpl>(bootsvc::Tpl::notify) == 16);
	assert(static_cast<efi_tpl>(bootsvc::Tpl::highLevel) == 31);

	auto previous = bs.raiseTpl(bootsvc::Tpl::notify);
	assert(previous == bootsvc::Tpl::application);
	assert(fw.tpl == TPL_NOTIFY);
	bs.restoreTpl(previous);
	assert(fw.tpl == TPL_APPLICATION);
}))

DEFINE_TEST(tpl_guard_nests, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	{
		bootsvc::TplGuard outer{bs, bootsvc::Tpl::callback};
		assert(fw.tpl == TPL_CALLBACK);
		assert(outer.previous() == bootsvc::Tpl::application);
		{
			bootsvc::TplGuard inner{bs, bootsvc::Tpl::highLevel};
			assert(fw.tpl == TPL_HIGH_LEVEL);
			assert(inner.previous() == bootsvc::Tpl::callback);
		}
		assert(fw.tpl == TPL_CALLBACK);
	}
	assert(fw.tpl == TPL_APPLICATION);
}))

DEFINE_TEST(pool_allocation, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	auto p = bs.allocatePool(EfiLoaderData, 64);
	assert(p);
	assert(fw.livePools() == 1);
	assert(bs.freePool(*p));
	assert(fw.livePools() == 0);
	assert_status(bs.freePool(*p), bootsvc::status::invalidParameter);

	fw.allocatePoolStatus = bootsvc::status::outOfResources.value();
	assert_status(bs.allocatePool(EfiLoaderData, 64), bootsvc::status::outOfResources);
}))

DEFINE_TEST(pool_buffer_ownership, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	auto buffer = bs.allocatePoolBuffer<uint32_t>(EfiLoaderData, 16);
	assert(buffer);
	assert(buffer->size() == 16);
	assert(fw.pools.at(buffer->data()) == 16 * sizeof(uint32_t));

	for (size_t i = 0; i < buffer->size(); i++)
		(*buffer)[i] = i;

	bootsvc::PoolBuffer<uint32_t> moved{std::move(*buffer)};
	assert(buffer->empty());
	assert(!buffer->data());
	assert(moved.size() == 16);
	assert(moved[15] == 15);

	moved.truncate(4);
	assert(moved.size() == 4);
	moved.truncate(10);
	assert(moved.size() == 4);

	auto p = moved.release();
	assert(moved.empty());
	assert(fw.livePools() == 1);
	assert(bs.freePool(p));
	assert(fw.livePools() == 0);
}))

DEFINE_TEST(page_allocation, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	auto address = bs.allocatePages(AllocateAnyPages, EfiLoaderData, 2);
	assert(address);
	assert(!(*address % EFI_PAGE_SIZE));
	assert(bs.freePages(*address, 2));
	assert_status(bs.freePages(*address, 2), bootsvc::status::notFound);

	auto fixed = bs.allocatePages(AllocateAddress, EfiLoaderData, 1, 0x100000);
	assert_status(fixed, bootsvc::status::notFound);
	auto none = bs.allocatePages(AllocateAnyPages, EfiLoaderData, 0);
	assert_status(none, bootsvc::status::invalidParameter);
}))

DEFINE_TEST(timer_events, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	auto event = bs.createEvent(EVT_TIMER, bootsvc::Tpl::callback);
	assert(event);

	// NOT_READY only means that the event is not signalled.
	auto signalled = bs.checkEvent(*event);
	assert(signalled);
	assert(!*signalled);

	assert(bs.setTimer(*event, TimerRelative, 0));
	signalled = bs.checkEvent(*event);
	assert(signalled && *signalled);
	signalled = bs.checkEvent(*event);
	assert(signalled && !*signalled);

	assert(bs.closeEvent(*event));
	assert(fw.events.front().closed);

	auto plain = bs.createEvent(0, bootsvc::Tpl::callback);
	assert(plain);
	assert_status(bs.setTimer(*plain, TimerPeriodic, 100), bootsvc::status::invalidParameter);
}))

DEFINE_TEST(wait_for_event, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	auto first = bs.createEvent(0, bootsvc::Tpl::callback);
	auto second = bs.createEvent(0, bootsvc::Tpl::callback);
	assert(first && second);

	assert(bs.signalEvent(*second));
	std::array<bootsvc::Event, 2> events{*first, *second};
	auto index = bs.waitForEvent(events);
	assert(index);
	assert(*index == 1);

	assert_status(bs.waitForEvent({}), bootsvc::status::invalidParameter);
}))

DEFINE_TEST(notify_events, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	int notifications = 0;
	auto event = bs.createEvent(EVT_NOTIFY_SIGNAL, bootsvc::Tpl::callback, countNotification,
			&notifications);
	assert(event);
	assert(fw.events.front().tpl == TPL_CALLBACK);

	assert(bs.signalEvent(*event));
	assert(notifications == 1);

	// Other failures of CheckEvent() are reported as such.
	assert_status(bs.checkEvent(*event), bootsvc::status::invalidParameter);

	auto invalid = bs.createEvent(EVT_NOTIFY_SIGNAL, bootsvc::Tpl::callback);
	assert_status(invalid, bootsvc::status::invalidParameter);
}))

DEFINE_TEST(image_services, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();
	bootsvc::Handle parent{fw.imageHandle};

	std::array<std::byte, 4> pe{std::byte{'M'}, std::byte{'Z'}, std::byte{0}, std::byte{0}};
	auto image = bs.loadImage(false, parent, nullptr, pe);
	assert(image);
	assert(fw.images.size() == 1);

	assert(bs.startImage(*image));

	// Exit data is returned to the pool.
	fw.startImageStatus = bootsvc::status::aborted.value();
	fw.startImageExitData = u"aborted by user";
	assert_status(bs.startImage(*image), bootsvc::status::aborted);
	assert(fw.livePools() == 0);

	assert(bs.unloadImage(*image));
	assert_status(bs.unloadImage(*image), bootsvc::status::invalidParameter);
	assert_status(bs.startImage(*image), bootsvc::status::invalidParameter);

	std::array<std::byte, 4> garbage{};
	assert_status(bs.loadImage(false, parent, nullptr, garbage), bootsvc::status::loadError);
	assert_status(bs.loadImage(true, parent, nullptr, {}), bootsvc::status::notFound);

	assert(bs.exit(parent, bootsvc::status::aborted));
	assert(fw.exitStatus == bootsvc::status::aborted.value());
}))

DEFINE_TEST(miscellaneous_services, ([] {
	StubFirmware fw;
	auto bs = fw.bootServices();

	auto a = bs.nextMonotonicCount();
	auto b = bs.nextMonotonicCount();
	assert(a && b);
	assert(*b > *a);

	assert(bs.stall(100));
	assert(bs.stall(50));
	assert(fw.stalled == 150);

	assert(bs.setWatchdogTimer(0));
	assert(fw.watchdogTimeout == 0);
	assert(bs.setWatchdogTimer(60, 0x10000));
	assert(fw.watchdogTimeout == 60);
	assert_status(bs.setWatchdogTimer(60, 5), bootsvc::status::invalidParameter);

	assert(bs.revision() == EFI_2_10_SYSTEM_TABLE_REVISION);
	assert(bs.raw() == &fw.table);
}))
