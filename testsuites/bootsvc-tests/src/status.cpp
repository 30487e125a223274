#include <assert.h>
#include <string.h>
#include <iterator>

#include <bootsvc/status.hpp>

#include "testsuite.hpp"

namespace {

constexpr bootsvc::Status errors[] = {
	bootsvc::status::loadError,
	bootsvc::status::invalidParameter,
	bootsvc::status::unsupported,
	bootsvc::status::badBufferSize,
	bootsvc::status::bufferTooSmall,
	bootsvc::status::notReady,
	bootsvc::status::deviceError,
	bootsvc::status::writeProtected,
	bootsvc::status::outOfResources,
	bootsvc::status::volumeCorrupted,
	bootsvc::status::volumeFull,
	bootsvc::status::noMedia,
	bootsvc::status::mediaChanged,
	bootsvc::status::notFound,
	bootsvc::status::accessDenied,
	bootsvc::status::noResponse,
	bootsvc::status::noMapping,
	bootsvc::status::timeout,
	bootsvc::status::notStarted,
	bootsvc::status::alreadyStarted,
	bootsvc::status::aborted,
	bootsvc::status::icmpError,
	bootsvc::status::tftpError,
	bootsvc::status::protocolError,
	bootsvc::status::incompatibleVersion,
	bootsvc::status::securityViolation,
	bootsvc::status::crcError,
	bootsvc::status::endOfMedia,
	bootsvc::status::endOfFile,
	bootsvc::status::invalidLanguage,
	bootsvc::status::compromisedData,
	bootsvc::status::ipAddressConflict,
	bootsvc::status::httpError,
};

constexpr bootsvc::Status warnings[] = {
	bootsvc::status::warnUnknownGlyph,
	bootsvc::status::warnDeleteFailure,
	bootsvc::status::warnWriteFailure,
	bootsvc::status::warnBufferTooSmall,
	bootsvc::status::warnStaleData,
	bootsvc::status::warnFileSystem,
	bootsvc::status::warnResetRequired,
};

} // anonymous namespace

DEFINE_TEST(status_error_bit, ([] {
	assert(bootsvc::Status::errorBit == efi_status{1} << (sizeof(efi_status) * 8 - 1));
	assert(bootsvc::status::success.value() == 0);
	assert(bootsvc::status::success.isSuccess());

	for (auto s : errors) {
		assert(s.value() & bootsvc::Status::errorBit);
		assert(s.isError());
		assert(!s.isWarning());
		assert(!s.isSuccess());
	}

	for (auto s : warnings) {
		assert(!(s.value() & bootsvc::Status::errorBit));
		assert(s.value());
		assert(s.isWarning());
		assert(!s.isError());
	}
}))

DEFINE_TEST(status_codes_are_distinct, ([] {
	for (size_t i = 0; i < std::size(errors); i++) {
		for (size_t j = i + 1; j < std::size(errors); j++)
			assert(errors[i] != errors[j]);
	}
	for (size_t i = 0; i < std::size(warnings); i++) {
		for (size_t j = i + 1; j < std::size(warnings); j++)
			assert(warnings[i] != warnings[j]);
	}

	// Errors and warnings share codes but never compare equal.
	assert(bootsvc::status::loadError.code() == bootsvc::status::warnUnknownGlyph.code());
	assert(bootsvc::status::loadError != bootsvc::status::warnUnknownGlyph);
}))

DEFINE_TEST(status_exact_values, ([] {
	auto e = bootsvc::Status::errorBit;
	assert(bootsvc::status::invalidParameter.value() == (e | 2));
	assert(bootsvc::status::bufferTooSmall.value() == (e | 5));
	assert(bootsvc::status::notReady.value() == (e | 6));
	assert(bootsvc::status::notFound.value() == (e | 14));
	assert(bootsvc::status::endOfMedia.value() == (e | 28));
	assert(bootsvc::status::endOfFile.value() == (e | 31));
	assert(bootsvc::status::httpError.value() == (e | 35));
	assert(bootsvc::status::warnBufferTooSmall.value() == 4);
	assert(bootsvc::status::warnStaleData.value() == 5);
	assert(bootsvc::status::warnResetRequired.value() == 7);

	assert(bootsvc::Status::newError(14) == bootsvc::status::notFound);
	assert(bootsvc::Status::newWarn(5) == bootsvc::status::warnStaleData);
	assert(bootsvc::fromRaw(e | 9) == bootsvc::status::outOfResources);
}))

DEFINE_TEST(status_to_result, ([] {
	auto ok = bootsvc::status::success.toResult(42);
	assert(ok);
	assert(*ok == 42);
	assert(bootsvc::status::success.toResult());

	for (auto s : errors) {
		auto r = s.toResult(42);
		assert_status(r, s);
		auto v = s.toResult();
		assert_status(v, s);
	}

	// Warnings are failures as well.
	for (auto s : warnings) {
		auto r = s.toResult(42);
		assert_status(r, s);
	}

	// So are codes without a name.
	auto unnamed = bootsvc::fromRaw(0x1234).toResult(1);
	assert_status(unnamed, bootsvc::fromRaw(0x1234));
}))

DEFINE_TEST(status_names, ([] {
	assert(!strcmp(bootsvc::status::success.name(), "SUCCESS"));
	assert(!strcmp(bootsvc::status::bufferTooSmall.name(), "BUFFER_TOO_SMALL"));
	assert(!strcmp(bootsvc::status::warnStaleData.name(), "WARN_STALE_DATA"));
	assert(!bootsvc::Status::newError(29).name());
	assert(!bootsvc::Status::newWarn(100).name());

	for (auto s : errors)
		assert(s.name());
	for (auto s : warnings)
		assert(s.name());
}))
