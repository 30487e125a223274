#pragma once

#include <expected>
#include <source_location>

#include <bootsvc/efi.hpp>

namespace bootsvc {

// Status word returned by every firmware call.
// The most significant bit marks errors, nonzero values without it are warnings.
struct Status {
	static constexpr efi_status errorBit = efi_status{1} << (sizeof(efi_status) * CHAR_BIT - 1);

	static constexpr Status newError(efi_status code) { return Status{errorBit | code}; }
	static constexpr Status newWarn(efi_status code) { return Status{code}; }

	constexpr Status() = default;

	constexpr explicit Status(efi_status value)
	: value_{value} { }

	constexpr efi_status value() const { return value_; }
	// Code without the error bit.
	constexpr efi_status code() const { return value_ & ~errorBit; }

	constexpr bool isSuccess() const { return !value_; }
	constexpr bool isError() const { return value_ & errorBit; }
	constexpr bool isWarning() const { return value_ && !(value_ & errorBit); }

	// Symbolic name of a named status code, nullptr otherwise.
	const char *name() const;

	template<typename T>
	constexpr std::expected<T, Status> toResult(T value) const {
		if (value_)
			return std::unexpected{*this};
		return value;
	}

	constexpr std::expected<void, Status> toResult() const {
		if (value_)
			return std::unexpected{*this};
		return {};
	}

	friend constexpr bool operator==(Status, Status) = default;

private:
	efi_status value_{0};
};

template<typename T>
using Result = std::expected<T, Status>;

namespace status {

inline constexpr Status success{0};

// Appendix D, error codes.
inline constexpr Status loadError = Status::newError(1);
inline constexpr Status invalidParameter = Status::newError(2);
inline constexpr Status unsupported = Status::newError(3);
inline constexpr Status badBufferSize = Status::newError(4);
inline constexpr Status bufferTooSmall = Status::newError(5);
inline constexpr Status notReady = Status::newError(6);
inline constexpr Status deviceError = Status::newError(7);
inline constexpr Status writeProtected = Status::newError(8);
inline constexpr Status outOfResources = Status::newError(9);
inline constexpr Status volumeCorrupted = Status::newError(10);
inline constexpr Status volumeFull = Status::newError(11);
inline constexpr Status noMedia = Status::newError(12);
inline constexpr Status mediaChanged = Status::newError(13);
inline constexpr Status notFound = Status::newError(14);
inline constexpr Status accessDenied = Status::newError(15);
inline constexpr Status noResponse = Status::newError(16);
inline constexpr Status noMapping = Status::newError(17);
inline constexpr Status timeout = Status::newError(18);
inline constexpr Status notStarted = Status::newError(19);
inline constexpr Status alreadyStarted = Status::newError(20);
inline constexpr Status aborted = Status::newError(21);
inline constexpr Status icmpError = Status::newError(22);
inline constexpr Status tftpError = Status::newError(23);
inline constexpr Status protocolError = Status::newError(24);
inline constexpr Status incompatibleVersion = Status::newError(25);
inline constexpr Status securityViolation = Status::newError(26);
inline constexpr Status crcError = Status::newError(27);
inline constexpr Status endOfMedia = Status::newError(28);
inline constexpr Status endOfFile = Status::newError(31);
inline constexpr Status invalidLanguage = Status::newError(32);
inline constexpr Status compromisedData = Status::newError(33);
inline constexpr Status ipAddressConflict = Status::newError(34);
inline constexpr Status httpError = Status::newError(35);

// Appendix D, warning codes.
inline constexpr Status warnUnknownGlyph = Status::newWarn(1);
inline constexpr Status warnDeleteFailure = Status::newWarn(2);
inline constexpr Status warnWriteFailure = Status::newWarn(3);
inline constexpr Status warnBufferTooSmall = Status::newWarn(4);
inline constexpr Status warnStaleData = Status::newWarn(5);
inline constexpr Status warnFileSystem = Status::newWarn(6);
inline constexpr Status warnResetRequired = Status::newWarn(7);

} // namespace status

// Wraps a raw status returned by firmware.
constexpr Status fromRaw(efi_status s) { return Status{s}; }

// Panics if s is not success. Only for call sites that cannot continue otherwise.
void BOOTSVC_CHECK(Status s, std::source_location loc = std::source_location::current());

} // namespace bootsvc
