#include <bootsvc/debug.hpp>
#include <bootsvc/status.hpp>

namespace bootsvc {

namespace {

struct NamedStatus {
	Status status;
	const char *name;
};

constexpr NamedStatus namedStatuses[] = {
	{status::success, "SUCCESS"},
	{status::loadError, "LOAD_ERROR"},
	{status::invalidParameter, "INVALID_PARAMETER"},
	{status::unsupported, "UNSUPPORTED"},
	{status::badBufferSize, "BAD_BUFFER_SIZE"},
	{status::bufferTooSmall, "BUFFER_TOO_SMALL"},
	{status::notReady, "NOT_READY"},
	{status::deviceError, "DEVICE_ERROR"},
	{status::writeProtected, "WRITE_PROTECTED"},
	{status::outOfResources, "OUT_OF_RESOURCES"},
	{status::volumeCorrupted, "VOLUME_CORRUPTED"},
	{status::volumeFull, "VOLUME_FULL"},
	{status::noMedia, "NO_MEDIA"},
	{status::mediaChanged, "MEDIA_CHANGED"},
	{status::notFound, "NOT_FOUND"},
	{status::accessDenied, "ACCESS_DENIED"},
	{status::noResponse, "NO_RESPONSE"},
	{status::noMapping, "NO_MAPPING"},
	{status::timeout, "TIMEOUT"},
	{status::notStarted, "NOT_STARTED"},
	{status::alreadyStarted, "ALREADY_STARTED"},
	{status::aborted, "ABORTED"},
	{status::icmpError, "ICMP_ERROR"},
	{status::tftpError, "TFTP_ERROR"},
	{status::protocolError, "PROTOCOL_ERROR"},
	{status::incompatibleVersion, "INCOMPATIBLE_VERSION"},
	{status::securityViolation, "SECURITY_VIOLATION"},
	{status::crcError, "CRC_ERROR"},
	{status::endOfMedia, "END_OF_MEDIA"},
	{status::endOfFile, "END_OF_FILE"},
	{status::invalidLanguage, "INVALID_LANGUAGE"},
	{status::compromisedData, "COMPROMISED_DATA"},
	{status::ipAddressConflict, "IP_ADDRESS_CONFLICT"},
	{status::httpError, "HTTP_ERROR"},
	{status::warnUnknownGlyph, "WARN_UNKNOWN_GLYPH"},
	{status::warnDeleteFailure, "WARN_DELETE_FAILURE"},
	{status::warnWriteFailure, "WARN_WRITE_FAILURE"},
	{status::warnBufferTooSmall, "WARN_BUFFER_TOO_SMALL"},
	{status::warnStaleData, "WARN_STALE_DATA"},
	{status::warnFileSystem, "WARN_FILE_SYSTEM"},
	{status::warnResetRequired, "WARN_RESET_REQUIRED"},
};

} // anonymous namespace

const char *Status::name() const {
	for (const auto &entry : namedStatuses) {
		if (entry.status == *this)
			return entry.name;
	}
	return nullptr;
}

void BOOTSVC_CHECK(Status s, std::source_location loc) {
	if (s.isSuccess())
		return;

	auto name = s.name();
	panicLogger() << "bootsvc: unexpected EFI status 0x" << frg::hex_fmt{s.value()} << " ("
	              << (name ? name : "unknown") << ") in " << loc.function_name() << " at "
	              << loc.file_name() << ":" << loc.line() << frg::endlog;
}

} // namespace bootsvc
