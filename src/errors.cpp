#include "ps3update/errors.hpp"

namespace ps3update {

namespace {

std::string composeMessage(ErrorKind kind, const std::string& detail) {
    switch (kind) {
        case ErrorKind::InvalidTitleId: return "Invalid title ID: " + detail;
        case ErrorKind::NetworkError: return "Network error: " + detail;
        case ErrorKind::XmlParse: return "XML parsing error: " + detail;
        case ErrorKind::NoUpdatesFound: return "No updates found for title ID: " + detail;
        case ErrorKind::JobNotFound: return "Job not found: " + detail;
        case ErrorKind::IoError: return "File system error: " + detail;
        case ErrorKind::Cancelled: return kCancelledMessage;
        case ErrorKind::Config: return "Configuration error: " + detail;
        case ErrorKind::RangeUnsupported: return "Range requests unsupported: " + detail;
    }
    return detail;
}

} // namespace

const char* errorKindLabel(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidTitleId: return "InvalidTitleId";
        case ErrorKind::NetworkError: return "NetworkError";
        case ErrorKind::XmlParse: return "XmlParse";
        case ErrorKind::NoUpdatesFound: return "NoUpdatesFound";
        case ErrorKind::JobNotFound: return "JobNotFound";
        case ErrorKind::IoError: return "IoError";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::Config: return "Config";
        case ErrorKind::RangeUnsupported: return "RangeUnsupported";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& detail)
    : std::runtime_error(composeMessage(kind, detail)), kind_(kind), detail_(detail) {}

} // namespace ps3update
