#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace ps3update {

enum class ErrorKind {
    InvalidTitleId,
    NetworkError,
    XmlParse,
    NoUpdatesFound,
    JobNotFound,
    IoError,
    Cancelled,
    Config,
    // Never leaves the download manager; it only selects the Direct fallback.
    RangeUnsupported
};

inline constexpr char kCancelledMessage[] = "Download cancelled";

[[nodiscard]] const char* errorKindLabel(ErrorKind kind) noexcept;

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& detail);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

template <typename... Args>
[[nodiscard]] Error makeError(ErrorKind kind, fmt::format_string<Args...> format, Args&&... args) {
    return Error(kind, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace ps3update
