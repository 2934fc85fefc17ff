#include "ps3update/format.hpp"
#include "ps3update/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

#include <fmt/format.h>

namespace ps3update {

namespace {

constexpr std::size_t kTitleIdLength = 9;
constexpr std::size_t kTitleIdPrefixLength = 4;

std::vector<std::string_view> splitVersion(std::string_view version) {
    std::vector<std::string_view> parts;
    std::size_t begin = 0;
    while (true) {
        const auto dot = version.find('.', begin);
        if (dot == std::string_view::npos) {
            parts.push_back(version.substr(begin));
            break;
        }
        parts.push_back(version.substr(begin, dot - begin));
        begin = dot + 1;
    }
    return parts;
}

// Digits of a version component with leading zeros removed; "" means zero.
std::string numericDigits(std::string_view component) {
    std::string digits;
    for (const char ch : component) {
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            continue;
        }
        if (digits.empty() && ch == '0') {
            continue;
        }
        digits.push_back(ch);
    }
    return digits;
}

int compareNumeric(const std::string& lhs, const std::string& rhs) {
    if (lhs.size() != rhs.size()) {
        return lhs.size() < rhs.size() ? -1 : 1;
    }
    const int cmp = lhs.compare(rhs);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

} // namespace

std::string formatSize(std::uint64_t bytes) {
    if (bytes == 0) {
        return "Unknown";
    }

    static constexpr std::array<const char*, 5> units{"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", value, units[unit]);
}

std::string formatSpeed(double bytes_per_second) {
    if (!(bytes_per_second > 0.0)) {
        return "0 B/s";
    }
    return formatSize(static_cast<std::uint64_t>(bytes_per_second)) + "/s";
}

std::string cleanTitleId(std::string_view raw) {
    std::string cleaned;
    cleaned.reserve(raw.size());
    for (const char ch : raw) {
        const auto uch = static_cast<unsigned char>(ch);
        if (std::isalnum(uch) != 0) {
            cleaned.push_back(static_cast<char>(std::toupper(uch)));
        } else if (std::isspace(uch) == 0 && ch != '-' && ch != '_' && ch != '.' && ch != '/') {
            throw makeError(ErrorKind::InvalidTitleId, "'{}' contains invalid character '{}'", raw, ch);
        }
    }

    if (cleaned.empty()) {
        throw Error(ErrorKind::InvalidTitleId, "Empty or invalid Title ID");
    }
    if (!isValidTitleId(cleaned)) {
        throw makeError(ErrorKind::InvalidTitleId, "'{}' is not of the form ABCD12345", cleaned);
    }
    return cleaned;
}

bool isValidTitleId(std::string_view cleaned) noexcept {
    if (cleaned.size() != kTitleIdLength) {
        return false;
    }
    for (std::size_t i = 0; i < cleaned.size(); ++i) {
        const auto ch = static_cast<unsigned char>(cleaned[i]);
        if (i < kTitleIdPrefixLength) {
            if (ch < 'A' || ch > 'Z') {
                return false;
            }
        } else if (std::isdigit(ch) == 0) {
            return false;
        }
    }
    return true;
}

int compareVersions(std::string_view lhs, std::string_view rhs) {
    const auto left = splitVersion(lhs);
    const auto right = splitVersion(rhs);
    const std::size_t count = std::max(left.size(), right.size());

    for (std::size_t i = 0; i < count; ++i) {
        const std::string a = i < left.size() ? numericDigits(left[i]) : std::string{};
        const std::string b = i < right.size() ? numericDigits(right[i]) : std::string{};
        const int cmp = compareNumeric(a, b);
        if (cmp != 0) {
            return cmp;
        }
    }

    // Numerically equal ("1.2" vs "1.02"): fall back to the raw text so the order is total.
    const int raw = lhs.compare(rhs);
    return raw < 0 ? -1 : (raw > 0 ? 1 : 0);
}

std::string filenameFromUrl(std::string_view url) {
    const auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos) {
        url = url.substr(0, cut);
    }
    const auto scheme = url.find("://");
    if (scheme != std::string_view::npos) {
        const auto path = url.find('/', scheme + 3);
        url = path == std::string_view::npos ? std::string_view{} : url.substr(path);
    }

    const auto slash = url.find_last_of('/');
    const auto name = slash == std::string_view::npos ? url : url.substr(slash + 1);
    if (name.empty()) {
        return "update.pkg";
    }
    return std::string(name);
}

std::string sanitizeFolderName(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (const char ch : name) {
        switch (ch) {
            case '/':
            case '\\':
            case ':':
            case '*':
            case '?':
            case '"':
            case '<':
            case '>':
            case '|':
                out.push_back('_');
                break;
            default:
                out.push_back(ch);
                break;
        }
    }
    return out;
}

} // namespace ps3update
