#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace ps3update {

// "117.74 MB" style, binary units. Zero means "size not published" and yields "Unknown".
[[nodiscard]] std::string formatSize(std::uint64_t bytes);

// "1.50 MB/s"; zero or negative speeds yield "0 B/s".
[[nodiscard]] std::string formatSpeed(double bytes_per_second);

// Strips everything that is not alphanumeric and uppercases the rest.
// Throws Error(InvalidTitleId) when the result is not four letters followed by five digits.
[[nodiscard]] std::string cleanTitleId(std::string_view raw);

[[nodiscard]] bool isValidTitleId(std::string_view cleaned) noexcept;

// Dot-separated numeric comparison: "1.10" > "1.2" > "1.02".
// Returns <0, 0 or >0 like strcmp.
[[nodiscard]] int compareVersions(std::string_view lhs, std::string_view rhs);

// Last path segment of a URL without query or fragment, "update.pkg" when there is none.
[[nodiscard]] std::string filenameFromUrl(std::string_view url);

// Replaces characters that are not allowed in folder names on common filesystems.
[[nodiscard]] std::string sanitizeFolderName(std::string_view name);

} // namespace ps3update
