#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ps3update {

struct PackageDescriptor {
    std::string version;
    std::string system_version;
    std::uint64_t size_bytes{0};
    std::string size_human;
    std::string url;
    std::string sha1; // may be empty
    std::string filename;
};

struct FetchResult {
    std::string game_title;
    std::string cleaned_title_id;
    // Newest version first.
    std::vector<PackageDescriptor> results;
    std::optional<std::string> error;
};

} // namespace ps3update
