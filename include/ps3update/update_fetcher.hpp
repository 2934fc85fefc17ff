#pragma once

#include "config.hpp"
#include "package.hpp"

#include <string>

namespace ps3update {

class UpdateFetcher {
public:
    explicit UpdateFetcher(Config config = {});

    // HEAD against the service base URL. Any HTTP answer counts as reachable;
    // transport failures yield false and are never thrown.
    [[nodiscard]] bool checkServerStatus() const;

    // Throws Error with kind InvalidTitleId, NetworkError, NoUpdatesFound or XmlParse.
    // A title without published packages yields an empty result list and no error.
    [[nodiscard]] FetchResult fetchUpdates(const std::string& raw_title_id) const;

    [[nodiscard]] std::string metadataUrl(const std::string& cleaned_title_id) const;

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    Config config_;
};

// Parses a title-patch XML document. Throws Error(XmlParse) on malformed input.
[[nodiscard]] FetchResult parseUpdateXml(const std::string& xml, const std::string& cleaned_title_id);

} // namespace ps3update
