#include "ps3update/update_fetcher.hpp"
#include "ps3update/detail/curl_utils.hpp"
#include "ps3update/errors.hpp"
#include "ps3update/format.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <pugixml.hpp>
#include <spdlog/spdlog.h>

namespace ps3update {

namespace {

constexpr char kUnknownTitle[] = "Unknown Title";
constexpr char kUnknownVersion[] = "Unknown";

bool nameIs(const pugi::xml_node& node, const char* name) {
    const char* actual = node.name();
    const std::size_t len = std::strlen(name);
    if (std::strlen(actual) != len) {
        return false;
    }
    for (std::size_t i = 0; i < len; ++i) {
        if (std::tolower(static_cast<unsigned char>(actual[i])) != std::tolower(static_cast<unsigned char>(name[i]))) {
            return false;
        }
    }
    return true;
}

pugi::xml_node childNamed(const pugi::xml_node& parent, const char* name) {
    for (const pugi::xml_node& child : parent.children()) {
        if (child.type() == pugi::node_element && nameIs(child, name)) {
            return child;
        }
    }
    return {};
}

void collectPackages(const pugi::xml_node& parent, std::vector<pugi::xml_node>& out) {
    for (const pugi::xml_node& child : parent.children()) {
        if (child.type() == pugi::node_element && nameIs(child, "package")) {
            out.push_back(child);
        }
    }
}

std::string trimmed(std::string s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string attributeText(const pugi::xml_node& node, const char* name) {
    return trimmed(node.attribute(name).as_string());
}

std::string titleOf(const pugi::xml_document& doc, const std::vector<pugi::xml_node>& packages) {
    if (!packages.empty()) {
        const auto paramsfo = childNamed(packages.front(), "paramsfo");
        if (paramsfo) {
            auto title = trimmed(childNamed(paramsfo, "TITLE").child_value());
            if (!title.empty()) {
                return title;
            }
        }
    }

    const auto anyTitle = doc.find_node([](const pugi::xml_node& node) {
        return node.type() == pugi::node_element && nameIs(node, "TITLE");
    });
    auto title = trimmed(anyTitle.child_value());
    return title.empty() ? std::string(kUnknownTitle) : title;
}

PackageDescriptor toDescriptor(const pugi::xml_node& package) {
    PackageDescriptor desc;
    desc.url = attributeText(package, "url");
    desc.version = attributeText(package, "version");
    if (desc.version.empty()) {
        desc.version = kUnknownVersion;
    }
    desc.system_version = attributeText(package, "ps3_system_ver");

    for (const char* hashAttr : {"sha1sum", "digest", "sha1"}) {
        desc.sha1 = attributeText(package, hashAttr);
        if (!desc.sha1.empty()) {
            break;
        }
    }

    const auto size = attributeText(package, "size");
    const bool numeric = !size.empty() &&
                         std::all_of(size.begin(), size.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
    desc.size_bytes = numeric ? package.attribute("size").as_ullong(0) : 0;
    desc.size_human = formatSize(desc.size_bytes);
    desc.filename = filenameFromUrl(desc.url);
    return desc;
}

} // namespace

UpdateFetcher::UpdateFetcher(Config config) : config_(std::move(config)) {}

std::string UpdateFetcher::metadataUrl(const std::string& cleaned_title_id) const {
    return fmt::format("{0}/tpl/np/{1}/{1}-ver.xml", config_.update_base_url, cleaned_title_id);
}

bool UpdateFetcher::checkServerStatus() const {
    try {
        const auto response = detail::httpHead(config_.update_base_url, config_, config_.status_timeout_seconds);
        spdlog::debug("UpdateFetcher: server answered HTTP {}", response.status);
        return true;
    } catch (const std::exception& ex) {
        spdlog::info("UpdateFetcher: server unreachable: {}", ex.what());
        return false;
    }
}

FetchResult UpdateFetcher::fetchUpdates(const std::string& raw_title_id) const {
    const std::string cleaned = cleanTitleId(raw_title_id);
    const std::string url = metadataUrl(cleaned);
    spdlog::info("UpdateFetcher: fetching {}", url);

    const auto response = detail::httpGet(url, config_, config_.fetch_timeout_seconds);
    if (response.status < 200 || response.status >= 300) {
        spdlog::info("UpdateFetcher: {} answered HTTP {}", cleaned, response.status);
        throw Error(ErrorKind::NoUpdatesFound, cleaned);
    }
    if (response.body.find_first_not_of(" \t\r\n") == std::string::npos) {
        spdlog::info("UpdateFetcher: empty metadata for {}", cleaned);
        throw Error(ErrorKind::NoUpdatesFound, cleaned);
    }

    auto result = parseUpdateXml(response.body, cleaned);
    spdlog::info("UpdateFetcher: {} '{}' has {} package(s)", cleaned, result.game_title, result.results.size());
    return result;
}

FetchResult parseUpdateXml(const std::string& xml, const std::string& cleaned_title_id) {
    pugi::xml_document doc;
    const pugi::xml_parse_result parsed = doc.load_buffer(xml.data(), xml.size());
    if (!parsed) {
        throw makeError(ErrorKind::XmlParse, "{} at offset {}", parsed.description(), parsed.offset);
    }
    const pugi::xml_node root = doc.document_element();
    if (!root) {
        throw Error(ErrorKind::XmlParse, "document has no root element");
    }

    std::vector<pugi::xml_node> packages;
    for (const pugi::xml_node& child : root.children()) {
        if (child.type() == pugi::node_element && nameIs(child, "tag")) {
            collectPackages(child, packages);
        }
    }
    if (packages.empty()) {
        collectPackages(root, packages);
    }

    FetchResult result;
    result.cleaned_title_id = cleaned_title_id;
    result.game_title = titleOf(doc, packages);
    result.results.reserve(packages.size());
    for (const auto& package : packages) {
        result.results.push_back(toDescriptor(package));
    }

    std::stable_sort(result.results.begin(), result.results.end(),
                     [](const PackageDescriptor& a, const PackageDescriptor& b) {
                         return compareVersions(a.version, b.version) > 0;
                     });
    return result;
}

} // namespace ps3update
