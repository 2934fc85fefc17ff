#include "ps3update/update_service.hpp"
#include "ps3update/format.hpp"

#include <cstdlib>
#include <utility>

#include <fmt/format.h>

namespace ps3update {

UpdateService::UpdateService(Config config)
    : config_(std::move(config)), fetcher_(config_), manager_(config_) {}

bool UpdateService::checkServerStatus() const {
    return fetcher_.checkServerStatus();
}

FetchResult UpdateService::fetchUpdates(const std::string& title_id) const {
    return fetcher_.fetchUpdates(title_id);
}

std::string UpdateService::startDownload(const std::string& url, const std::string& filename,
                                         const std::string& download_path, const std::string& game_title,
                                         const std::string& title_id, bool multi_part) {
    const auto destination = destinationFor(download_path, game_title, title_id, filename);
    const DownloadMode mode = multi_part ? DownloadMode::multiPart(config_.default_parts) : DownloadMode::direct();
    return manager_.startDownload(url, destination, mode);
}

Progress UpdateService::getDownloadProgress(const std::string& job_id) const {
    return manager_.getProgress(job_id);
}

void UpdateService::cancelDownload(const std::string& job_id) {
    manager_.cancelDownload(job_id);
}

bool UpdateService::removeDownloadJob(const std::string& job_id) {
    return manager_.removeJob(job_id);
}

std::filesystem::path UpdateService::destinationFor(const std::string& download_path, const std::string& game_title,
                                                    const std::string& title_id, const std::string& filename) {
    const std::string folder = sanitizeFolderName(fmt::format("{} ({})", game_title, title_id));
    const std::string name = filename.empty() ? std::string("update.pkg") : filename;
    return std::filesystem::path(download_path) / folder / name;
}

std::string defaultDownloadPath() {
    if (const char* xdg = std::getenv("XDG_DOWNLOAD_DIR"); xdg && *xdg) {
        return xdg;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (std::filesystem::path(home) / "Downloads").string();
    }
    return std::filesystem::current_path().string();
}

} // namespace ps3update
