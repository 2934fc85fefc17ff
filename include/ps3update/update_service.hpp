#pragma once

#include "config.hpp"
#include "download_manager.hpp"
#include "package.hpp"
#include "progress.hpp"
#include "update_fetcher.hpp"

#include <filesystem>
#include <string>

namespace ps3update {

// The command surface consumed by front ends: one fetcher and one download manager
// sharing a Config.
class UpdateService {
public:
    explicit UpdateService(Config config = {});

    [[nodiscard]] bool checkServerStatus() const;
    [[nodiscard]] FetchResult fetchUpdates(const std::string& title_id) const;

    // Saves into <download_path>/<game_title> (<title_id>)/<filename>.
    std::string startDownload(const std::string& url, const std::string& filename, const std::string& download_path,
                              const std::string& game_title, const std::string& title_id, bool multi_part);

    [[nodiscard]] Progress getDownloadProgress(const std::string& job_id) const;
    void cancelDownload(const std::string& job_id);
    bool removeDownloadJob(const std::string& job_id);

    [[nodiscard]] static std::filesystem::path destinationFor(const std::string& download_path,
                                                              const std::string& game_title,
                                                              const std::string& title_id,
                                                              const std::string& filename);

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    DownloadManager& manager() noexcept { return manager_; }

private:
    Config config_;
    UpdateFetcher fetcher_;
    DownloadManager manager_;
};

// $XDG_DOWNLOAD_DIR, then $HOME/Downloads, then the working directory.
[[nodiscard]] std::string defaultDownloadPath();

} // namespace ps3update
