#pragma once

#include "config.hpp"
#include "download_task.hpp"

#include <filesystem>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ps3update {

// Registry of download jobs. Every job runs on its own worker thread; callers poll
// getProgress(). Destroying the manager cancels all jobs and joins their workers.
class DownloadManager {
public:
    explicit DownloadManager(Config config = {});
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Returns the new job id right away. Only the destination directory check throws
    // (Error(IoError)); transfer failures are reported through getProgress().
    std::string startDownload(const std::string& url, const std::filesystem::path& destination, DownloadMode mode);

    // Throws Error(JobNotFound) for an unknown id.
    [[nodiscard]] Progress getProgress(const std::string& job_id) const;

    // No-op for a job that already finished. Throws Error(JobNotFound) for an unknown id.
    void cancelDownload(const std::string& job_id);

    // Drops a finished job and joins its worker. Unknown ids are ignored; an active
    // job is left alone and false is returned.
    bool removeJob(const std::string& job_id);

    [[nodiscard]] std::vector<std::string> jobIds() const;

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    struct JobEntry {
        DownloadTaskPtr task;
        std::thread worker;
    };

    std::string makeJobIdLocked();
    DownloadTaskPtr findTask(const std::string& job_id) const;

    Config config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, JobEntry> jobs_;
    std::mt19937_64 id_engine_;
};

} // namespace ps3update
