#include "ps3update/download_manager.hpp"
#include "ps3update/detail/curl_utils.hpp"
#include "ps3update/errors.hpp"
#include "ps3update/multi_downloader.hpp"

#include <memory>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace ps3update {

namespace {

void ensureWritableDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw makeError(ErrorKind::IoError, "cannot create {}: {}", dir.string(), ec.message());
    }
    if (::access(dir.c_str(), W_OK) != 0) {
        throw makeError(ErrorKind::IoError, "directory {} is not writable", dir.string());
    }
}

} // namespace

DownloadManager::DownloadManager(Config config)
    : config_(std::move(config)), id_engine_(std::random_device{}()) {}

DownloadManager::~DownloadManager() {
    std::unordered_map<std::string, JobEntry> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs.swap(jobs_);
    }

    for (auto& [id, entry] : jobs) {
        if (entry.task && !isTerminal(entry.task->state())) {
            spdlog::debug("DownloadManager: cancelling job {} on shutdown", id);
            entry.task->cancel();
        }
    }
    for (auto& [id, entry] : jobs) {
        if (entry.worker.joinable()) {
            entry.worker.join();
        }
    }
}

std::string DownloadManager::startDownload(const std::string& url, const std::filesystem::path& destination,
                                           DownloadMode mode) {
    const auto parent = destination.has_parent_path() ? destination.parent_path() : std::filesystem::path(".");
    ensureWritableDirectory(parent);
    detail::ensureCurlInitialized();

    auto task = std::make_shared<MultiDownloader>(url, destination, mode, config_);

    std::lock_guard<std::mutex> lock(mutex_);
    std::string job_id = makeJobIdLocked();
    JobEntry& entry = jobs_[job_id];
    entry.task = task;
    try {
        entry.worker = std::thread([task]() { task->start(); });
    } catch (const std::system_error& ex) {
        jobs_.erase(job_id);
        throw makeError(ErrorKind::IoError, "cannot start a worker for {}: {}", destination.string(), ex.what());
    }

    spdlog::info("DownloadManager: job {} started for {} -> {} ({})", job_id, url, destination.string(),
                 mode.isMultiPart() ? fmt::format("{} parts", mode.parts) : std::string("direct"));
    return job_id;
}

Progress DownloadManager::getProgress(const std::string& job_id) const {
    return findTask(job_id)->getProgress();
}

void DownloadManager::cancelDownload(const std::string& job_id) {
    const auto task = findTask(job_id);
    if (isTerminal(task->state())) {
        return;
    }
    task->cancel();
}

bool DownloadManager::removeJob(const std::string& job_id) {
    JobEntry removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            return true;
        }
        if (!isTerminal(it->second.task->state())) {
            spdlog::warn("DownloadManager: job {} is still active and was not removed", job_id);
            return false;
        }
        removed = std::move(it->second);
        jobs_.erase(it);
    }

    // A cancelled job can still be unwinding its transfer; join outside the registry lock.
    if (removed.worker.joinable()) {
        removed.worker.join();
    }
    return true;
}

std::vector<std::string> DownloadManager::jobIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(jobs_.size());
    for (const auto& [id, entry] : jobs_) {
        ids.push_back(id);
    }
    return ids;
}

std::string DownloadManager::makeJobIdLocked() {
    std::string id;
    do {
        id = fmt::format("{:016x}", id_engine_());
    } while (jobs_.count(id) != 0);
    return id;
}

DownloadTaskPtr DownloadManager::findTask(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        throw Error(ErrorKind::JobNotFound, job_id);
    }
    return it->second.task;
}

} // namespace ps3update
