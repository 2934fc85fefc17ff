#include "ps3update/multi_downloader.hpp"
#include "ps3update/detail/curl_utils.hpp"
#include "ps3update/errors.hpp"
#include "ps3update/progress_tracker.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace ps3update {

std::vector<ByteRange> splitRanges(std::uint64_t total, int parts) {
    std::vector<ByteRange> ranges;
    if (total == 0) {
        return ranges;
    }

    const std::uint64_t count = std::min<std::uint64_t>(static_cast<std::uint64_t>(std::max(1, parts)), total);
    const std::uint64_t part_size = total / count;
    ranges.reserve(count);
    for (std::uint64_t i = 0; i < count; ++i) {
        const std::uint64_t start = i * part_size;
        const std::uint64_t end = (i + 1 == count) ? total : start + part_size;
        ranges.push_back({start, end});
    }
    return ranges;
}

class MultiDownloader::Impl {
public:
    Impl(std::string url, std::filesystem::path destination, DownloadMode mode, Config config)
        : url_(std::move(url)),
          destination_(std::move(destination)),
          name_(destination_.filename().string()),
          requested_mode_(mode),
          config_(std::move(config)) {
        tracker_.setMode(requested_mode_);
    }

    void start() {
        try {
            run();
        } catch (const std::exception& ex) {
            failJob(ex.what());
        }
        file_.reset();

        if (!tracker_.isDone()) {
            failJob("transfer ended without a result");
        }
    }

    void cancel() {
        bool expected = false;
        if (!cancel_requested_.compare_exchange_strong(expected, true)) {
            return;
        }
        wakeWaiters();
        if (tracker_.finish(JobState::Cancelled, std::string(kCancelledMessage))) {
            spdlog::info("Job {}: cancelled at {} bytes", name_, tracker_.downloadedBytes());
        }
    }

    [[nodiscard]] Progress getProgress() const {
        Progress progress = tracker_.snapshot();
        progress.url = url_;
        progress.filename = name_;
        return progress;
    }

    [[nodiscard]] JobState state() const { return tracker_.state(); }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    struct ResourceInfo {
        bool supports_range{false};
        std::uint64_t content_length{0};
    };

    enum class PartOutcome { Completed, Failed, Aborted, RangeIgnored };

    // One transfer stream: a byte range of a MultiPart job, or the whole file in Direct mode.
    struct TransferContext {
        Impl* owner{nullptr};
        CURL* curl{nullptr};
        bool multipart{false};
        bool resumable{false};
        std::uint64_t begin{0};
        std::uint64_t end{0}; // exclusive; 0 when unknown
        std::uint64_t offset{0};
        // Highest offset already counted into the tracker.
        std::uint64_t high_water{0};
        bool ranged_request{false};
        bool checked_status{false};
        bool range_ignored{false};
        bool write_failed{false};
        std::string write_error;
    };

    void run() {
        if (stopRequested()) {
            return;
        }
        tracker_.setState(JobState::Probing);
        const ResourceInfo info = probe(requested_mode_.isMultiPart());
        if (stopRequested()) {
            return;
        }

        DownloadMode mode = requested_mode_;
        if (mode.isMultiPart()) {
            std::string reason;
            if (!info.supports_range) {
                reason = "server does not accept byte ranges";
            } else if (info.content_length == 0) {
                reason = "resource length is unknown";
            } else if (info.content_length < config_.min_multipart_bytes) {
                reason = "resource is too small to split";
            } else if (mode.parts < 2) {
                reason = "only one part requested";
            }
            if (!reason.empty()) {
                spdlog::info("Job {}: {}, using a single stream", name_, reason);
                mode = DownloadMode::direct();
            }
        }
        if (info.content_length > 0) {
            tracker_.setTotal(info.content_length);
        }

        file_.reset(std::fopen(destination_.c_str(), "wb"));
        if (!file_) {
            failJob(Error(ErrorKind::IoError,
                          fmt::format("cannot create {}: {}", destination_.string(), std::strerror(errno)))
                        .what());
            return;
        }

        if (mode.isMultiPart() &&
            ftruncate(fileno(file_.get()), static_cast<off_t>(info.content_length)) == -1) {
            spdlog::info("Job {}: cannot pre-size file ({}), using a single stream", name_, std::strerror(errno));
            mode = DownloadMode::direct();
        }

        ResourceInfo direct_info = info;
        std::uint64_t counted = 0;
        if (mode.isMultiPart()) {
            try {
                downloadMultiPart(info.content_length, mode.parts);
                return;
            } catch (const Error& ex) {
                if (ex.kind() != ErrorKind::RangeUnsupported) {
                    throw;
                }
                spdlog::info("Job {}: {}, restarting as a single stream", name_, ex.what());
            }
            if (ftruncate(fileno(file_.get()), 0) == -1) {
                failJob(makeError(ErrorKind::IoError, "cannot truncate {}: {}", destination_.string(),
                                  std::strerror(errno))
                            .what());
                return;
            }
            direct_info.supports_range = false;
            counted = tracker_.downloadedBytes();
        }

        tracker_.setMode(DownloadMode::direct());
        tracker_.setState(JobState::Running);
        downloadDirect(direct_info, counted);
    }

    // With confirm_ranges set, range support is only trusted after a 206 to the trial request.
    [[nodiscard]] ResourceInfo probe(bool confirm_ranges) {
        ResourceInfo meta;
        try {
            detail::ensureCurlInitialized();
            {
                detail::CurlHandle curl = detail::makeCurlHandle();
                std::string headers;
                detail::applyCommonOptions(curl.get(), config_);
                curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
                curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
                curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config_.fetch_timeout_seconds);
                curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &detail::appendToString);
                curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);
                installStopHook(curl.get());

                const CURLcode res = curl_easy_perform(curl.get());
                long code = 0;
                curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
                if (res == CURLE_OK && code >= 200 && code < 300) {
                    curl_off_t length = -1;
                    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
                    meta.content_length = static_cast<std::uint64_t>(std::max<curl_off_t>(0, length));

                    if (const auto accept = detail::findHeader(headers, "Accept-Ranges")) {
                        std::string value = *accept;
                        std::transform(value.begin(), value.end(), value.begin(),
                                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
                        meta.supports_range = value.find("bytes") != std::string::npos;
                    }
                } else {
                    spdlog::debug("Job {}: HEAD probe gave {} / HTTP {}", name_, curl_easy_strerror(res), code);
                }
            }

            if (!stopRequested() && (confirm_ranges || !meta.supports_range || meta.content_length == 0)) {
                probeWithTrialRange(meta);
            }
        } catch (const std::exception& ex) {
            spdlog::warn("Job {}: probe failed: {}", name_, ex.what());
        }

        spdlog::debug("Job {}: length={} ranges={}", name_, meta.content_length, meta.supports_range);
        return meta;
    }

    // Asks for the first byte only; a 206 answer proves range support and carries the total length.
    void probeWithTrialRange(ResourceInfo& meta) {
        detail::CurlHandle curl = detail::makeCurlHandle();
        std::string headers;
        std::size_t received = 0;
        detail::applyCommonOptions(curl.get(), config_);
        curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, "0-0");
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config_.fetch_timeout_seconds);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &detail::appendToString);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,
            +[](char*, size_t size, size_t nmemb, void* userdata) -> size_t {
                auto* seen = static_cast<std::size_t*>(userdata);
                *seen += size * nmemb;
                // A server ignoring the range streams the whole body; stop after the first chunk.
                return *seen > 1 ? 0 : size * nmemb;
            });
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &received);
        installStopHook(curl.get());

        const CURLcode res = curl_easy_perform(curl.get());
        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (code == 206) {
            meta.supports_range = true;
            if (const auto contentRange = detail::findHeader(headers, "Content-Range")) {
                const auto slash = contentRange->find('/');
                if (slash != std::string::npos && contentRange->compare(slash + 1, 1, "*") != 0) {
                    meta.content_length = std::strtoull(contentRange->c_str() + slash + 1, nullptr, 10);
                }
            }
        } else if (code == 200) {
            meta.supports_range = false;
            if (meta.content_length == 0) {
                curl_off_t length = -1;
                curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
                meta.content_length = static_cast<std::uint64_t>(std::max<curl_off_t>(0, length));
            }
        } else {
            meta.supports_range = false;
            spdlog::debug("Job {}: trial range request gave {} / HTTP {}", name_, curl_easy_strerror(res), code);
        }
    }

    void installStopHook(CURL* curl) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &Impl::xferInfoCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, this);
    }

    void downloadMultiPart(std::uint64_t total, int parts) {
        const auto ranges = splitRanges(total, parts);
        const int count = static_cast<int>(ranges.size());
        tracker_.setPartCount(count);
        tracker_.setMode(DownloadMode::multiPart(count));
        tracker_.setState(JobState::Running);
        spdlog::info("Job {}: {} bytes in {} parts", name_, total, count);

        std::vector<std::thread> workers;
        workers.reserve(ranges.size());
        try {
            for (const auto& range : ranges) {
                workers.emplace_back([this, range]() {
                    TransferContext ctx;
                    ctx.multipart = true;
                    ctx.resumable = true;
                    ctx.begin = range.start;
                    ctx.end = range.end;
                    ctx.offset = range.start;
                    ctx.high_water = range.start;
                    runTransfer(ctx);
                });
            }
        } catch (const std::system_error& ex) {
            failJob(fmt::format("cannot start part worker {} of {}: {}", workers.size() + 1, count, ex.what()));
        }

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }

        if (range_ignored_.load() && !cancel_requested_.load() && !tracker_.isDone()) {
            abort_parts_.store(false);
            throw Error(ErrorKind::RangeUnsupported, "server answered a part request with the whole resource");
        }
    }

    // counted: bytes already reported by an abandoned multi-part attempt.
    void downloadDirect(const ResourceInfo& info, std::uint64_t counted = 0) {
        tracker_.setPartCount(1);
        TransferContext ctx;
        ctx.resumable = info.supports_range;
        ctx.end = info.content_length;
        ctx.high_water = counted;
        runTransfer(ctx);
    }

    void runTransfer(TransferContext& ctx) {
        ctx.owner = this;
        std::string error;
        PartOutcome outcome = PartOutcome::Failed;
        try {
            outcome = transferWithRetries(ctx, error);
        } catch (const std::exception& ex) {
            error = ex.what();
        }

        switch (outcome) {
            case PartOutcome::Completed:
                if (tracker_.partFinished() && tracker_.finish(JobState::Done)) {
                    spdlog::info("Job {}: completed, {} bytes", name_, tracker_.downloadedBytes());
                }
                break;
            case PartOutcome::Failed:
                failJob(std::move(error));
                break;
            case PartOutcome::RangeIgnored:
                range_ignored_.store(true);
                abort_parts_.store(true);
                wakeWaiters();
                break;
            case PartOutcome::Aborted:
                break;
        }
    }

    PartOutcome transferWithRetries(TransferContext& ctx, std::string& error) {
        const int attempts = std::max(0, config_.max_retries) + 1;
        for (int attempt = 0; attempt < attempts; ++attempt) {
            if (stopRequested()) {
                return PartOutcome::Aborted;
            }
            if (attempt > 0) {
                if (ctx.end > 0 && ctx.offset >= ctx.end) {
                    return PartOutcome::Completed;
                }
                const auto delay = std::chrono::milliseconds(
                    static_cast<long long>(std::max(0, config_.retry_backoff_ms)) << std::min(attempt - 1, 10));
                spdlog::warn("Job {}: retry {}/{} at offset {} in {} ms: {}", name_, attempt, attempts - 1,
                             ctx.offset, delay.count(), error);
                if (!waitBackoff(delay)) {
                    return PartOutcome::Aborted;
                }
            }

            long status = 0;
            const CURLcode res = performOnce(ctx, status);

            if (ctx.write_failed) {
                error = ctx.write_error;
                return PartOutcome::Failed;
            }
            if (ctx.range_ignored) {
                spdlog::debug("Job {}: server ignored the range request for bytes {}-{}", name_, ctx.begin,
                              ctx.end - 1);
                return PartOutcome::RangeIgnored;
            }

            if (res == CURLE_OK) {
                if (status < 200 || status >= 300) {
                    error = Error(ErrorKind::NetworkError, fmt::format("unexpected HTTP status {}", status)).what();
                    return PartOutcome::Failed;
                }
                if (ctx.end > 0 && ctx.offset < ctx.end) {
                    error = Error(ErrorKind::NetworkError,
                                  fmt::format("stream ended at {} of {} bytes", ctx.offset, ctx.end))
                                .what();
                    continue;
                }
                return PartOutcome::Completed;
            }

            if (stopRequested()) {
                return PartOutcome::Aborted;
            }
            if (res == CURLE_HTTP_RETURNED_ERROR) {
                error = Error(ErrorKind::NetworkError, fmt::format("HTTP error: {}", status)).what();
                if (detail::isTransientHttpStatus(status)) {
                    continue;
                }
                return PartOutcome::Failed;
            }

            error = Error(ErrorKind::NetworkError, curl_easy_strerror(res)).what();
            if (!detail::isTransientCurlError(res)) {
                return PartOutcome::Failed;
            }
        }

        error = fmt::format("{} (gave up after {} attempts)", error, attempts);
        return PartOutcome::Failed;
    }

    CURLcode performOnce(TransferContext& ctx, long& status) {
        detail::CurlHandle curl = detail::makeCurlHandle();
        detail::applyCommonOptions(curl.get(), config_);

        std::string range;
        if (ctx.multipart) {
            range = fmt::format("{}-{}", ctx.offset, ctx.end - 1);
        } else if (ctx.resumable && ctx.offset > 0) {
            range = fmt::format("{}-", ctx.offset);
        } else {
            // Restarting without range support: rewrite from zero, high_water prevents double counting.
            ctx.offset = 0;
        }
        ctx.ranged_request = !range.empty();
        ctx.checked_status = false;
        ctx.curl = curl.get();

        curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
        if (ctx.ranged_request) {
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        }
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::xferInfoCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, this);

        const CURLcode res = curl_easy_perform(curl.get());
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        ctx.curl = nullptr;
        return res;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (!ctx || !ctx->owner) {
            return 0;
        }

        Impl& self = *ctx->owner;
        const size_t total = size * nmemb;
        if (total == 0 || self.stopRequested()) {
            return 0;
        }

        if (!ctx->checked_status) {
            ctx->checked_status = true;
            long code = 0;
            curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
            if (ctx->ranged_request && code == 200) {
                if (ctx->multipart) {
                    ctx->range_ignored = true;
                    return 0;
                }
                ctx->offset = 0;
            }
            if (!ctx->multipart && self.tracker_.totalBytes() == 0) {
                curl_off_t length = -1;
                curl_easy_getinfo(ctx->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
                if (length > 0) {
                    self.tracker_.setTotal(ctx->offset + static_cast<std::uint64_t>(length));
                }
            }
        }

        if (ctx->multipart && ctx->offset + total > ctx->end) {
            ctx->range_ignored = true;
            return 0;
        }

        if (!writeAt(fileno(self.file_.get()), ptr, total, ctx->offset)) {
            ctx->write_failed = true;
            ctx->write_error = Error(ErrorKind::IoError,
                                     fmt::format("write to {} failed: {}", self.destination_.string(),
                                                 std::strerror(errno)))
                                   .what();
            return 0;
        }

        ctx->offset += total;
        if (ctx->offset > ctx->high_water) {
            self.tracker_.addBytes(ctx->offset - ctx->high_water);
            ctx->high_water = ctx->offset;
        }
        return total;
    }

    static int xferInfoCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        const auto* self = static_cast<const Impl*>(clientp);
        return self && self->stopRequested() ? 1 : 0;
    }

    // Positional write; parts share one descriptor and never overlap, so no lock is needed.
    static bool writeAt(int fd, const char* data, size_t len, std::uint64_t offset) {
        size_t done = 0;
        while (done < len) {
            const ssize_t n = ::pwrite(fd, data + done, len - done, static_cast<off_t>(offset + done));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            if (n == 0) {
                return false;
            }
            done += static_cast<size_t>(n);
        }
        return true;
    }

    [[nodiscard]] bool stopRequested() const noexcept {
        return cancel_requested_.load() || abort_parts_.load();
    }

    bool waitBackoff(std::chrono::milliseconds delay) {
        std::unique_lock<std::mutex> lock(stop_mutex_);
        stop_cv_.wait_for(lock, delay, [this] { return stopRequested(); });
        return !stopRequested();
    }

    void wakeWaiters() {
        {
            std::lock_guard<std::mutex> lock(stop_mutex_);
        }
        stop_cv_.notify_all();
    }

    // The first failure wins; siblings see abort_parts_ and stop without reporting.
    void failJob(std::string error) {
        abort_parts_.store(true);
        wakeWaiters();
        if (tracker_.finish(JobState::Failed, error)) {
            spdlog::error("Job {}: failed: {}", name_, error);
        }
    }

    std::string url_;
    std::filesystem::path destination_;
    std::string name_;
    DownloadMode requested_mode_;
    Config config_;

    std::unique_ptr<FILE, FileDeleter> file_{};
    ProgressTracker tracker_;

    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> abort_parts_{false};
    std::atomic<bool> range_ignored_{false};
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
};

MultiDownloader::MultiDownloader(std::string url, std::filesystem::path destination, DownloadMode mode,
                                 Config config)
    : impl_(std::make_unique<Impl>(std::move(url), std::move(destination), mode, std::move(config))) {}

MultiDownloader::~MultiDownloader() = default;

void MultiDownloader::start() { impl_->start(); }

void MultiDownloader::cancel() { impl_->cancel(); }

Progress MultiDownloader::getProgress() const { return impl_->getProgress(); }

JobState MultiDownloader::state() const { return impl_->state(); }

} // namespace ps3update
