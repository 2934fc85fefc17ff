#pragma once

#include "progress.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace ps3update {

// Aggregated state of one job. Byte counters are atomics so every part can add to them
// without contending on the mutex; the mutex guards state, error and speed samples.
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kDefaultSpeedWindow{3000};
    static constexpr std::chrono::milliseconds kSampleInterval{100};

    explicit ProgressTracker(std::chrono::milliseconds speed_window = kDefaultSpeedWindow);

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    // Non-terminal transitions only; ignored once the job is terminal.
    void setState(JobState state);
    void setTotal(std::uint64_t total);
    void setMode(DownloadMode mode);
    void setPartCount(int parts);

    void addBytes(std::uint64_t count);
    void addBytes(std::uint64_t count, Clock::time_point now);

    // True only for the call that brings the finished count up to the part count.
    bool partFinished();

    // Moves the job into a terminal state. Only the first call has any effect.
    bool finish(JobState terminal, std::optional<std::string> error = std::nullopt);

    [[nodiscard]] JobState state() const;
    [[nodiscard]] bool isDone() const noexcept { return done_.load(); }
    [[nodiscard]] std::uint64_t downloadedBytes() const noexcept { return downloaded_.load(); }
    [[nodiscard]] std::uint64_t totalBytes() const noexcept { return total_.load(); }

    // Bytes per second over the samples inside the window ending at `now`.
    [[nodiscard]] double speedAt(Clock::time_point now) const;

    // url and filename are left for the owner to fill in.
    [[nodiscard]] Progress snapshot() const;

private:
    struct Sample {
        Clock::time_point at;
        std::uint64_t bytes;
    };

    double speedLocked(Clock::time_point now) const;

    const std::chrono::milliseconds window_;

    std::atomic<std::uint64_t> total_{0};
    std::atomic<std::uint64_t> downloaded_{0};
    std::atomic<int> parts_total_{1};
    std::atomic<int> parts_finished_{0};
    std::atomic<bool> done_{false};

    mutable std::mutex mutex_;
    JobState state_{JobState::Created};
    DownloadMode mode_{};
    std::optional<std::string> error_;
    std::deque<Sample> samples_;
};

} // namespace ps3update
