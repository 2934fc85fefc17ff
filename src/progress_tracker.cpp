#include "ps3update/progress_tracker.hpp"
#include "ps3update/format.hpp"

#include <algorithm>
#include <utility>

namespace ps3update {

const char* jobStateLabel(JobState state) noexcept {
    switch (state) {
        case JobState::Created: return "Created";
        case JobState::Probing: return "Probing";
        case JobState::Running: return "Running";
        case JobState::Done: return "Done";
        case JobState::Failed: return "Failed";
        case JobState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

ProgressTracker::ProgressTracker(std::chrono::milliseconds speed_window) : window_(speed_window) {}

void ProgressTracker::setState(JobState state) {
    if (isTerminal(state)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isTerminal(state_)) {
        state_ = state;
    }
}

void ProgressTracker::setTotal(std::uint64_t total) {
    total_.store(total);
}

void ProgressTracker::setMode(DownloadMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    mode_ = mode;
}

void ProgressTracker::setPartCount(int parts) {
    parts_total_.store(std::max(1, parts));
    parts_finished_.store(0);
}

void ProgressTracker::addBytes(std::uint64_t count) {
    addBytes(count, Clock::now());
}

void ProgressTracker::addBytes(std::uint64_t count, Clock::time_point now) {
    if (count == 0) {
        return;
    }
    downloaded_.fetch_add(count);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!samples_.empty() && now - samples_.back().at < kSampleInterval) {
        return;
    }
    // Loaded under the lock so samples stay ordered by byte count.
    samples_.push_back({now, downloaded_.load()});
    while (samples_.size() > 1 && samples_.front().at + 2 * window_ < now) {
        samples_.pop_front();
    }
}

bool ProgressTracker::partFinished() {
    const int finished = ++parts_finished_;
    return finished == parts_total_.load();
}

bool ProgressTracker::finish(JobState terminal, std::optional<std::string> error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isTerminal(state_)) {
        return false;
    }
    state_ = terminal;
    error_ = std::move(error);
    if (terminal == JobState::Done && total_.load() == 0) {
        total_.store(downloaded_.load());
    }
    done_.store(true);
    return true;
}

JobState ProgressTracker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

double ProgressTracker::speedAt(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return speedLocked(now);
}

double ProgressTracker::speedLocked(Clock::time_point now) const {
    const auto oldest = std::find_if(samples_.begin(), samples_.end(),
                                     [&](const Sample& s) { return s.at + window_ >= now; });
    if (oldest == samples_.end()) {
        return 0.0;
    }
    const std::chrono::duration<double> elapsed = now - oldest->at;
    if (elapsed.count() <= 0.0) {
        return 0.0;
    }
    const std::uint64_t current = downloaded_.load();
    if (current <= oldest->bytes) {
        return 0.0;
    }
    return static_cast<double>(current - oldest->bytes) / elapsed.count();
}

Progress ProgressTracker::snapshot() const {
    Progress progress;
    std::lock_guard<std::mutex> lock(mutex_);
    progress.state = state_;
    progress.mode = mode_;
    progress.error = error_;
    progress.done = done_.load();
    progress.total_bytes = total_.load();
    progress.downloaded_bytes = downloaded_.load();

    if (progress.total_bytes > 0) {
        const double ratio = static_cast<double>(progress.downloaded_bytes) /
                             static_cast<double>(progress.total_bytes);
        progress.percent = std::clamp(ratio * 100.0, 0.0, 100.0);
    } else if (state_ == JobState::Done) {
        progress.percent = 100.0;
    }

    progress.speed_bytes_per_sec = progress.done ? 0.0 : speedLocked(Clock::now());
    progress.speed_human = formatSpeed(progress.speed_bytes_per_sec);
    return progress;
}

} // namespace ps3update
