#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ps3update {

enum class JobState { Created, Probing, Running, Done, Failed, Cancelled };

[[nodiscard]] const char* jobStateLabel(JobState state) noexcept;

[[nodiscard]] inline bool isTerminal(JobState state) noexcept {
    return state == JobState::Done || state == JobState::Failed || state == JobState::Cancelled;
}

struct DownloadMode {
    enum class Kind { Direct, MultiPart };

    Kind kind{Kind::Direct};
    int parts{1};

    [[nodiscard]] static DownloadMode direct() { return {Kind::Direct, 1}; }
    [[nodiscard]] static DownloadMode multiPart(int parts) { return {Kind::MultiPart, parts < 1 ? 1 : parts}; }

    [[nodiscard]] bool isMultiPart() const noexcept { return kind == Kind::MultiPart; }
};

struct Progress {
    std::string url;
    std::string filename;
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};
    double percent{0.0};
    double speed_bytes_per_sec{0.0};
    std::string speed_human{"0 B/s"};
    JobState state{JobState::Created};
    // Mode actually used; differs from the requested one after a fallback.
    DownloadMode mode{};
    bool done{false};
    std::optional<std::string> error;
};

} // namespace ps3update
