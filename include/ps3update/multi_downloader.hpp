#pragma once

#include "config.hpp"
#include "download_task.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ps3update {

struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0}; // exclusive

    [[nodiscard]] std::uint64_t size() const noexcept { return end - start; }
};

// Splits [0, total) into min(parts, total) contiguous ranges of size total / parts;
// the last range takes the remainder.
[[nodiscard]] std::vector<ByteRange> splitRanges(std::uint64_t total, int parts);

class MultiDownloader final : public DownloadTask {
public:
    MultiDownloader(std::string url, std::filesystem::path destination, DownloadMode mode, Config config);
    ~MultiDownloader() override;

    void start() override;
    void cancel() override;
    [[nodiscard]] Progress getProgress() const override;
    [[nodiscard]] JobState state() const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ps3update
