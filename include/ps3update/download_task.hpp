#pragma once

#include "progress.hpp"

#include <memory>

namespace ps3update {

class DownloadTask {
public:
    virtual ~DownloadTask() = default;

    // Runs the whole transfer on the calling thread; returns once the job is terminal.
    virtual void start() = 0;
    // Cooperative: safe from any thread, returns without waiting for the parts to stop.
    virtual void cancel() = 0;
    [[nodiscard]] virtual Progress getProgress() const = 0;
    [[nodiscard]] virtual JobState state() const = 0;
};

using DownloadTaskPtr = std::shared_ptr<DownloadTask>;

} // namespace ps3update
