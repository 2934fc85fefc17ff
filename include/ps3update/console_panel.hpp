#pragma once

#include "download_manager.hpp"
#include "progress.hpp"

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace ps3update {

// Redraws a block of progress lines in place until every watched job is done.
class ConsolePanel {
public:
    ConsolePanel(const DownloadManager& manager, std::ostream& out,
                 std::chrono::milliseconds refresh = std::chrono::milliseconds(200));

    // Blocks until all jobs are terminal; returns false if any of them did not finish Done.
    bool watch(const std::vector<std::string>& job_ids);

    [[nodiscard]] std::string buildPanel(const std::vector<std::string>& job_ids) const;
    [[nodiscard]] static std::string formatJobLine(const Progress& progress);

private:
    void redraw(const std::string& panel);

    const DownloadManager& manager_;
    std::ostream& out_;
    std::chrono::milliseconds refresh_;
    std::size_t previous_lines_{0};
};

} // namespace ps3update
