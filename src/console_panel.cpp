#include "ps3update/console_panel.hpp"
#include "ps3update/format.hpp"

#include <algorithm>
#include <ostream>
#include <thread>

#include <fmt/format.h>

namespace ps3update {

namespace {

constexpr int kBarWidth = 30;
constexpr std::size_t kNameWidth = 24;

std::string modeLabel(const DownloadMode& mode) {
    return mode.isMultiPart() ? fmt::format("{}x", mode.parts) : std::string("1x");
}

} // namespace

ConsolePanel::ConsolePanel(const DownloadManager& manager, std::ostream& out, std::chrono::milliseconds refresh)
    : manager_(manager), out_(out), refresh_(refresh) {}

bool ConsolePanel::watch(const std::vector<std::string>& job_ids) {
    while (true) {
        redraw(buildPanel(job_ids));

        const bool active = std::any_of(job_ids.begin(), job_ids.end(), [this](const std::string& id) {
            return !manager_.getProgress(id).done;
        });
        if (!active) {
            break;
        }
        std::this_thread::sleep_for(refresh_);
    }
    out_ << std::flush;

    return std::all_of(job_ids.begin(), job_ids.end(), [this](const std::string& id) {
        return manager_.getProgress(id).state == JobState::Done;
    });
}

std::string ConsolePanel::buildPanel(const std::vector<std::string>& job_ids) const {
    std::string panel;
    panel.reserve(job_ids.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("ps3update ({} downloads)\n", job_ids.size());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    for (const auto& id : job_ids) {
        const auto progress = manager_.getProgress(id);
        panel += formatJobLine(progress);
        panel.push_back('\n');

        total_all += progress.total_bytes;
        downloaded_all += progress.downloaded_bytes;
    }

    panel.append("--------------------------------------------------\n");
    if (total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("Overall: {:>3}%", static_cast<int>(std::min(ratio, 1.0) * 100.0));
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");
    return panel;
}

std::string ConsolePanel::formatJobLine(const Progress& progress) {
    std::string name = progress.filename.empty() ? std::string("(unnamed)") : progress.filename;
    if (name.size() > kNameWidth) {
        name = name.substr(0, kNameWidth);
    }

    if (progress.state == JobState::Created || progress.state == JobState::Probing) {
        return fmt::format("{:<24} [Probing...]", name);
    }

    std::string line;
    line.reserve(256);
    if (progress.total_bytes > 0) {
        const int bar_pos = static_cast<int>(progress.percent / 100.0 * kBarWidth);
        std::string bar;
        bar.reserve(static_cast<std::size_t>(kBarWidth) * 3);
        for (int i = 0; i < kBarWidth; ++i) {
            bar += (i < bar_pos) ? u8"█" : u8"░";
        }
        line += fmt::format("{:<24} [{}] {:>3}% ({}/{})", name, bar, static_cast<int>(progress.percent),
                            formatSize(progress.downloaded_bytes), formatSize(progress.total_bytes));
    } else {
        line += fmt::format("{:<24} [{} received]", name, formatSize(progress.downloaded_bytes));
    }

    switch (progress.state) {
        case JobState::Done:
            line.append("  ✅ Done");
            break;
        case JobState::Failed:
        case JobState::Cancelled:
            line += fmt::format("  ❌ {}", progress.error.value_or(jobStateLabel(progress.state)));
            break;
        default:
            line += fmt::format("  {} {}", progress.speed_human, modeLabel(progress.mode));
            break;
    }
    return line;
}

void ConsolePanel::redraw(const std::string& panel) {
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel;
    previous_lines_ = current_lines;
}

} // namespace ps3update
