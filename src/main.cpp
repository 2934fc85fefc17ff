#include "ps3update/config.hpp"
#include "ps3update/console_panel.hpp"
#include "ps3update/errors.hpp"
#include "ps3update/format.hpp"
#include "ps3update/logging.hpp"
#include "ps3update/update_service.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <command> [arguments]\n"
              << "Commands:\n"
              << "  status                          Check that the update server answers\n"
              << "  fetch <title_id> [...]          List the update packages of one or more titles\n"
              << "  download <title_id> [version]   Download a package (default: newest)\n"
              << "  get <url> <file>                Download an arbitrary URL\n"
              << "Options:\n"
              << "  -d <directory>   Download directory (default: ~/Downloads)\n"
              << "  -t <parts>       Parts per download (default: 4)\n"
              << "  -c <file>        Config file (key=value)\n"
              << "  -l <level>       Log level: trace, debug, info, warn, error, off\n"
              << "  --direct         Use a single stream\n"
              << "  -h, --help       Show this message" << std::endl;
}

struct Options {
    std::optional<std::string> download_dir;
    std::optional<int> parts;
    std::string config_path;
    std::optional<std::string> log_level;
    bool direct{false};
    std::vector<std::string> args;
};

void printPackages(const ps3update::FetchResult& result) {
    std::cout << fmt::format("{} ({}): {} package(s)\n", result.game_title, result.cleaned_title_id,
                             result.results.size());
    for (const auto& pkg : result.results) {
        std::cout << fmt::format("  v{:<8} {:>12}  requires {:<8} {}\n", pkg.version, pkg.size_human,
                                 pkg.system_version.empty() ? "-" : pkg.system_version, pkg.filename);
    }
}

int runStatus(ps3update::UpdateService& service) {
    const bool reachable = service.checkServerStatus();
    std::cout << (reachable ? "Update server is reachable" : "Update server is unreachable") << std::endl;
    return reachable ? 0 : 1;
}

int runFetch(ps3update::UpdateService& service, const std::vector<std::string>& ids) {
    int status = 0;
    for (const auto& id : ids) {
        try {
            printPackages(service.fetchUpdates(id));
        } catch (const ps3update::Error& ex) {
            std::cout << fmt::format("{}: {}\n", id, ex.what());
            status = 1;
        }
    }
    std::cout << std::flush;
    return status;
}

int watchJob(ps3update::UpdateService& service, const std::string& job_id) {
    ps3update::ConsolePanel panel(service.manager(), std::cout);
    const bool ok = panel.watch({job_id});
    const auto progress = service.getDownloadProgress(job_id);
    service.removeDownloadJob(job_id);
    if (!ok) {
        std::cerr << "Download failed: " << progress.error.value_or("unknown error") << std::endl;
        return 1;
    }
    return 0;
}

int runDownload(ps3update::UpdateService& service, const Options& options, const std::string& download_dir) {
    const auto result = service.fetchUpdates(options.args[1]);
    if (result.results.empty()) {
        std::cerr << fmt::format("{} has no published updates", result.cleaned_title_id) << std::endl;
        return 1;
    }

    const ps3update::PackageDescriptor* chosen = &result.results.front();
    if (options.args.size() > 2) {
        const auto& wanted = options.args[2];
        const auto it = std::find_if(result.results.begin(), result.results.end(),
                                     [&](const ps3update::PackageDescriptor& pkg) { return pkg.version == wanted; });
        if (it == result.results.end()) {
            std::cerr << fmt::format("Version {} is not published for {}", wanted, result.cleaned_title_id)
                      << std::endl;
            return 1;
        }
        chosen = &*it;
    }

    const auto destination = ps3update::UpdateService::destinationFor(download_dir, result.game_title,
                                                                      result.cleaned_title_id, chosen->filename);
    std::cout << fmt::format("Downloading {} v{} ({}) to {}", result.game_title, chosen->version,
                             chosen->size_human, destination.string())
              << std::endl;

    const auto job_id = service.startDownload(chosen->url, chosen->filename, download_dir, result.game_title,
                                              result.cleaned_title_id, !options.direct);
    return watchJob(service, job_id);
}

int runGet(ps3update::UpdateService& service, const Options& options, const std::string& download_dir) {
    const std::filesystem::path destination = std::filesystem::path(download_dir) / options.args[2];
    const auto mode = options.direct ? ps3update::DownloadMode::direct()
                                     : ps3update::DownloadMode::multiPart(service.config().default_parts);
    const auto job_id = service.manager().startDownload(options.args[1], destination, mode);
    return watchJob(service, job_id);
}

} // namespace

int main(int argc, char** argv) {
    try {
        Options options;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];
            const bool takes_value = option == "-d" || option == "-t" || option == "-c" || option == "-l";

            if (takes_value && arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }

            if (option == "-d") {
                options.download_dir = argv[arg_index + 1];
            } else if (option == "-t") {
                try {
                    options.parts = std::stoi(argv[arg_index + 1]);
                } catch (const std::exception&) {
                    throw std::runtime_error("Invalid part count: " + std::string(argv[arg_index + 1]));
                }
                if (*options.parts <= 0 || *options.parts > 64) {
                    throw std::runtime_error("Part count must be between 1 and 64.");
                }
            } else if (option == "-c") {
                options.config_path = argv[arg_index + 1];
            } else if (option == "-l") {
                options.log_level = argv[arg_index + 1];
            } else if (option == "--direct") {
                options.direct = true;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
            arg_index += takes_value ? 2 : 1;
        }

        for (; arg_index < argc; ++arg_index) {
            options.args.emplace_back(argv[arg_index]);
        }
        if (options.args.empty()) {
            printUsage(argv[0]);
            return 1;
        }

        ps3update::Config config = ps3update::loadConfig(options.config_path);
        if (options.parts) {
            config.default_parts = *options.parts;
        }
        if (options.log_level) {
            config.log_level = *options.log_level;
        }
        if (options.download_dir) {
            config.download_dir = *options.download_dir;
        }
        ps3update::setupLogging(config.log_level);

        const std::string download_dir =
            config.download_dir.empty() ? ps3update::defaultDownloadPath() : config.download_dir;
        ps3update::UpdateService service(config);

        const std::string& command = options.args.front();
        if (command == "status" && options.args.size() == 1) {
            return runStatus(service);
        }
        if (command == "fetch" && options.args.size() >= 2) {
            return runFetch(service, {options.args.begin() + 1, options.args.end()});
        }
        if (command == "download" && (options.args.size() == 2 || options.args.size() == 3)) {
            return runDownload(service, options, download_dir);
        }
        if (command == "get" && options.args.size() == 3) {
            return runGet(service, options, download_dir);
        }

        printUsage(argv[0]);
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
