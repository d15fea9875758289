/*
 * designex - Design tool (dsx)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "designex/api.hpp"
#include "designex/config.hpp"
#include "designex/logger.hpp"
#include "designex/pipeline.hpp"
#include "designex/pool.hpp"
#include "designex/runner.hpp"
#include "designex/style_index.hpp"
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

using namespace designex;

constexpr const char* VERSION = "0.1.0";

// Lock-free, so safe to set from the signal handler
static std::atomic<bool> g_shutdown_requested{false};

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested.store(true);
}

void printUsage(const char* progName) {
    std::cout << "designex Design Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " design <image> --style <name> [--blend <0.0-1.0>]\n";
    std::cout << "       " << progName << " batch <image...> --style <name> [--blend <a>] [-w <n>]\n";
    std::cout << "       " << progName << " styles | regions\n";
    std::cout << "       " << progName << " recommend <style> <region>\n";
    std::cout << "       " << progName << " prune [--hours <n>]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  --style <name>        Design style to apply\n";
    std::cout << "  --blend <a>           Blend factor (worker default when omitted)\n";
    std::cout << "  -w, --workers <n>     Concurrent worker processes for batch\n";
    std::cout << "  --library <path>      Style library JSON\n";
    std::cout << "  --output <dir>        Artifact directory\n";
    std::cout << "  --worker <cmd>        Worker command, e.g. \"python3 python/seg.py\"\n";
    std::cout << "  --model <path>        Segmentation model checkpoint\n";
    std::cout << "  --timeout <sec>       Worker time limit\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "  -v, --version         Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  DESIGNEX_LOG_LEVEL          Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  DESIGNEX_WORKER             Worker command\n";
    std::cout << "  DESIGNEX_MODEL_PATH         Model checkpoint\n";
    std::cout << "  DESIGNEX_STYLE_LIBRARY      Style library JSON\n";
    std::cout << "  DESIGNEX_OUTPUT_DIR         Artifact directory\n";
    std::cout << "  DESIGNEX_JOB_TIMEOUT_SEC    Worker time limit (default 300)\n";
    std::cout << "  DESIGNEX_MAX_UPLOAD_BYTES   Upload size limit\n";
    std::cout << "  DESIGNEX_IMAGE_ROUTE        Prefix for returned image locators\n";
    std::cout << "  DESIGNEX_WORKERS            Batch workers (default 4)\n";
    std::cout << "  DESIGNEX_RETENTION_HOURS    Prune artifacts older than this at startup\n";
}

struct Options {
    std::string command;
    std::vector<std::string> positional;
    std::string style;
    std::optional<std::string> blend;
    std::optional<long> hours;
};

bool readFile(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    out.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return !file.bad();
}

// Prints an ApiResponse body to stdout; returns the process exit code
int emit(const ApiResponse& response) {
    if (response.status >= 400) {
        std::cerr << "Error (" << response.status << "): " << response.body << "\n";
        return 1;
    }
    std::cout << response.body << "\n";
    return 0;
}

int runDesign(Api& api, const Options& options) {
    if (options.positional.size() != 1) {
        std::cerr << "Error: design takes exactly one image\n";
        return 1;
    }
    std::string bytes;
    if (!readFile(options.positional.front(), bytes)) {
        std::cerr << "Error: Cannot read image: " << options.positional.front() << "\n";
        return 1;
    }
    return emit(api.postDesign(bytes, options.style, options.blend));
}

int runBatch(Api& api, const Options& options, int workers) {
    if (options.positional.empty()) {
        std::cerr << "Error: batch requires at least one image\n";
        return 1;
    }

    std::mutex outputMutex;
    std::atomic<int> failures{0};
    Pool pool(workers);
    bool started = pool.start([&](const std::string& image, int) {
        if (g_shutdown_requested.load()) {
            LOG_WARN("Shutdown requested, skipping " + image);
            failures.fetch_add(1);
            return;
        }
        std::string bytes;
        ApiResponse response;
        if (!readFile(image, bytes)) {
            LOG_ERROR("Cannot read image: " + image);
            failures.fetch_add(1);
            return;
        }
        response = api.postDesign(bytes, options.style, options.blend);
        std::lock_guard<std::mutex> lock(outputMutex);
        if (response.status >= 400) {
            failures.fetch_add(1);
            std::cerr << image << ": error (" << response.status << ") " << response.body << "\n";
        } else {
            std::cout << image << ": " << response.body << "\n" << std::flush;
        }
    });
    if (!started) {
        std::cerr << "Error: Failed to start worker pool\n";
        return 1;
    }

    for (const auto& image : options.positional) {
        if (!pool.submit(image)) {
            failures.fetch_add(1);
        }
    }
    pool.waitIdle();
    pool.stop();

    int failed = failures.load();
    if (failed > 0) {
        std::cerr << failed << " of " << options.positional.size() << " image(s) failed\n";
    }
    return failed > 0 ? 1 : 0;
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    Config config = Config::fromEnv();
    Options options;
    options.command = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << flag << " requires a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        try {
            if (arg == "--style" || arg == "-s") {
                auto v = next("--style"); if (!v) return 1;
                options.style = *v;
            } else if (arg == "--blend" || arg == "-b") {
                auto v = next("--blend"); if (!v) return 1;
                options.blend = *v;
            } else if (arg == "-w" || arg == "--workers") {
                auto v = next("--workers"); if (!v) return 1;
                config.workers = std::stoi(*v);
            } else if (arg == "--library") {
                auto v = next("--library"); if (!v) return 1;
                config.styleLibraryPath = *v;
            } else if (arg == "--output") {
                auto v = next("--output"); if (!v) return 1;
                config.outputDirectory = *v;
            } else if (arg == "--worker") {
                auto v = next("--worker"); if (!v) return 1;
                config.workerCommand = splitCommand(*v);
            } else if (arg == "--model") {
                auto v = next("--model"); if (!v) return 1;
                config.modelPath = *v;
            } else if (arg == "--timeout") {
                auto v = next("--timeout"); if (!v) return 1;
                auto timeout = parseJobTimeout(*v);
                if (!timeout) {
                    std::cerr << "Error: --timeout takes a positive number of seconds\n";
                    return 1;
                }
                config.jobTimeout = *timeout;
            } else if (arg == "--hours") {
                auto v = next("--hours"); if (!v) return 1;
                options.hours = std::stol(*v);
            } else {
                options.positional.push_back(arg);
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid value for " << arg << "\n";
            return 1;
        }
    }

    if (config.workerCommand.empty()) {
        std::cerr << "Error: Worker command is empty\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        StyleIndex index;
        CatalogLoadResult loaded = index.load(config.styleLibraryPath);
        if (!loaded) {
            std::cerr << "Warning: style library unavailable (" << loaded.message << ")\n";
        }

        Runner runner(&g_shutdown_requested);
        Pipeline pipeline(config, index, runner);
        Api api(pipeline, index);

        if (config.retentionEnabled() && options.command != "prune") {
            (void)pipeline.workspaces().prune(config.retentionMaxAge);
        }

        if (options.command == "design") {
            if (options.style.empty()) {
                std::cerr << "Error: --style is required\n";
                return 1;
            }
            return runDesign(api, options);
        }
        if (options.command == "batch") {
            if (options.style.empty()) {
                std::cerr << "Error: --style is required\n";
                return 1;
            }
            return runBatch(api, options, config.workers);
        }
        if (options.command == "styles") {
            return emit(api.getStyles());
        }
        if (options.command == "regions") {
            return emit(api.getRegions());
        }
        if (options.command == "recommend") {
            if (options.positional.size() != 2) {
                std::cerr << "Error: recommend takes <style> <region>\n";
                return 1;
            }
            return emit(api.getRecommendations(options.positional[0], options.positional[1]));
        }
        if (options.command == "prune") {
            std::chrono::hours maxAge = options.hours ? std::chrono::hours(*options.hours)
                                                      : config.retentionMaxAge;
            if (maxAge.count() <= 0) {
                std::cerr << "Error: Retention disabled; pass --hours or set DESIGNEX_RETENTION_HOURS\n";
                return 1;
            }
            std::size_t removed = pipeline.workspaces().prune(maxAge);
            std::cout << removed << "\n";
            return 0;
        }

        std::cerr << "Error: Unknown command: " << options.command << "\n\n";
        printUsage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        LOG_ERROR("dsx error: " + std::string(e.what()));
        return 1;
    }
}
