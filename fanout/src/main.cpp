#include "command_runner.hpp"
#include "config.hpp"
#include "coordinator.hpp"
#include "credential_pool.hpp"
#include "event_log.hpp"
#include "run_report.hpp"
#include "signal_watcher.hpp"
#include "util.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitItemFailed = 1;
constexpr int kExitConfigError = 2;
constexpr int kExitInterrupted = 130;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [--dry-run] ITEM...\n"
              << "Items may also be listed one per line in FANOUT_ITEMS_FILE.\n"
              << "FANOUT_COMMAND is run once per item with {id} replaced by the item.\n";
}

std::vector<std::string> read_items_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Items file not found: " + path);
    }

    std::vector<std::string> items;
    std::string line;
    while (std::getline(in, line)) {
        line = util::trim(line);
        if (line.empty() || line[0] == '#') continue;
        items.push_back(line);
    }
    return items;
}

void setup_logging(const Config& config) {
    // stdout carries item output, logs go to stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(config.service_name, console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace

int main(int argc, char* argv[]) {
    Config config;
    std::vector<std::string> items;

    // 1. Load configuration and items
    try {
        config = Config::from_env();

        std::vector<std::string> raw_items;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--dry-run") {
                config.dry_run = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return kExitSuccess;
            } else if (arg.rfind("--", 0) == 0) {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return kExitConfigError;
            } else {
                raw_items.push_back(arg);
            }
        }
        if (!config.items_file.empty()) {
            auto from_file = read_items_file(config.items_file);
            raw_items.insert(raw_items.end(), from_file.begin(), from_file.end());
        }

        setup_logging(config);
        config.validate();

        for (const auto& raw : raw_items) {
            items.push_back(util::sanitize_identifier(raw));
        }
    } catch (const std::exception& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return kExitConfigError;
    }

    if (items.empty()) {
        print_usage(argv[0]);
        return kExitConfigError;
    }

    spdlog::info("Starting {} with {} items...", config.service_name, items.size());

    try {
        // 2. Shutdown plumbing, before any worker thread exists
        CancellationToken cancel;
        SignalWatcher signals(cancel);

        // 3. Collaborators
        std::unique_ptr<CredentialPool> pool;
        if (!config.credentials.empty()) {
            pool = std::make_unique<CredentialPool>(config.credentials);
            spdlog::info("Credential pool ready with {} credentials", pool->size());
        } else {
            spdlog::info("No credentials configured, items run without a pool");
        }

        EventLog event_log(config.event_log_path);
        SharedSink sink(std::cout);

        CoordinatorOptions options = CoordinatorOptions::from_config(config);
        options.event_log = event_log.enabled() ? &event_log : nullptr;

        Coordinator coordinator(config.max_workers, pool.get(), cancel, sink, options);

        // 4. Run
        RunSummary summary;
        if (config.dry_run) {
            summary = coordinator.execute_with_output(
                items,
                [](const std::string&, const std::optional<std::string>&, OutputMultiplexer&) {},
                [](const std::string& item) { return item; },
                true);
        } else {
            CommandRunner runner(config.command);
            summary = coordinator.execute_with_output(
                items,
                [&runner](const std::string& item, const std::optional<std::string>& credential,
                          OutputMultiplexer& out) {
                    runner.run(item, credential, out);
                },
                [](const std::string& item) { return item; });
        }

        // 5. Report
        if (!config.report_path.empty()) {
            auto report = build_run_report(summary, coordinator.get_checkpoints(),
                                           pool ? pool->status() : std::vector<CredentialStatus>{});
            if (!write_run_report(config.report_path, report)) {
                spdlog::warn("Run report was not written");
            }
        }

        if (summary.stats.interrupted > 0 || cancel.is_cancelled()) {
            spdlog::warn("{} has shut down gracefully after interruption.", config.service_name);
            return kExitInterrupted;
        }
        if (summary.stats.failed > 0) {
            spdlog::error("{} item(s) failed", summary.stats.failed);
            return kExitItemFailed;
        }

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return kExitItemFailed;
    }

    spdlog::info("{} has finished.", config.service_name);
    return kExitSuccess;
}
