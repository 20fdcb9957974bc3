#include "cli/Args.hpp"
#include "cli/ConsolePresenter.hpp"
#include "cli/terminal.hpp"
#include "config/ConfigRegistry.hpp"
#include "fs/Eligibility.hpp"
#include "logging/LogRegistry.hpp"
#include "run/RunCoordinator.hpp"
#include "watch/ReferenceWatcher.hpp"

#include <atomic>
#include <cstdlib>
#include <csignal>
#include <iostream>
#include <thread>
#include <fmt/core.h>

using namespace md::cli;
using namespace md::config;
using namespace md::logging;
using namespace md::run;
using namespace md::watch;

namespace {
std::atomic<bool> shouldExit = false;

void signalHandler(int) {
    shouldExit = true;
}

int exitCodeFor(const RunStatus status) {
    switch (status) {
        case RunStatus::Completed: return EXIT_SUCCESS;
        case RunStatus::NoMatchingGroup: return 3;
        default: return EXIT_FAILURE;
    }
}
}

int main(const int argc, char** argv) {
    CommandLine cmd;
    try {
        cmd = parseCommandLine({argv + 1, argv + argc});
    } catch (const UsageError& e) {
        fmt::print(stderr, "multidiff: {}\n\n{}", e.what(), usage());
        return 2;
    }

    if (cmd.help) {
        fmt::print("{}", usage());
        return EXIT_SUCCESS;
    }

    try {
        if (cmd.configPath) {
            std::error_code ec;
            if (!std::filesystem::exists(*cmd.configPath, ec)) {
                fmt::print(stderr, "multidiff: config file not found: {}\n", cmd.configPath->string());
                return 2;
            }
            // Workers read the same file for their log levels.
            ::setenv("MULTIDIFF_CONFIG", std::filesystem::absolute(*cmd.configPath).c_str(), 1);
            ConfigRegistry::init(*cmd.configPath);
        } else {
            ConfigRegistry::init();
        }
        LogRegistry::init(ConfigRegistry::get().logging);
        if (cmd.logLevel) LogRegistry::setConsoleLevel(*cmd.logLevel);

        const auto configPath = md::paths::getConfigPath();
        std::error_code ec;
        LogRegistry::config()->debug("[ConfigRegistry] {} group(s) from {}", ConfigRegistry::get().groups.size(),
                                     std::filesystem::exists(configPath, ec) ? configPath.string() : "built-in defaults");
    } catch (const std::exception& e) {
        fmt::print(stderr, "multidiff: failed to load configuration: {}\n", e.what());
        return EXIT_FAILURE;
    }

    try {
        const auto& cfg = ConfigRegistry::get();
        const auto reference = std::filesystem::absolute(cmd.reference).lexically_normal();

        if (const auto verdict = md::fs::Eligibility(cfg.eligibility).check(reference);
            verdict != md::fs::Verdict::Eligible) {
            fmt::print(stderr, "multidiff: {}: {}\n", reference.string(), md::fs::to_string(verdict));
            return EXIT_FAILURE;
        }

        const auto presenter = std::make_shared<ConsolePresenter>(
            std::cout, std::cerr, cmd.json ? OutputFormat::Json : OutputFormat::Table, term_width());

        const auto coordinator = std::make_shared<RunCoordinator>(
            std::make_shared<md::cache::ResultCache>(cfg.caching.max_entries),
            RunCoordinator::executorPoolFactory({cfg.workerBinary(), cfg.executor.max_pool_size}),
            [] { return ConfigRegistry::get().groups; },
            cfg.executor.max_workers_per_run,
            presenter);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        const auto outcome = coordinator->run({cmd.group, reference});
        if (!cmd.watch || outcome.status == RunStatus::Failed) return exitCodeFor(outcome.status);

        ReferenceWatcher watcher(coordinator, cfg.watch.poll_interval, cmd.group);
        watcher.start();
        LogRegistry::multidiff()->info("[*] Watching {} (Ctrl-C to stop)", reference.string());

        while (!shouldExit) std::this_thread::sleep_for(std::chrono::milliseconds(100));

        watcher.stop();
        LogRegistry::multidiff()->info("[*] Stopped after {} re-runs", watcher.triggeredRuns());

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        LogRegistry::multidiff()->error("[-] {}", e.what());
        return EXIT_FAILURE;
    }
}
