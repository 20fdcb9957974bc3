#include <gtest/gtest.h>
#include <csignal>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Executor tests write to worker sockets that may already be closed.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        md::config::Config cfg;
        cfg.logging.levels.console_log_level = spdlog::level::warn;
        md::config::ConfigRegistry::init(cfg);
        md::logging::LogRegistry::init(md::config::ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize multidiff test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
