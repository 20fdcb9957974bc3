#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace md::config {

constexpr static unsigned int POOL_SIZE_CEILING = 8;

struct Workspace {
    std::string name;
    std::filesystem::path path;
};

struct DiffGroup {
    std::string name;
    bool ignore_whitespace = false;
    std::vector<Workspace> workspaces;
};

struct ExecutorConfig {
    unsigned int max_pool_size = POOL_SIZE_CEILING;
    unsigned int max_workers_per_run = 6;
    std::filesystem::path worker_binary;  // empty: multidiff-worker beside the executable
};

struct CachingConfig {
    std::size_t max_entries = 1000;
};

struct EligibilityConfig {
    uintmax_t max_file_size_bytes = 2 * 1024 * 1024;
    std::vector<std::string> binary_extensions = {
        "png", "jpg", "jpeg", "gif", "bmp", "ico", "webp",
        "mp3", "wav", "flac", "mp4", "avi", "mov", "mkv",
        "zip", "rar", "7z", "gz", "bz2", "xz", "tar",
        "exe", "dll", "so", "dylib", "pdf"
    };
    std::size_t sniff_bytes = 512;
    double max_suspicious_ratio = 0.3;
};

struct WatchConfig {
    std::chrono::milliseconds poll_interval{500};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum multidiff   = spdlog::level::info;   // startup, shutdown, run summaries
    spdlog::level::level_enum diff        = spdlog::level::warn;
    spdlog::level::level_enum cache       = spdlog::level::warn;
    spdlog::level::level_enum executor    = spdlog::level::warn;   // crashes and replacements
    spdlog::level::level_enum worker      = spdlog::level::warn;
    spdlog::level::level_enum coordinator = spdlog::level::info;
    spdlog::level::level_enum watch       = spdlog::level::info;
    spdlog::level::level_enum config      = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty: console only
    LogLevelsConfig levels;
};

struct Config {
    std::vector<DiffGroup> groups;
    ExecutorConfig executor;
    CachingConfig caching;
    EligibilityConfig eligibility;
    WatchConfig watch;
    LoggingConfig logging;

    [[nodiscard]] std::filesystem::path workerBinary() const;
};

Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);

}
