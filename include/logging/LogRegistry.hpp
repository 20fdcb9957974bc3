#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace md::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels. The file sink is only
    // attached when cnf.log_dir is set.
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> multidiff()   { return get("multidiff"); }
    static std::shared_ptr<spdlog::logger> diff()        { return get("diff"); }
    static std::shared_ptr<spdlog::logger> cache()       { return get("cache"); }
    static std::shared_ptr<spdlog::logger> executor()    { return get("executor"); }
    static std::shared_ptr<spdlog::logger> worker()      { return get("worker"); }
    static std::shared_ptr<spdlog::logger> coordinator() { return get("coordinator"); }
    static std::shared_ptr<spdlog::logger> watch()       { return get("watch"); }
    static std::shared_ptr<spdlog::logger> config()      { return get("config"); }

    static void setConsoleLevel(spdlog::level::level_enum level);

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    // stderr: stdout carries CLI output and, inside workers, the wire protocol
    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

} // namespace md::logging
