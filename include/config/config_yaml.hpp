#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace md::config;

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    const auto name = node.as<std::string>();
    const auto lvl = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && name != "off")
        throw RepresentationException(node.Mark(), "unknown log level '" + name + "'");
    return lvl;
}

template<>
struct convert<Workspace> {
    static bool decode(const Node& node, Workspace& rhs) {
        if (!node.IsMap()) return false;
        rhs.name = node["name"].as<std::string>();
        rhs.path = node["path"].as<std::string>();
        return true;
    }
};

template<>
struct convert<DiffGroup> {
    static bool decode(const Node& node, DiffGroup& rhs) {
        if (!node.IsMap()) return false;
        rhs.name = node["name"].as<std::string>();
        rhs.ignore_whitespace = node["ignore_whitespace"].as<bool>(false);
        rhs.workspaces = node["workspaces"].as<std::vector<Workspace>>();
        return true;
    }
};

template<>
struct convert<ExecutorConfig> {
    static bool decode(const Node& node, ExecutorConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_pool_size = node["max_pool_size"].as<unsigned int>(rhs.max_pool_size);
        rhs.max_workers_per_run = node["max_workers_per_run"].as<unsigned int>(rhs.max_workers_per_run);
        rhs.worker_binary = node["worker_binary"].as<std::string>(rhs.worker_binary.string());
        return true;
    }
};

template<>
struct convert<CachingConfig> {
    static bool decode(const Node& node, CachingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_entries = node["max_entries"].as<std::size_t>(rhs.max_entries);
        return true;
    }
};

template<>
struct convert<EligibilityConfig> {
    static bool decode(const Node& node, EligibilityConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["max_file_size_kb"]) rhs.max_file_size_bytes = node["max_file_size_kb"].as<uintmax_t>() * 1024;
        rhs.binary_extensions = node["binary_extensions"].as<std::vector<std::string>>(rhs.binary_extensions);
        rhs.sniff_bytes = node["sniff_bytes"].as<std::size_t>(rhs.sniff_bytes);
        rhs.max_suspicious_ratio = node["max_suspicious_ratio"].as<double>(rhs.max_suspicious_ratio);
        return true;
    }
};

template<>
struct convert<WatchConfig> {
    static bool decode(const Node& node, WatchConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto interval = node["poll_interval_ms"]) {
            const auto ms = interval.as<long>();
            if (ms <= 0) throw RepresentationException(interval.Mark(), "watch.poll_interval_ms must be positive");
            rhs.poll_interval = std::chrono::milliseconds(ms);
        }
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.multidiff   = levelOr(node["multidiff"], rhs.multidiff);
        rhs.diff        = levelOr(node["diff"], rhs.diff);
        rhs.cache       = levelOr(node["cache"], rhs.cache);
        rhs.executor    = levelOr(node["executor"], rhs.executor);
        rhs.worker      = levelOr(node["worker"], rhs.worker);
        rhs.coordinator = levelOr(node["coordinator"], rhs.coordinator);
        rhs.watch       = levelOr(node["watch"], rhs.watch);
        rhs.config      = levelOr(node["config"], rhs.config);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = levelOr(node["console_log_level"], rhs.console_log_level);
        rhs.file_log_level = levelOr(node["file_log_level"], rhs.file_log_level);
        if (const auto sub = node["subsystem_levels"]) YAML::convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>(rhs.log_dir.string());
        if (const auto levels = node["log_levels"]) YAML::convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

}
