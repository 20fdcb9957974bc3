#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/paths.hpp"

#include <yaml-cpp/yaml.h>

namespace md::config {

namespace {

Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw YAML::RepresentationException(root.Mark(), "config root must be a map");

    if (auto node = root["groups"]) cfg.groups = node.as<std::vector<DiffGroup>>();
    if (auto node = root["executor"]) YAML::convert<ExecutorConfig>::decode(node, cfg.executor);
    if (auto node = root["caching"]) YAML::convert<CachingConfig>::decode(node, cfg.caching);
    if (auto node = root["eligibility"]) YAML::convert<EligibilityConfig>::decode(node, cfg.eligibility);
    if (auto node = root["watch"]) YAML::convert<WatchConfig>::decode(node, cfg.watch);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

}

Config loadConfig(const std::filesystem::path& path) {
    return fromRoot(YAML::LoadFile(path.string()));
}

Config parseConfig(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

std::filesystem::path Config::workerBinary() const {
    return executor.worker_binary.empty() ? paths::getDefaultWorkerBinary() : executor.worker_binary;
}

}
