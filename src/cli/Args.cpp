#include "cli/Args.hpp"

#include <algorithm>
#include <array>
#include <fmt/core.h>

using namespace md::cli;

namespace {

constexpr std::array<const char*, 5> VALUE_FLAGS = {"config", "group", "log-level", "c", "g"};
constexpr std::array<const char*, 4> SWITCH_FLAGS = {"json", "watch", "help", "h"};

bool isOneOf(const std::string& key, const auto& set) {
    return std::ranges::any_of(set, [&](const char* k) { return key == k; });
}

void setOpt(ParsedArgs& parsed, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : parsed.options) if (k == key) { v = val; return; }
    parsed.options.emplace_back(key, val);
}

std::string canonical(const std::string& key) {
    if (key == "c") return "config";
    if (key == "g") return "group";
    if (key == "h") return "help";
    return key;
}

std::string requireValue(const ParsedArgs& parsed, const std::string& key) {
    const auto v = parsed.value(key);
    if (!v || v->empty()) throw UsageError(fmt::format("--{} requires a value", key));
    return *v;
}

}

bool ParsedArgs::has(const std::string& key) const {
    return std::ranges::any_of(options, [&](const auto& kv) { return kv.first == key; });
}

std::optional<std::string> ParsedArgs::value(const std::string& key) const {
    for (const auto& [k, v] : options) if (k == key) return v;
    return std::nullopt;
}

ParsedArgs md::cli::splitArgs(const std::vector<std::string>& args) {
    ParsedArgs parsed;
    bool stopFlags = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];

        if (!stopFlags && a == "--") {
            stopFlags = true;
            continue;
        }

        if (!stopFlags && a.size() > 1 && a[0] == '-') {
            auto key = a.substr(a.starts_with("--") ? 2 : 1);
            std::optional<std::string> val;

            if (const auto eq = key.find('='); eq != std::string::npos) {
                val = key.substr(eq + 1);
                key.resize(eq);
            } else if (isOneOf(key, VALUE_FLAGS) && i + 1 < args.size()) {
                val = args[++i];
            }

            setOpt(parsed, canonical(key), val);
            continue;
        }

        parsed.positionals.push_back(a);
    }

    return parsed;
}

CommandLine md::cli::parseCommandLine(const std::vector<std::string>& args) {
    const auto parsed = splitArgs(args);
    CommandLine cmd;

    for (const auto& [key, val] : parsed.options) {
        if (!isOneOf(key, VALUE_FLAGS) && !isOneOf(key, SWITCH_FLAGS))
            throw UsageError(fmt::format("unknown option --{}", key));
        if (isOneOf(key, SWITCH_FLAGS) && val)
            throw UsageError(fmt::format("--{} does not take a value", key));
    }

    cmd.help = parsed.has("help");
    if (cmd.help) return cmd;

    if (parsed.has("config")) cmd.configPath = requireValue(parsed, "config");
    if (parsed.has("group")) cmd.group = requireValue(parsed, "group");
    if (parsed.has("log-level")) {
        const auto name = requireValue(parsed, "log-level");
        const auto level = spdlog::level::from_str(name);
        // from_str maps anything unrecognised to off
        if (level == spdlog::level::off && name != "off")
            throw UsageError(fmt::format("unknown log level '{}'", name));
        cmd.logLevel = level;
    }
    cmd.json = parsed.has("json");
    cmd.watch = parsed.has("watch");

    if (parsed.positionals.empty()) throw UsageError("missing FILE");
    if (parsed.positionals.size() > 1)
        throw UsageError(fmt::format("unexpected argument '{}'", parsed.positionals[1]));
    cmd.reference = parsed.positionals.front();

    return cmd;
}

std::string md::cli::usage() {
    return "Usage: multidiff [options] FILE\n"
           "\n"
           "Compare FILE against the same relative path in every workspace of its group.\n"
           "\n"
           "Options:\n"
           "  -c, --config PATH      configuration file (default: $MULTIDIFF_CONFIG or\n"
           "                         $XDG_CONFIG_HOME/multidiff/config.yaml)\n"
           "  -g, --group NAME       use this group instead of matching by path\n"
           "      --json             print results as JSON\n"
           "      --watch            keep results fresh until interrupted\n"
           "      --log-level LEVEL  console log level (trace, debug, info, warn, error, critical, off)\n"
           "  -h, --help             show this help\n"
           "\n"
           "Exit status: 0 success, 1 run failure or ineligible file, 2 usage error, 3 no matching group.\n";
}
