#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <spdlog/common.h>

namespace md::cli {

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CommandLine {
    std::optional<std::filesystem::path> configPath;
    std::optional<std::string> group;
    std::optional<spdlog::level::level_enum> logLevel;
    bool json = false;
    bool watch = false;
    bool help = false;
    std::filesystem::path reference;
};

// Raw split of argv into flags and positionals; "--" ends flag parsing.
struct ParsedArgs {
    std::vector<std::pair<std::string, std::optional<std::string>>> options;  // last wins
    std::vector<std::string> positionals;

    [[nodiscard]] bool has(const std::string& key) const;
    [[nodiscard]] std::optional<std::string> value(const std::string& key) const;
};

ParsedArgs splitArgs(const std::vector<std::string>& args);

// Throws UsageError on unknown flags, missing values or a missing FILE.
CommandLine parseCommandLine(const std::vector<std::string>& args);

std::string usage();

}
