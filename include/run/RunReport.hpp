#pragma once

#include "config/Config.hpp"
#include "types/Comparison.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace md::run {

struct RunRequest {
    std::optional<std::string> group;                  // explicit group selection
    std::optional<std::filesystem::path> reference;    // explicit reference override
};

enum class RunStatus { Completed, NoMatchingGroup, Superseded, Cancelled, Failed };

std::string to_string(RunStatus status);

// Everything the presentation layer receives for one published run.
struct RunReport {
    uint64_t runId{};
    std::filesystem::path reference;
    std::optional<config::DiffGroup> group;
    std::optional<config::Workspace> project;
    std::vector<types::ComparisonResult> results;  // sorted, reference itself excluded
};

struct RunOutcome {
    RunStatus status{RunStatus::Failed};
    RunReport report;
    std::string error;  // set for Failed only

    [[nodiscard]] bool published() const noexcept {
        return status == RunStatus::Completed || status == RunStatus::NoMatchingGroup;
    }
};

// Receives only results of the newest run.
class RunListener {
public:
    virtual ~RunListener() = default;

    virtual void published(const RunReport& report) = 0;
    virtual void noMatchingGroup(const std::filesystem::path& reference) = 0;
    virtual void failed(const std::string& message) = 0;
};

}
