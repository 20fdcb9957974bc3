#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace md::run {

struct GroupMatch {
    config::DiffGroup group;
    std::optional<config::Workspace> project;  // workspace owning the reference, if any
    std::filesystem::path relativePath;        // reference path relative to project
};

// Picks the group of workspaces a reference file is compared across.
class GroupResolver {
public:
    explicit GroupResolver(std::vector<config::DiffGroup> groups);

    // An explicit group name must exist; otherwise the first group with a
    // workspace whose path prefixes the reference wins.
    [[nodiscard]] std::optional<GroupMatch> resolve(const std::filesystem::path& reference,
                                                    const std::optional<std::string>& groupName = std::nullopt) const;

    [[nodiscard]] const std::vector<config::DiffGroup>& groups() const noexcept { return groups_; }

    // Lower-cased with '\' folded to '/'.
    static std::string normalizeForMatch(const std::filesystem::path& p);

private:
    std::vector<config::DiffGroup> groups_;

    static std::optional<config::Workspace> owningWorkspace(const config::DiffGroup& group,
                                                            const std::string& normalizedReference);
};

}
