#include "run/GroupResolver.hpp"

#include <algorithm>
#include <cctype>

using namespace md::run;
using namespace md::config;

GroupResolver::GroupResolver(std::vector<DiffGroup> groups) : groups_(std::move(groups)) {}

std::string GroupResolver::normalizeForMatch(const std::filesystem::path& p) {
    auto s = p.string();
    std::ranges::transform(s, s.begin(), [](const unsigned char c) {
        return c == '\\' ? '/' : static_cast<char>(std::tolower(c));
    });
    return s;
}

std::optional<Workspace> GroupResolver::owningWorkspace(const DiffGroup& group, const std::string& normalizedReference) {
    for (const auto& ws : group.workspaces)
        if (normalizedReference.starts_with(normalizeForMatch(ws.path))) return ws;
    return std::nullopt;
}

std::optional<GroupMatch> GroupResolver::resolve(const std::filesystem::path& reference,
                                                 const std::optional<std::string>& groupName) const {
    const auto normRef = normalizeForMatch(reference);

    std::optional<GroupMatch> match;
    if (groupName) {
        const auto it = std::ranges::find_if(groups_, [&](const DiffGroup& g) { return g.name == *groupName; });
        if (it == groups_.end()) return std::nullopt;
        match = GroupMatch{*it, owningWorkspace(*it, normRef), {}};
    } else {
        for (const auto& group : groups_) {
            if (auto ws = owningWorkspace(group, normRef)) {
                match = GroupMatch{group, std::move(ws), {}};
                break;
            }
        }
        if (!match) return std::nullopt;
    }

    // normalizeForMatch keeps lengths, so the matched prefix can be cut from the original spelling.
    if (match->project) {
        const auto rest = reference.string().substr(normalizeForMatch(match->project->path).size());
        if (const auto first = rest.find_first_not_of("/\\"); first != std::string::npos)
            match->relativePath = rest.substr(first);
    }
    if (match->relativePath.empty()) match->relativePath = reference.filename();

    return match;
}
