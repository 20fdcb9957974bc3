#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace md::types {

// One pairwise comparison: reference file vs. the same relative path under a target root.
struct ComparisonRequest {
    std::filesystem::path referencePath;
    std::filesystem::path targetRootPath;
    std::filesystem::path targetRelativePath;
    std::string targetLabel;
    bool whitespaceInsensitive = false;
    std::optional<std::string> preloadedReferenceContent;

    [[nodiscard]] std::filesystem::path resolvedTargetPath() const;
};

// Line counts, never characters.
struct DiffCounts {
    std::size_t added = 0;
    std::size_t removed = 0;

    [[nodiscard]] std::size_t total() const noexcept { return added + removed; }
    [[nodiscard]] DiffCounts swapped() const noexcept { return {removed, added}; }

    bool operator==(const DiffCounts&) const = default;
};

struct ComparisonResult {
    std::string label;
    std::size_t totalChangedLines = 0;
    DiffCounts counts;
    std::filesystem::path resolvedTargetPath;
    bool exists = false;
    std::filesystem::path targetRootPath;

    ComparisonResult() = default;
    ComparisonResult(std::string label, const DiffCounts& counts, std::filesystem::path resolvedTargetPath,
                     bool exists, std::filesystem::path targetRootPath);

    // Absence is not a diff: counts are forced to zero.
    static ComparisonResult missing(const std::string& label, const std::filesystem::path& resolved,
                                    const std::filesystem::path& root);
    static ComparisonResult identical(const std::string& label, const std::filesystem::path& resolved,
                                      const std::filesystem::path& root);

    void setCounts(const DiffCounts& c);

    bool operator==(const ComparisonResult&) const = default;
};

void to_json(nlohmann::json& j, const ComparisonRequest& r);
void from_json(const nlohmann::json& j, ComparisonRequest& r);
void to_json(nlohmann::json& j, const DiffCounts& c);
void from_json(const nlohmann::json& j, DiffCounts& c);
void to_json(nlohmann::json& j, const ComparisonResult& r);
void from_json(const nlohmann::json& j, ComparisonResult& r);

}
