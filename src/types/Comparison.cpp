#include "types/Comparison.hpp"

#include <nlohmann/json.hpp>

using namespace md::types;

namespace fs = std::filesystem;

fs::path ComparisonRequest::resolvedTargetPath() const {
    return targetRootPath / targetRelativePath;
}

ComparisonResult::ComparisonResult(std::string label, const DiffCounts& counts, fs::path resolvedTargetPath,
                                   const bool exists, fs::path targetRootPath)
    : label(std::move(label)),
      resolvedTargetPath(std::move(resolvedTargetPath)),
      exists(exists),
      targetRootPath(std::move(targetRootPath)) {
    setCounts(counts);
}

ComparisonResult ComparisonResult::missing(const std::string& label, const fs::path& resolved, const fs::path& root) {
    return {label, DiffCounts{}, resolved, false, root};
}

ComparisonResult ComparisonResult::identical(const std::string& label, const fs::path& resolved, const fs::path& root) {
    return {label, DiffCounts{}, resolved, true, root};
}

void ComparisonResult::setCounts(const DiffCounts& c) {
    counts = exists ? c : DiffCounts{};
    totalChangedLines = counts.total();
}

namespace md::types {

void to_json(nlohmann::json& j, const ComparisonRequest& r) {
    j = {
        {"reference_path", r.referencePath.string()},
        {"target_root_path", r.targetRootPath.string()},
        {"target_relative_path", r.targetRelativePath.string()},
        {"target_label", r.targetLabel},
        {"whitespace_insensitive", r.whitespaceInsensitive}
    };
    if (r.preloadedReferenceContent) j["preloaded_reference_content"] = *r.preloadedReferenceContent;
}

void from_json(const nlohmann::json& j, ComparisonRequest& r) {
    r.referencePath = j.at("reference_path").get<std::string>();
    r.targetRootPath = j.at("target_root_path").get<std::string>();
    r.targetRelativePath = j.at("target_relative_path").get<std::string>();
    r.targetLabel = j.at("target_label").get<std::string>();
    r.whitespaceInsensitive = j.at("whitespace_insensitive").get<bool>();
    if (j.contains("preloaded_reference_content"))
        r.preloadedReferenceContent = j.at("preloaded_reference_content").get<std::string>();
    else r.preloadedReferenceContent.reset();
}

void to_json(nlohmann::json& j, const DiffCounts& c) {
    j = {{"added", c.added}, {"removed", c.removed}};
}

void from_json(const nlohmann::json& j, DiffCounts& c) {
    j.at("added").get_to(c.added);
    j.at("removed").get_to(c.removed);
}

void to_json(nlohmann::json& j, const ComparisonResult& r) {
    j = {
        {"label", r.label},
        {"total_changed_lines", r.totalChangedLines},
        {"counts", r.counts},
        {"resolved_target_path", r.resolvedTargetPath.string()},
        {"exists", r.exists},
        {"target_root_path", r.targetRootPath.string()}
    };
}

void from_json(const nlohmann::json& j, ComparisonResult& r) {
    r.label = j.at("label").get<std::string>();
    r.resolvedTargetPath = j.at("resolved_target_path").get<std::string>();
    r.exists = j.at("exists").get<bool>();
    r.targetRootPath = j.at("target_root_path").get<std::string>();
    r.setCounts(j.at("counts").get<DiffCounts>());
}

}
