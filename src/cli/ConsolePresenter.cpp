#include "cli/ConsolePresenter.hpp"
#include "cli/Table.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace md::cli;
using namespace md::run;
using namespace md::types;

ConsolePresenter::ConsolePresenter(std::ostream& out, std::ostream& err, const OutputFormat format,
                                   const std::size_t termWidth)
    : out_(out), err_(err), format_(format), termWidth_(termWidth) {}

std::string ConsolePresenter::statusOf(const ComparisonResult& result) {
    if (!result.exists) return "missing";
    return result.totalChangedLines == 0 ? "same" : "changed";
}

std::string ConsolePresenter::renderTable(const RunReport& report, const std::size_t termWidth) {
    Table table({
        {"WORKSPACE", Align::Left, 4, 24},
        {"STATUS", Align::Left, 6, 7},
        {"ADDED", Align::Right, 5, 9},
        {"REMOVED", Align::Right, 7, 9},
        {"TOTAL", Align::Right, 5, 9},
        {"PATH", Align::Left, 12, std::numeric_limits<std::size_t>::max(), true},
    }, termWidth);

    for (const auto& r : report.results) {
        const bool exists = r.exists;
        table.add_row({
            r.label,
            statusOf(r),
            exists ? fmt::format("+{}", r.counts.added) : "-",
            exists ? fmt::format("-{}", r.counts.removed) : "-",
            exists ? std::to_string(r.totalChangedLines) : "-",
            r.resolvedTargetPath.string(),
        });
    }

    std::string out = fmt::format("{}", report.reference.string());
    if (report.group) out += fmt::format("  [group: {}", report.group->name);
    if (report.group && report.project) out += fmt::format(", project: {}", report.project->name);
    if (report.group) out += "]";
    out += '\n';

    if (table.rows() == 0) return out + "  (no other workspaces)\n";
    return out + table.render();
}

nlohmann::json ConsolePresenter::toJson(const RunReport& report) {
    nlohmann::json j = {
        {"run_id", report.runId},
        {"reference", report.reference.string()},
        {"group", nullptr},
        {"project", nullptr},
        {"results", report.results},
    };
    if (report.group) j["group"] = report.group->name;
    if (report.project) j["project"] = {{"name", report.project->name}, {"path", report.project->path.string()}};
    return j;
}

void ConsolePresenter::published(const RunReport& report) {
    std::scoped_lock lock(mutex_);
    if (format_ == OutputFormat::Json) out_ << toJson(report).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    else out_ << renderTable(report, termWidth_);
    out_.flush();
}

void ConsolePresenter::noMatchingGroup(const std::filesystem::path& reference) {
    std::scoped_lock lock(mutex_);
    err_ << "multidiff: no matching group for " << reference.string() << '\n';
}

void ConsolePresenter::failed(const std::string& message) {
    std::scoped_lock lock(mutex_);
    err_ << "multidiff: diff run failed: " << message << '\n';
}
