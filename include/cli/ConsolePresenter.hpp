#pragma once

#include "run/RunReport.hpp"

#include <mutex>
#include <ostream>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace md::cli {

enum class OutputFormat { Table, Json };

// Terminal stand-in for the presentation layer.
class ConsolePresenter final : public run::RunListener {
public:
    ConsolePresenter(std::ostream& out, std::ostream& err, OutputFormat format, std::size_t termWidth = 0);

    void published(const run::RunReport& report) override;
    void noMatchingGroup(const std::filesystem::path& reference) override;
    void failed(const std::string& message) override;

    [[nodiscard]] static std::string renderTable(const run::RunReport& report, std::size_t termWidth = 0);
    [[nodiscard]] static nlohmann::json toJson(const run::RunReport& report);

    // "same", "changed" or "missing"
    [[nodiscard]] static std::string statusOf(const types::ComparisonResult& result);

private:
    std::ostream& out_;
    std::ostream& err_;
    OutputFormat format_;
    std::size_t termWidth_;
    std::mutex mutex_;
};

}
