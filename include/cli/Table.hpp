#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <string>
#include <vector>
#include <fmt/format.h>

namespace md::cli {

enum class Align { Left, Right };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t min = 1;
    std::size_t max = std::numeric_limits<std::size_t>::max();
    bool ellipsize_middle = false;   // clamp with "..." in the middle (paths)
};

// Plain-text result table. The last column shrinks to fit term_width.
class Table {
public:
    explicit Table(std::vector<Column> cols, std::size_t term_width = 0)
        : cols_(std::move(cols)), term_width_(term_width) {}

    void add_row(std::vector<std::string> cells) {
        cells.resize(cols_.size());
        rows_.push_back(std::move(cells));
    }

    [[nodiscard]] std::size_t rows() const noexcept { return rows_.size(); }

    [[nodiscard]] std::string render() const {
        if (cols_.empty()) return {};

        const std::size_t ncol = cols_.size();
        std::vector<std::size_t> width(ncol, 0);
        for (std::size_t i = 0; i < ncol; ++i) width[i] = std::max(cols_[i].min, cols_[i].header.size());
        for (const auto& r : rows_)
            for (std::size_t i = 0; i < ncol; ++i) width[i] = std::max(width[i], r[i].size());
        for (std::size_t i = 0; i < ncol; ++i) width[i] = std::clamp(width[i], cols_[i].min, std::max(cols_[i].min, cols_[i].max));

        constexpr std::size_t pad_left = 2;
        constexpr std::size_t gap = 2;
        constexpr std::size_t fallback_term = 120;
        const std::size_t tw = term_width_ > 0 ? term_width_ : fallback_term;

        std::size_t total = pad_left + gap * (ncol - 1);
        for (const auto w : width) total += w;
        auto& flex = width.back();
        while (total > tw && flex > cols_.back().min) { --flex; --total; }

        std::string out;
        out.reserve(128 + rows_.size() * 96);

        const auto emitLine = [&](const std::vector<std::string>& cells) {
            out += std::string(pad_left, ' ');
            for (std::size_t i = 0; i < ncol; ++i) {
                if (i) out += std::string(gap, ' ');
                const auto cell = clamp(cells[i], width[i], cols_[i].ellipsize_middle);
                if (cols_[i].align == Align::Left)
                    fmt::format_to(std::back_inserter(out), "{:<{}}", cell, width[i]);
                else
                    fmt::format_to(std::back_inserter(out), "{:>{}}", cell, width[i]);
            }
            // no trailing padding
            out.erase(out.find_last_not_of(' ') + 1);
            out += '\n';
        };

        std::vector<std::string> header;
        std::vector<std::string> rule;
        for (std::size_t i = 0; i < ncol; ++i) {
            header.push_back(cols_[i].header);
            rule.emplace_back(width[i], '-');
        }

        emitLine(header);
        emitLine(rule);
        for (const auto& r : rows_) emitLine(r);

        return out;
    }

    void set_term_width(const std::size_t w) { term_width_ = w; }

private:
    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;
    std::size_t term_width_ = 0;

    static std::string clamp(const std::string& s, const std::size_t width, const bool middle) {
        if (s.size() <= width) return s;
        if (!middle || width <= 3) return s.substr(0, width);
        const std::size_t keep = width - 3;
        const std::size_t left = keep / 2;
        return s.substr(0, left) + "..." + s.substr(s.size() - (keep - left));
    }
};

}
