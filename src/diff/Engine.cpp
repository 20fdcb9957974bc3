#include "diff/Engine.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <unordered_map>
#include <fmt/core.h>

using namespace md::types;

namespace {

constexpr std::string_view LINE_SEPARATOR = "\xE2\x80\xA8";
constexpr std::string_view PARAGRAPH_SEPARATOR = "\xE2\x80\xA9";

bool isBlank(const char c) noexcept {
    return c == ' ' || c == '\t' || c == '\v' || c == '\f';
}

std::vector<std::string> prepare(const std::string_view text, const bool ignoreWhitespace) {
    auto lines = md::diff::splitLines(md::diff::normalizeLineEndings(text));
    if (ignoreWhitespace)
        for (auto& line : lines) line = md::diff::normalizeWhitespace(line);
    return lines;
}

}

namespace md::diff {

std::string normalizeLineEndings(const std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
            out.push_back('\n');
            continue;
        }
        if (c == '\xE2') {
            const auto rest = text.substr(i, 3);
            if (rest == LINE_SEPARATOR || rest == PARAGRAPH_SEPARATOR) {
                out.push_back('\n');
                i += 2;
                continue;
            }
        }
        out.push_back(c);
    }

    return out;
}

std::vector<std::string> splitLines(const std::string_view text) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start < text.size()) {
        const auto nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            out.emplace_back(text.substr(start));
            break;
        }
        out.emplace_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return out;
}

std::string normalizeWhitespace(const std::string_view line) {
    std::string out;
    out.reserve(line.size());

    bool pendingSpace = false;
    for (const char c : line) {
        if (isBlank(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) out.push_back(' ');
        pendingSpace = false;
        out.push_back(c);
    }

    return out;
}

std::size_t editDistance(const std::vector<uint32_t>& a, const std::vector<uint32_t>& b) {
    const auto n = static_cast<std::ptrdiff_t>(a.size());
    const auto m = static_cast<std::ptrdiff_t>(b.size());
    if (n == 0) return static_cast<std::size_t>(m);
    if (m == 0) return static_cast<std::size_t>(n);

    const std::ptrdiff_t max = n + m;
    const std::ptrdiff_t offset = max + 1;
    std::vector<std::ptrdiff_t> v(static_cast<std::size_t>(2 * max + 3), 0);

    for (std::ptrdiff_t d = 0; d <= max; ++d) {
        for (std::ptrdiff_t k = -d; k <= d; k += 2) {
            std::ptrdiff_t x;
            if (k == -d || (k != d && v[offset + k - 1] < v[offset + k + 1]))
                x = v[offset + k + 1];      // down: insertion from b
            else
                x = v[offset + k - 1] + 1;  // right: deletion from a

            std::ptrdiff_t y = x - k;
            while (x < n && y < m && a[x] == b[y]) { ++x; ++y; }
            v[offset + k] = x;

            if (x >= n && y >= m) return static_cast<std::size_t>(d);
        }
    }

    throw std::logic_error("editDistance: search exhausted without reaching the end of both sequences");
}

DiffCounts computeCounts(const std::string_view base, const std::string_view compare, const bool ignoreWhitespace) {
    if (base == compare) return {};

    const auto a = prepare(base, ignoreWhitespace);
    const auto b = prepare(compare, ignoreWhitespace);
    if (a == b) return {};

    // Common prefix and suffix can never be part of a minimal edit script.
    std::size_t lo = 0;
    while (lo < a.size() && lo < b.size() && a[lo] == b[lo]) ++lo;

    std::size_t endA = a.size(), endB = b.size();
    while (endA > lo && endB > lo && a[endA - 1] == b[endB - 1]) { --endA; --endB; }

    const std::size_t n = endA - lo;
    const std::size_t m = endB - lo;
    if (n == 0) return {m, 0};
    if (m == 0) return {0, n};

    // Identical lines on either side share one token.
    std::unordered_map<std::string_view, uint32_t> dictionary;
    dictionary.reserve(n + m);
    const auto tokenize = [&dictionary](const std::vector<std::string>& lines, std::size_t from, std::size_t to) {
        std::vector<uint32_t> ids;
        ids.reserve(to - from);
        for (std::size_t i = from; i < to; ++i) {
            const auto [it, inserted] = dictionary.try_emplace(lines[i], static_cast<uint32_t>(dictionary.size()));
            ids.push_back(it->second);
        }
        return ids;
    };

    const auto ta = tokenize(a, lo, endA);
    const auto tb = tokenize(b, lo, endB);

    const std::size_t d = editDistance(ta, tb);
    md::logging::LogRegistry::diff()->trace("[DiffEngine] {}x{} lines after trimming {} common, edit distance {}",
                                            n, m, lo + (a.size() - endA), d);
    if (d > n + m || (n + m - d) % 2 != 0)
        throw std::logic_error(fmt::format("computeCounts: inconsistent edit distance {} for sizes {} and {}", d, n, m));

    const std::size_t lcs = (n + m - d) / 2;
    if (lcs > n || lcs > m)
        throw std::logic_error(fmt::format("computeCounts: common subsequence {} exceeds sizes {} and {}", lcs, n, m));

    return {m - lcs, n - lcs};
}

}
