#pragma once

#include "types/Comparison.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace md::diff {

// Exact added/removed line counts between two texts. Pure, no I/O.
//
// With ignoreWhitespace every line is compared in a normalized form (runs of
// whitespace collapsed to one space, leading/trailing whitespace trimmed). This
// is a counting approximation: two lines that differ only in whitespace count
// as unchanged even where a character-level diff would still report them.
//
// Throws std::logic_error only if the edit-distance arithmetic breaks an
// internal invariant; never because of content.
types::DiffCounts computeCounts(std::string_view base, std::string_view compare, bool ignoreWhitespace);

// CRLF, lone CR, U+2028 and U+2029 all become '\n'.
std::string normalizeLineEndings(std::string_view text);

// Splits on '\n'. Empty input yields no lines; a trailing terminator does not
// open an extra empty line.
std::vector<std::string> splitLines(std::string_view text);

std::string normalizeWhitespace(std::string_view line);

// Minimum number of insertions + deletions turning a into b (Myers O(ND)).
std::size_t editDistance(const std::vector<uint32_t>& a, const std::vector<uint32_t>& b);

}
