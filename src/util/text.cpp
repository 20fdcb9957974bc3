#include "util/text.hpp"

namespace {

constexpr std::string_view REPLACEMENT = "\xEF\xBF\xBD";

bool isContinuation(const unsigned char c) noexcept { return (c & 0xC0) == 0x80; }

// Length of the valid sequence starting at i, or 0 when it is malformed.
std::size_t validSequenceLength(const std::string_view s, const std::size_t i) noexcept {
    const auto c0 = static_cast<unsigned char>(s[i]);
    if (c0 < 0x80) return 1;

    std::size_t len;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c0 >= 0xC2 && c0 <= 0xDF) len = 2;
    else if (c0 >= 0xE0 && c0 <= 0xEF) {
        len = 3;
        if (c0 == 0xE0) lo = 0xA0;
        if (c0 == 0xED) hi = 0x9F;
    } else if (c0 >= 0xF0 && c0 <= 0xF4) {
        len = 4;
        if (c0 == 0xF0) lo = 0x90;
        if (c0 == 0xF4) hi = 0x8F;
    } else return 0;

    if (i + len > s.size()) return 0;
    const auto c1 = static_cast<unsigned char>(s[i + 1]);
    if (c1 < lo || c1 > hi) return 0;
    for (std::size_t k = 2; k < len; ++k)
        if (!isContinuation(static_cast<unsigned char>(s[i + k]))) return 0;
    return len;
}

}

std::string md::util::sanitizeUtf8(const std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size()) {
        if (const auto len = validSequenceLength(bytes, i)) {
            out.append(bytes.substr(i, len));
            i += len;
        } else {
            out.append(REPLACEMENT);
            ++i;
        }
    }

    return out;
}
