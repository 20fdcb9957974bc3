#include "util/fsPath.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <fmt/core.h>

namespace fs = std::filesystem;

namespace md::util {

std::string normalizeForKey(const fs::path& p) {
    auto s = p.string();
    if constexpr (isCaseInsensitiveFs())
        std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool samePath(const fs::path& a, const fs::path& b) {
    return normalizeForKey(a) == normalizeForKey(b);
}

int64_t modTime(const fs::path& p) noexcept {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec) || ec) return -1;
    const auto t = fs::last_write_time(p, ec);
    if (ec) return -1;
    const auto sys = std::chrono::file_clock::to_sys(t);
    return std::chrono::duration_cast<std::chrono::nanoseconds>(sys.time_since_epoch()).count();
}

std::string readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) throw std::runtime_error(fmt::format("Failed to open {}", p.string()));

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) throw std::runtime_error(fmt::format("Failed to read {}", p.string()));
    return buffer.str();
}

}
