#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace md::util {

constexpr bool isCaseInsensitiveFs() {
#if defined(_WIN32) || defined(__APPLE__)
    return true;
#else
    return false;
#endif
}

// Lower-cases only where the platform filesystem is case-insensitive.
std::string normalizeForKey(const std::filesystem::path& p);

bool samePath(const std::filesystem::path& a, const std::filesystem::path& b);

// Nanoseconds since the Unix epoch, or -1 when the path is not a regular file.
int64_t modTime(const std::filesystem::path& p) noexcept;

std::string readFile(const std::filesystem::path& p);

}
