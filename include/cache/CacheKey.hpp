#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace md::cache {

struct CacheKeyParts {
    std::filesystem::path basePath;
    int64_t baseMtime = -1;     // -1 when missing/unreadable
    std::filesystem::path comparePath;
    int64_t compareMtime = -1;  // -1 when missing
    bool ignoreWhitespace = false;

    [[nodiscard]] CacheKeyParts reversed() const;
};

// v1|iw:<0|1>|b:<path>|bm:<mtime>|c:<path>|cm:<mtime>
std::string makeCacheKey(const CacheKeyParts& parts);

}
