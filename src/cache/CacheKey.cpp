#include "cache/CacheKey.hpp"
#include "util/fsPath.hpp"

#include <fmt/core.h>

using namespace md::cache;

CacheKeyParts CacheKeyParts::reversed() const {
    return {comparePath, compareMtime, basePath, baseMtime, ignoreWhitespace};
}

std::string md::cache::makeCacheKey(const CacheKeyParts& parts) {
    return fmt::format("v1|iw:{}|b:{}|bm:{}|c:{}|cm:{}",
                       parts.ignoreWhitespace ? 1 : 0,
                       util::normalizeForKey(parts.basePath), parts.baseMtime,
                       util::normalizeForKey(parts.comparePath), parts.compareMtime);
}
