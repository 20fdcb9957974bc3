#pragma once

#include "config/Config.hpp"
#include "util/paths.hpp"

#include <mutex>

namespace md::config {

class ConfigRegistry {
public:
    // Loads path when it exists, otherwise keeps the built-in defaults.
    static void init(const std::filesystem::path& path = paths::getConfigPath());
    static void init(Config config);

    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace md::config
