#include "util/paths.hpp"

#include <cstdlib>

namespace fs = std::filesystem;

namespace md::paths {

fs::path getConfigPath() {
    if (const char* explicitPath = std::getenv("MULTIDIFF_CONFIG"); explicitPath && *explicitPath)
        return explicitPath;

    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return fs::path(xdg) / "multidiff" / "config.yaml";

    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home) / ".config" / "multidiff" / "config.yaml";

    return fs::path("multidiff.yaml");
}

fs::path getDefaultWorkerBinary() {
    std::error_code ec;
    const auto self = fs::read_symlink("/proc/self/exe", ec);
    if (ec || self.empty()) return "multidiff-worker";
    return self.parent_path() / "multidiff-worker";
}

}
