#pragma once

#include <filesystem>

namespace md::paths {

// $MULTIDIFF_CONFIG, else $XDG_CONFIG_HOME/multidiff/config.yaml, else ~/.config/multidiff/config.yaml
std::filesystem::path getConfigPath();

// multidiff-worker next to the running executable.
std::filesystem::path getDefaultWorkerBinary();

}
