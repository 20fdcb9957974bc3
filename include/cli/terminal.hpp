#pragma once

#include <cstddef>
#include <cstdlib>
#include <sys/ioctl.h>
#include <unistd.h>

namespace md::cli {

// Columns of the terminal on stdout, or 0 when stdout is not a terminal.
inline std::size_t term_width() {
    if (!isatty(STDOUT_FILENO)) return 0;
    winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) return ws.ws_col;
    if (const char* c = std::getenv("COLUMNS")) { const int n = std::atoi(c); if (n > 0) return static_cast<std::size_t>(n); }
    return 0;
}

}
