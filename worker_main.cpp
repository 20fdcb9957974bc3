#include "config/ConfigRegistry.hpp"
#include "executor/Worker.hpp"
#include "logging/LogRegistry.hpp"

#include <csignal>
#include <cstring>
#include <fmt/core.h>
#include <unistd.h>

using namespace md::config;
using namespace md::executor;
using namespace md::logging;

// Spawned by the executor pool with a socket on stdin/stdout. Logs go to stderr only.
int main(const int argc, char** argv) {
    std::signal(SIGPIPE, SIG_IGN);

    std::string slot = "?";
    for (int i = 1; i + 1 < argc; ++i)
        if (std::strcmp(argv[i], "--slot") == 0) slot = argv[i + 1];

    LoggingConfig logging;
    try {
        ConfigRegistry::init();
        logging = ConfigRegistry::get().logging;
    } catch (const std::exception& e) {
        fmt::print(stderr, "multidiff-worker[{}]: using default log levels: {}\n", slot, e.what());
    }
    // The parent owns the log file.
    logging.log_dir.clear();
    LogRegistry::init(logging);

    LogRegistry::worker()->debug("[Worker] Slot {} serving (pid {})", slot, ::getpid());
    const int rc = Worker::serve(STDIN_FILENO, STDOUT_FILENO);
    LogRegistry::worker()->debug("[Worker] Slot {} exiting with {}", slot, rc);
    return rc;
}
