#pragma once

#include "types/Comparison.hpp"

namespace md::executor {

// Worker-process side of the executor protocol.
class Worker {
public:
    // Loads both files (or uses the preloaded reference) and counts line differences.
    // Throws on I/O failure between the existence check and the read.
    static types::ComparisonResult compare(const types::ComparisonRequest& request);

    // Answers compare requests read from inFd on outFd until EOF. Returns the process exit code.
    static int serve(int inFd, int outFd);
};

}
