#pragma once

#include <stdexcept>
#include <string>

namespace md::executor {

// The executor process crashed or its channel broke; the executor is discarded.
class ExecutorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The worker reported that this one comparison failed; the executor stays in service.
class ComparisonError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class PoolClosedError : public std::runtime_error {
public:
    PoolClosedError() : std::runtime_error("ExecutorPool is closed") {}
};

}
