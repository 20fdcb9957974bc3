#pragma once

#include "types/Comparison.hpp"

#include <future>

namespace md::executor {

// Where a run sends the comparisons it could not answer from the cache.
class Dispatcher {
public:
    virtual ~Dispatcher() = default;

    // Throws PoolClosedError after shutdown().
    virtual std::future<types::ComparisonResult> submit(types::ComparisonRequest request) = 0;

    // Idempotent. Returns once every executor has terminated; unfinished tasks are abandoned.
    virtual void shutdown() = 0;
};

}
