#pragma once

#include "types/Comparison.hpp"

#include <cstdint>
#include <future>

namespace md::executor {

struct ComparisonTask {
    uint64_t id{};
    types::ComparisonRequest request;
    std::promise<types::ComparisonResult> promise;

    ComparisonTask(const uint64_t id, types::ComparisonRequest request)
        : id(id), request(std::move(request)) {}
};

}
