#pragma once

#include "types/Comparison.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <nlohmann/json_fwd.hpp>

namespace md::protocol {

constexpr static int PROTOCOL_VERSION = 1;

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what, const bool eof = false)
        : std::runtime_error(what), eof_(eof) {}

    // Peer closed the channel cleanly between frames.
    [[nodiscard]] bool eof() const noexcept { return eof_; }

private:
    bool eof_;
};

// coordinator -> worker
struct CompareMessage {
    uint64_t id{};
    types::ComparisonRequest request;
};

// worker -> coordinator
struct ResultMessage {
    uint64_t id{};
    types::ComparisonResult result;
};

// worker -> coordinator, the task failed but the worker is still healthy
struct ErrorMessage {
    uint64_t id{};
    std::string message;
};

using ResponseMessage = std::variant<ResultMessage, ErrorMessage>;

nlohmann::json encode(const CompareMessage& msg);
nlohmann::json encode(const ResultMessage& msg);
nlohmann::json encode(const ErrorMessage& msg);

// Both throw ProtocolError on any schema violation.
CompareMessage decodeRequest(const nlohmann::json& j);
ResponseMessage decodeResponse(const nlohmann::json& j);

uint64_t responseId(const ResponseMessage& msg);

}
