#include "protocol/Message.hpp"

#include <nlohmann/json.hpp>
#include <fmt/core.h>

using json = nlohmann::json;

namespace md::protocol {

namespace {

constexpr auto TYPE_COMPARE = "compare";
constexpr auto TYPE_RESULT = "result";
constexpr auto TYPE_ERROR = "error";

json envelope(const char* type, const uint64_t id) {
    return {{"v", PROTOCOL_VERSION}, {"type", type}, {"id", id}};
}

// Validates the envelope and returns the message type.
std::string checkEnvelope(const json& j) {
    if (!j.is_object()) throw ProtocolError("message is not an object");

    const auto v = j.find("v");
    if (v == j.end() || !v->is_number_integer()) throw ProtocolError("message has no protocol version");
    if (v->get<int>() != PROTOCOL_VERSION)
        throw ProtocolError(fmt::format("unsupported protocol version {}", v->get<int>()));

    const auto id = j.find("id");
    if (id == j.end() || !id->is_number_unsigned()) throw ProtocolError("message has no valid id");

    const auto type = j.find("type");
    if (type == j.end() || !type->is_string()) throw ProtocolError("message has no type");
    return type->get<std::string>();
}

template <typename T>
T payloadAs(const json& j) {
    const auto payload = j.find("payload");
    if (payload == j.end() || !payload->is_object()) throw ProtocolError("message has no payload object");
    try {
        return payload->get<T>();
    } catch (const json::exception& e) {
        throw ProtocolError(fmt::format("malformed payload: {}", e.what()));
    }
}

}

json encode(const CompareMessage& msg) {
    auto j = envelope(TYPE_COMPARE, msg.id);
    j["payload"] = msg.request;
    return j;
}

json encode(const ResultMessage& msg) {
    auto j = envelope(TYPE_RESULT, msg.id);
    j["payload"] = msg.result;
    return j;
}

json encode(const ErrorMessage& msg) {
    auto j = envelope(TYPE_ERROR, msg.id);
    j["message"] = msg.message;
    return j;
}

CompareMessage decodeRequest(const json& j) {
    const auto type = checkEnvelope(j);
    if (type != TYPE_COMPARE) throw ProtocolError(fmt::format("unexpected request type '{}'", type));
    return {j.at("id").get<uint64_t>(), payloadAs<types::ComparisonRequest>(j)};
}

ResponseMessage decodeResponse(const json& j) {
    const auto type = checkEnvelope(j);
    const auto id = j.at("id").get<uint64_t>();

    if (type == TYPE_RESULT) return ResultMessage{id, payloadAs<types::ComparisonResult>(j)};

    if (type == TYPE_ERROR) {
        const auto message = j.find("message");
        if (message == j.end() || !message->is_string()) throw ProtocolError("error message has no text");
        return ErrorMessage{id, message->get<std::string>()};
    }

    throw ProtocolError(fmt::format("unexpected response type '{}'", type));
}

uint64_t responseId(const ResponseMessage& msg) {
    return std::visit([](const auto& m) { return m.id; }, msg);
}

}
