#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace md::protocol {

// 4-byte big-endian length prefix followed by the JSON text.
struct FrameIO {
    static constexpr uint32_t MAX_FRAME_BYTES = 64u * 1024 * 1024;

    // Throws ProtocolError; never raises SIGPIPE.
    static void send_json(int fd, const nlohmann::json& j);

    // Throws ProtocolError, with eof() set when the peer closed before a new frame.
    static nlohmann::json recv_json(int fd);
};

}
