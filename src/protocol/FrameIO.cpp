#include "protocol/FrameIO.hpp"
#include "protocol/Message.hpp"

#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>

using namespace md::protocol;

namespace {

ssize_t writeSome(const int fd, const char* p, const size_t n) {
    const ssize_t w = ::send(fd, p, n, MSG_NOSIGNAL);
    if (w < 0 && errno == ENOTSOCK) return ::write(fd, p, n);
    return w;
}

void writen(const int fd, const char* p, size_t n) {
    while (n) {
        const ssize_t w = writeSome(fd, p, n);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) throw ProtocolError(fmt::format("write failed: {}", std::strerror(errno)));
        p += w;
        n -= static_cast<size_t>(w);
    }
}

// Returns the number of bytes read before EOF.
size_t readn(const int fd, char* p, const size_t n) {
    size_t got = 0;
    while (got < n) {
        const ssize_t r = ::read(fd, p + got, n - got);
        if (r < 0 && errno == EINTR) continue;
        if (r < 0) throw ProtocolError(fmt::format("read failed: {}", std::strerror(errno)));
        if (r == 0) break;
        got += static_cast<size_t>(r);
    }
    return got;
}

}

void FrameIO::send_json(const int fd, const nlohmann::json& j) {
    const std::string s = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (s.size() > MAX_FRAME_BYTES) throw ProtocolError(fmt::format("frame of {} bytes exceeds limit", s.size()));

    const uint32_t len = htonl(static_cast<uint32_t>(s.size()));
    std::string frame(reinterpret_cast<const char*>(&len), 4);
    frame += s;
    writen(fd, frame.data(), frame.size());
}

nlohmann::json FrameIO::recv_json(const int fd) {
    uint32_t len_be = 0;
    const auto header = readn(fd, reinterpret_cast<char*>(&len_be), 4);
    if (header == 0) throw ProtocolError("EOF reading length", true);
    if (header != 4) throw ProtocolError("EOF inside frame header");

    const uint32_t len = ntohl(len_be);
    if (len > MAX_FRAME_BYTES) throw ProtocolError(fmt::format("frame of {} bytes exceeds limit", len));

    std::string body(len, '\0');
    if (readn(fd, body.data(), len) != len) throw ProtocolError("EOF reading body");

    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProtocolError(fmt::format("frame is not JSON: {}", e.what()));
    }
}
