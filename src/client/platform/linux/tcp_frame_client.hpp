#pragma once

#include "protocol.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

struct Endpoint {
    std::string host;
    uint16_t port = 0;
};

// Accepts "host:port", "[v6addr]:port" and "tcp://host:port". Other schemes,
// such as ws://, are rejected.
std::expected<Endpoint, std::string> parse_endpoint(std::string_view address);

// Blocking TCP connection speaking the framed wire protocol. One thread may
// send while another receives.
class TcpFrameClient {
public:
    TcpFrameClient();
    ~TcpFrameClient();

    TcpFrameClient(const TcpFrameClient&) = delete;
    TcpFrameClient& operator=(const TcpFrameClient&) = delete;

    bool connect(const std::string& host, uint16_t port);
    bool send_frame(protocol::FrameType type, std::string_view payload);

    // Waits up to timeout_ms for a complete frame. std::nullopt on timeout,
    // an error when the server closed the connection or broke framing.
    std::expected<std::optional<protocol::Frame>, std::string> recv_frame(int timeout_ms);

    void close();

    bool is_connected() const { return fd_ >= 0; }

private:
    int fd_ = -1;
    protocol::FrameDecoder decoder_;
};
