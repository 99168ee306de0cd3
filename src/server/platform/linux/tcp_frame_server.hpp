#pragma once

#include "protocol.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Non-blocking TCP listener speaking the framed wire protocol.
class TcpFrameServer {
public:
    static constexpr size_t MAX_OUTBOUND_BYTES = 4 * 1024 * 1024;

    TcpFrameServer();
    ~TcpFrameServer();

    TcpFrameServer(const TcpFrameServer&) = delete;
    TcpFrameServer& operator=(const TcpFrameServer&) = delete;

    // Port 0 binds an ephemeral port, see port().
    bool start(const std::string& host, uint16_t port);
    void stop();

    int server_fd() const { return server_fd_; }
    uint16_t port() const { return port_; }

    // Accept a new client connection. Returns client fd or -1.
    int accept_client();

    // Read what is available and append complete frames to `frames`.
    // Returns false when the peer disconnected, the socket failed or the
    // stream violated framing; frames decoded before that are still returned.
    bool read_frames(int client_fd, std::vector<protocol::Frame>& frames);

    // Queues a frame and writes what the socket takes without blocking.
    // Returns false when the socket failed or the client's unsent backlog
    // would exceed MAX_OUTBOUND_BYTES; a rejected frame is not queued.
    bool send_frame(int client_fd, protocol::FrameType type, std::string_view payload);

    // Writes queued output. Returns false when the socket failed.
    bool flush(int client_fd);

    bool has_pending_output(int client_fd) const;

    // Close and remove a client.
    void close_client(int client_fd);

    size_t client_count() const { return clients_.size(); }

private:
    int server_fd_ = -1;
    uint16_t port_ = 0;

    // Per-client decoders for partial reads, and output the socket has not
    // taken yet.
    struct ClientBuffer {
        int fd;
        protocol::FrameDecoder decoder;
        std::string outbound;
    };
    std::vector<ClientBuffer> clients_;

    ClientBuffer* find_client(int fd);
};
