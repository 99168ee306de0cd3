#pragma once

#include "config.hpp"
#include "connection_manager.hpp"
#include "dispatcher.hpp"
#include "platform/linux/tcp_frame_server.hpp"
#include "recognizer/recognizer.hpp"
#include "session_registry.hpp"

#include <atomic>
#include <memory>
#include <unordered_map>
#include <vector>

// epoll loop of asr-streamd: accepts connections, reads frames, and writes
// results when the dispatcher signals through an eventfd.
class ServerLoop {
public:
    ServerLoop(Config config, std::unique_ptr<Recognizer> recognizer);
    ~ServerLoop();

    ServerLoop(const ServerLoop&) = delete;
    ServerLoop& operator=(const ServerLoop&) = delete;

    bool init();
    void run();
    void request_stop();

    uint16_t port() const { return frame_server_.port(); }
    size_t session_count() const { return registry_.size(); }

private:
    void accept_connection();
    void read_connection(int fd);
    void write_connection(int fd);
    void watch_output(int fd, bool enabled);
    void close_connection(int fd);
    bool send_to_session(SessionId id, const std::string& payload);

    Config config_;
    std::unique_ptr<Recognizer> recognizer_;

    TcpFrameServer frame_server_;
    SessionRegistry registry_;
    Dispatcher dispatcher_;
    ConnectionManager manager_;

    // Transport bookkeeping; session existence is decided by registry_.
    std::unordered_map<int, SessionId> fd_sessions_;
    std::unordered_map<SessionId, int> session_fds_;
    // Connections whose send failed during the current delivery pass.
    std::vector<int> failed_fds_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    int stop_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
