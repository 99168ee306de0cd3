#pragma once

#include "dispatcher.hpp"
#include "protocol.hpp"
#include "session.hpp"
#include "session_registry.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Routes decoded frames to sessions and results back to connections.
// Transport-agnostic: the server loop owns sockets and calls in here.
class ConnectionManager {
public:
    // Sends a text payload to the connection of a session. Returns false if
    // the connection could not take it.
    using SendCallback = std::function<bool(SessionId, const std::string&)>;

    struct Options {
        uint32_t default_sample_rate = protocol::DEFAULT_SAMPLE_RATE;
        size_t dispatch_threshold_bytes = 32000;
    };

    ConnectionManager(Options options, SessionRegistry& registry,
                      Dispatcher& dispatcher, SendCallback send);

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Registers a session for a newly accepted connection.
    SessionId open_session();

    // Routes one frame. Protocol errors are logged and the session continues.
    void on_frame(SessionId id, const protocol::Frame& frame);

    // Unregisters the session, discards its buffer and queued dispatches.
    // Safe to call more than once.
    void close_session(SessionId id);

    // Sends finished results to their sessions. Results for sessions that
    // have closed are dropped. A session whose send fails is closed; the
    // transport is expected to drop its connection. Returns the number delivered.
    size_t deliver_results();

    // Closes every session, used at shutdown.
    void close_all();

    const SessionRegistry& registry() const { return registry_; }

private:
    void on_control(Session& session, const std::string& text);
    void on_audio(Session& session, const std::string& bytes);

    Options options_;
    SessionRegistry& registry_;
    Dispatcher& dispatcher_;
    SendCallback send_;

    std::atomic<SessionId> next_id_{1};
};
