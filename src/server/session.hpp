#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

using SessionId = uint64_t;

// Configured and Streaming are not exclusive: state() reports the most recent
// transition, configured() tells whether a config message was ever applied.
enum class SessionState { Open, Configured, Streaming, Closed };

const char* session_state_name(SessionState state);

struct DispatchRequest {
    SessionId session_id = 0;
    uint64_t seq = 0; // per-session dispatch number, starting at 1
    uint32_t sample_rate = 0;
    std::vector<uint8_t> audio; // PCM16LE mono, always an even number of bytes
};

// Audio buffer and dispatch policy for one connection. Owned by the
// connection manager and driven only from the server loop thread.
class Session {
public:
    using DispatchCallback = std::function<void(DispatchRequest)>;

    static constexpr size_t SAMPLE_BYTES = 2;

    Session(SessionId id, uint32_t sample_rate, size_t threshold_bytes,
            DispatchCallback dispatch);

    // Applies a config message. Audio already buffered is left untouched.
    void configure(uint32_t sample_rate);

    // Appends a binary frame. When the buffer reaches the threshold the whole
    // buffer is dispatched and cleared. Returns true if a dispatch fired.
    bool append(std::span<const uint8_t> bytes);

    // Dispatches whatever is buffered, even nothing, and clears the buffer.
    void flush();

    // Discards buffered audio without dispatching. Terminal.
    void close();

    SessionId id() const { return id_; }
    uint32_t sample_rate() const { return sample_rate_; }
    SessionState state() const { return state_; }
    bool configured() const { return configured_; }
    size_t buffered_bytes() const { return buffer_.size(); }
    size_t threshold_bytes() const { return threshold_bytes_; }
    uint64_t dispatch_count() const { return dispatch_seq_; }
    double age() const;

private:
    void dispatch();

    SessionId id_;
    uint32_t sample_rate_;
    size_t threshold_bytes_;
    DispatchCallback dispatch_;

    SessionState state_ = SessionState::Open;
    bool configured_ = false;
    std::vector<uint8_t> buffer_;
    // Odd trailing byte of the last frame, completed by the next one.
    bool has_carry_ = false;
    uint8_t carry_ = 0;
    uint64_t dispatch_seq_ = 0;
    std::chrono::steady_clock::time_point created_;
};
