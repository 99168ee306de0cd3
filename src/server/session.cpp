#include "session.hpp"

#include "logging.hpp"

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Open: return "open";
        case SessionState::Configured: return "configured";
        case SessionState::Streaming: return "streaming";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

Session::Session(SessionId id, uint32_t sample_rate, size_t threshold_bytes,
                 DispatchCallback dispatch)
    : id_(id), sample_rate_(sample_rate), threshold_bytes_(threshold_bytes),
      dispatch_(std::move(dispatch)), created_(std::chrono::steady_clock::now()) {}

void Session::configure(uint32_t sample_rate) {
    if (state_ == SessionState::Closed) return;

    sample_rate_ = sample_rate;
    configured_ = true;
    state_ = SessionState::Configured;
    logging::info("session {}: sample_rate={}", id_, sample_rate_);
}

bool Session::append(std::span<const uint8_t> bytes) {
    if (state_ == SessionState::Closed) {
        logging::warn("session {}: audio after close dropped", id_);
        return false;
    }
    state_ = SessionState::Streaming;
    if (bytes.empty()) return false;

    if (has_carry_) {
        buffer_.push_back(carry_);
        buffer_.push_back(bytes.front());
        bytes = bytes.subspan(1);
        has_carry_ = false;
    }

    size_t whole = bytes.size() & ~(SAMPLE_BYTES - 1);
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(whole));
    if (whole < bytes.size()) {
        carry_ = bytes.back();
        has_carry_ = true;
    }

    logging::debug("session {}: +{} bytes, buffered {}", id_, bytes.size(), buffer_.size());

    if (buffer_.size() < threshold_bytes_) return false;

    logging::debug("session {}: threshold reached, dispatching {} bytes", id_, buffer_.size());
    dispatch();
    return true;
}

void Session::flush() {
    if (state_ == SessionState::Closed) return;

    if (has_carry_) {
        logging::debug("session {}: dropping dangling odd byte at eof", id_);
        has_carry_ = false;
    }

    logging::debug("session {}: eof, dispatching {} bytes", id_, buffer_.size());
    dispatch();
}

void Session::close() {
    if (state_ == SessionState::Closed) return;

    if (!buffer_.empty()) {
        logging::info("session {}: discarding {} undispatched bytes", id_, buffer_.size());
    }
    buffer_.clear();
    buffer_.shrink_to_fit();
    has_carry_ = false;
    state_ = SessionState::Closed;
}

double Session::age() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - created_).count();
}

void Session::dispatch() {
    DispatchRequest req{
        .session_id = id_,
        .seq = ++dispatch_seq_,
        .sample_rate = sample_rate_,
        .audio = std::move(buffer_),
    };
    buffer_ = {};
    dispatch_(std::move(req));
}
