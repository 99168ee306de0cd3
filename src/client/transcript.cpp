#include "transcript.hpp"

bool TranscriptAggregator::on_result(const std::string& text) {
    if (text.empty()) return false;

    std::lock_guard lock(mutex_);
    current_text_ = text;

    if (accumulated_text_.ends_with(text) || accumulated_text_.find(text) != std::string::npos) {
        return false;
    }

    if (!accumulated_text_.empty()) accumulated_text_ += ' ';
    accumulated_text_ += text;
    return true;
}

void TranscriptAggregator::reset() {
    std::lock_guard lock(mutex_);
    current_text_.clear();
    accumulated_text_.clear();
    session_start_ = std::chrono::steady_clock::now();
}

std::string TranscriptAggregator::current_text() const {
    std::lock_guard lock(mutex_);
    return current_text_;
}

std::string TranscriptAggregator::accumulated_text() const {
    std::lock_guard lock(mutex_);
    return accumulated_text_;
}

std::optional<std::chrono::steady_clock::time_point> TranscriptAggregator::session_start() const {
    std::lock_guard lock(mutex_);
    return session_start_;
}

TranscriptAggregator::Snapshot TranscriptAggregator::snapshot() const {
    std::lock_guard lock(mutex_);
    Snapshot snap{.current_text = current_text_, .accumulated_text = accumulated_text_,
                  .session_seconds = std::nullopt};
    if (session_start_) {
        auto now = std::chrono::steady_clock::now();
        snap.session_seconds = std::chrono::duration<double>(now - *session_start_).count();
    }
    return snap;
}
