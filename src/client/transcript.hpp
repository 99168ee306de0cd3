#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

// Merges successive partial results into one running transcript.
//
// A result is appended only if the accumulated text neither ends with it nor
// already contains it. This is a cheap dedup for overlapping partial streams,
// not a diff: a phrase that legitimately recurs later in a recording is
// dropped, and results that differ only in punctuation are both kept.
//
// Thread-safe; the receive thread feeds results while the command thread
// resets on recording start.
class TranscriptAggregator {
public:
    struct Snapshot {
        std::string current_text;
        std::string accumulated_text;
        std::optional<double> session_seconds; // unset until the first reset()
    };

    // Returns true if the accumulated text grew.
    bool on_result(const std::string& text);

    // Starts a new recording session.
    void reset();

    std::string current_text() const;
    std::string accumulated_text() const;
    std::optional<std::chrono::steady_clock::time_point> session_start() const;
    Snapshot snapshot() const;

private:
    mutable std::mutex mutex_;
    std::string current_text_;
    std::string accumulated_text_;
    std::optional<std::chrono::steady_clock::time_point> session_start_;
};
