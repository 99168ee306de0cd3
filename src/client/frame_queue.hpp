#pragma once

#include "protocol.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

// Outbound frames from the capture and command threads to the sender thread.
// Audio is offered with try_push(), which never waits: when the sender falls
// behind, new audio is dropped and counted. Control frames use push(), which
// ignores the bound so an eof is never lost.
class FrameQueue {
public:
    explicit FrameQueue(size_t max_frames = 64) : max_frames_(max_frames) {}

    bool try_push(protocol::Frame frame) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return false;
            if (queue_.size() >= max_frames_) {
                dropped_++;
                return false;
            }
            queue_.push_back(std::move(frame));
        }
        cv_.notify_one();
        return true;
    }

    bool push(protocol::Frame frame) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return false;
            queue_.push_back(std::move(frame));
        }
        cv_.notify_one();
        return true;
    }

    // Blocks until a frame is available. Returns std::nullopt on stop request,
    // or once the queue is closed and drained.
    std::optional<protocol::Frame> pop(std::stop_token st) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait(lock, st, [this] { return !queue_.empty() || closed_; })) {
            return std::nullopt;
        }
        if (queue_.empty()) return std::nullopt;
        auto frame = std::move(queue_.front());
        queue_.pop_front();
        return frame;
    }

    // No further pushes are accepted; queued frames can still be popped.
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    uint64_t dropped() const {
        std::lock_guard lock(mutex_);
        return dropped_;
    }

private:
    size_t max_frames_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<protocol::Frame> queue_;
    uint64_t dropped_ = 0;
    bool closed_ = false;
};
