#pragma once

#include "frame_queue.hpp"
#include "platform/audio_capture.hpp"
#include "transcript.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <span>

enum class RecordingState { Stopped, Recording };

// Starts and stops capture and relays captured audio into the outbound queue.
class RecordingController {
public:
    RecordingController(AudioCapture& capture, FrameQueue& outbound,
                        TranscriptAggregator& transcript);
    ~RecordingController();

    RecordingController(const RecordingController&) = delete;
    RecordingController& operator=(const RecordingController&) = delete;

    // Stopped -> Recording. Resets the transcript. No-op when recording.
    // Returns false if the capture device failed to start.
    bool start();

    // Recording -> Stopped. Stops relaying, tears capture down, then queues
    // eof behind every frame already queued. No-op when stopped.
    void stop();

    bool toggle();

    RecordingState state() const;
    bool is_recording() const { return state() == RecordingState::Recording; }

    uint64_t frames_relayed() const { return frames_relayed_.load(std::memory_order_relaxed); }
    uint64_t frames_dropped() const { return frames_dropped_.load(std::memory_order_relaxed); }

private:
    // Capture thread.
    void on_frame(std::span<const uint8_t> data);

    AudioCapture& capture_;
    FrameQueue& outbound_;
    TranscriptAggregator& transcript_;

    mutable std::mutex mutex_;
    RecordingState state_ = RecordingState::Stopped;

    std::atomic<bool> relaying_{false};
    std::atomic<uint64_t> frames_relayed_{0};
    std::atomic<uint64_t> frames_dropped_{0};
};
