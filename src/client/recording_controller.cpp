#include "recording_controller.hpp"

#include "logging.hpp"

#include <string>

RecordingController::RecordingController(AudioCapture& capture, FrameQueue& outbound,
                                         TranscriptAggregator& transcript)
    : capture_(capture), outbound_(outbound), transcript_(transcript) {}

RecordingController::~RecordingController() {
    stop();
}

bool RecordingController::start() {
    std::lock_guard lock(mutex_);
    if (state_ == RecordingState::Recording) return true;

    transcript_.reset();
    relaying_.store(true, std::memory_order_release);

    if (!capture_.start([this](std::span<const uint8_t> data) { on_frame(data); })) {
        relaying_.store(false, std::memory_order_release);
        logging::error("recording: failed to start audio capture");
        return false;
    }

    state_ = RecordingState::Recording;
    logging::info("recording started");
    return true;
}

void RecordingController::stop() {
    std::lock_guard lock(mutex_);
    if (state_ == RecordingState::Stopped) return;

    // Frames delivered from here on are dropped.
    relaying_.store(false, std::memory_order_release);
    capture_.stop();

    if (!outbound_.push({.type = protocol::FrameType::Text, .payload = protocol::encode_eof()})) {
        logging::warn("recording: outbound queue closed, eof not sent");
    }

    state_ = RecordingState::Stopped;
    logging::info("recording stopped ({} frames relayed, {} dropped)",
                  frames_relayed(), frames_dropped());
}

bool RecordingController::toggle() {
    if (is_recording()) {
        stop();
        return true;
    }
    return start();
}

RecordingState RecordingController::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

void RecordingController::on_frame(std::span<const uint8_t> data) {
    if (!relaying_.load(std::memory_order_acquire)) return;

    protocol::Frame frame{
        .type = protocol::FrameType::Binary,
        .payload = std::string(reinterpret_cast<const char*>(data.data()), data.size()),
    };
    if (outbound_.try_push(std::move(frame))) {
        frames_relayed_.fetch_add(1, std::memory_order_relaxed);
    } else {
        frames_dropped_.fetch_add(1, std::memory_order_relaxed);
    }
}
