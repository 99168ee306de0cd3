#include <catch2/catch_test_macros.hpp>

#include "recording_controller.hpp"

#include <cstdint>
#include <stop_token>
#include <string>
#include <vector>

namespace {

// Capture device driven by the test: deliver() plays the capture thread.
class MockCapture : public AudioCapture {
public:
    bool start(FrameCallback on_frame) override {
        start_calls++;
        if (fail_start) return false;
        on_frame_ = std::move(on_frame);
        capturing_ = true;
        return true;
    }

    void stop() override {
        stop_calls++;
        capturing_ = false;
    }

    bool is_capturing() const override { return capturing_; }

    // Delivers even after stop(), like a late callback racing teardown.
    void deliver(size_t bytes) {
        std::vector<uint8_t> data(bytes, 0x11);
        if (on_frame_) on_frame_(data);
    }

    bool fail_start = false;
    int start_calls = 0;
    int stop_calls = 0;

private:
    FrameCallback on_frame_;
    bool capturing_ = false;
};

std::vector<protocol::Frame> drain(FrameQueue& queue) {
    std::vector<protocol::Frame> out;
    queue.close();
    std::stop_source never;
    while (auto f = queue.pop(never.get_token())) out.push_back(std::move(*f));
    return out;
}

} // namespace

TEST_CASE("Recording controller", "[recording]") {
    MockCapture capture;
    FrameQueue queue(8);
    TranscriptAggregator transcript;
    RecordingController controller(capture, queue, transcript);

    SECTION("StartRelaysAudio") {
        REQUIRE(controller.start());
        REQUIRE(controller.state() == RecordingState::Recording);
        REQUIRE(capture.is_capturing());

        capture.deliver(3200);
        capture.deliver(3200);
        REQUIRE(controller.frames_relayed() == 2);

        auto frames = drain(queue);
        REQUIRE(frames.size() == 2);
        REQUIRE(frames[0].type == protocol::FrameType::Binary);
        REQUIRE(frames[0].payload.size() == 3200);
    }

    SECTION("StartResetsTranscript") {
        transcript.on_result("left over");
        controller.start();
        REQUIRE(transcript.accumulated_text().empty());
        REQUIRE(transcript.session_start().has_value());
    }

    SECTION("StopQueuesEofAfterAudio") {
        controller.start();
        capture.deliver(100);
        capture.deliver(100);
        controller.stop();

        REQUIRE(controller.state() == RecordingState::Stopped);
        REQUIRE(capture.stop_calls == 1);

        auto frames = drain(queue);
        REQUIRE(frames.size() == 3);
        REQUIRE(frames[2].type == protocol::FrameType::Text);
        REQUIRE(frames[2].payload == protocol::encode_eof());
    }

    SECTION("FramesAfterStopDropped") {
        controller.start();
        controller.stop();
        capture.deliver(100);

        auto frames = drain(queue);
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0].type == protocol::FrameType::Text);
    }

    SECTION("EofSurvivesFullQueue") {
        controller.start();
        for (int i = 0; i < 10; i++) capture.deliver(100);
        REQUIRE(controller.frames_relayed() == 8);
        REQUIRE(controller.frames_dropped() == 2);

        controller.stop();
        auto frames = drain(queue);
        REQUIRE(frames.size() == 9);
        REQUIRE(frames.back().type == protocol::FrameType::Text);
    }

    SECTION("RepeatedCallsAreNoOps") {
        REQUIRE(controller.start());
        REQUIRE(controller.start());
        REQUIRE(capture.start_calls == 1);

        controller.stop();
        controller.stop();
        REQUIRE(capture.stop_calls == 1);
        REQUIRE(drain(queue).size() == 1);
    }

    SECTION("StopWhileStoppedSendsNothing") {
        controller.stop();
        REQUIRE(queue.size() == 0);
        REQUIRE(capture.stop_calls == 0);
    }

    SECTION("Toggle") {
        REQUIRE(controller.toggle());
        REQUIRE(controller.is_recording());
        REQUIRE(controller.toggle());
        REQUIRE_FALSE(controller.is_recording());
        REQUIRE(queue.size() == 1);
    }

    SECTION("CaptureFailureStaysStopped") {
        capture.fail_start = true;
        REQUIRE_FALSE(controller.start());
        REQUIRE(controller.state() == RecordingState::Stopped);
        REQUIRE_FALSE(controller.toggle());
        REQUIRE(queue.size() == 0);
    }
}
