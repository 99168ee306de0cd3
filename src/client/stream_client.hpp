#pragma once

#include "client_config.hpp"
#include "frame_queue.hpp"
#include "platform/audio_capture.hpp"
#include "platform/linux/tcp_frame_client.hpp"
#include "protocol.hpp"
#include "recording_controller.hpp"
#include "transcript.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

// Client side of a streaming session: a sender thread drains the outbound
// queue to the socket, a receiver thread feeds results into the transcript.
class StreamClient {
public:
    // Called on the receiver thread for every result, after the transcript
    // has been updated.
    using ResultCallback = std::function<void(const protocol::RecognitionResult&,
                                              const TranscriptAggregator::Snapshot&)>;

    StreamClient(ClientConfig config, AudioCapture& capture, ResultCallback on_result);
    ~StreamClient();

    StreamClient(const StreamClient&) = delete;
    StreamClient& operator=(const StreamClient&) = delete;

    // Connects, sends the config message and starts the I/O threads.
    bool connect(const Endpoint& endpoint);

    // Stops recording (sending eof), flushes queued frames, waits up to
    // drain_timeout_ms for the answer to an outstanding eof, then closes.
    void disconnect();

    bool connected() const { return connected_.load(std::memory_order_acquire); }

    RecordingController& recorder() { return recorder_; }
    TranscriptAggregator& transcript() { return transcript_; }

private:
    void send_loop(std::stop_token st);
    void receive_loop(std::stop_token st);
    void mark_disconnected();
    void wait_for_eof_answer();

    ClientConfig config_;
    ResultCallback on_result_;

    TcpFrameClient connection_;
    FrameQueue outbound_;
    TranscriptAggregator transcript_;
    RecordingController recorder_;

    std::atomic<bool> connected_{false};

    // Set when an eof goes out, cleared by the next result.
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
    bool awaiting_eof_ = false;

    std::jthread sender_;
    std::jthread receiver_;
};
