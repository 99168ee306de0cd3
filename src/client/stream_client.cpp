#include "stream_client.hpp"

#include "logging.hpp"

#include <chrono>

namespace {

constexpr int RECEIVE_POLL_MS = 200;

} // namespace

StreamClient::StreamClient(ClientConfig config, AudioCapture& capture, ResultCallback on_result)
    : config_(std::move(config)), on_result_(std::move(on_result)),
      outbound_(config_.queue_frames),
      recorder_(capture, outbound_, transcript_) {}

StreamClient::~StreamClient() {
    disconnect();
}

bool StreamClient::connect(const Endpoint& endpoint) {
    if (!connection_.connect(endpoint.host, endpoint.port)) {
        logging::error("failed to connect to {}:{}", endpoint.host, endpoint.port);
        return false;
    }

    if (!connection_.send_frame(protocol::FrameType::Text,
                                protocol::encode_config(config_.sample_rate))) {
        logging::error("failed to send config to {}:{}", endpoint.host, endpoint.port);
        connection_.close();
        return false;
    }

    awaiting_eof_ = false;
    connected_.store(true, std::memory_order_release);
    logging::info("connected to {}:{}", endpoint.host, endpoint.port);

    sender_ = std::jthread([this](std::stop_token st) { send_loop(st); });
    receiver_ = std::jthread([this](std::stop_token st) { receive_loop(st); });
    return true;
}

void StreamClient::disconnect() {
    recorder_.stop();

    // Queued audio and the eof go out before the socket closes.
    outbound_.close();
    if (sender_.joinable()) sender_.join();
    if (receiver_.joinable()) wait_for_eof_answer();

    if (receiver_.joinable()) {
        receiver_.request_stop();
        receiver_.join();
    }

    if (connection_.is_connected()) {
        connection_.close();
        logging::info("disconnected");
    }
    connected_.store(false, std::memory_order_release);
}

void StreamClient::wait_for_eof_answer() {
    std::unique_lock lock(drain_mutex_);
    bool done = drain_cv_.wait_for(lock, std::chrono::milliseconds(config_.drain_timeout_ms), [this] {
        return !awaiting_eof_ || !connected();
    });
    if (!done) {
        logging::warn("no result for eof within {} ms", config_.drain_timeout_ms);
    }
}

void StreamClient::mark_disconnected() {
    {
        std::lock_guard lock(drain_mutex_);
        connected_.store(false, std::memory_order_release);
    }
    drain_cv_.notify_all();
}

void StreamClient::send_loop(std::stop_token st) {
    const auto eof = protocol::encode_eof();
    while (auto frame = outbound_.pop(st)) {
        if (frame->type == protocol::FrameType::Text && frame->payload == eof) {
            std::lock_guard lock(drain_mutex_);
            awaiting_eof_ = true;
        }
        if (!connection_.send_frame(frame->type, frame->payload)) {
            logging::error("failed to send {} frame, stopping sender",
                           frame->type == protocol::FrameType::Binary ? "audio" : "control");
            mark_disconnected();
            return;
        }
    }
}

void StreamClient::receive_loop(std::stop_token st) {
    while (!st.stop_requested()) {
        auto frame = connection_.recv_frame(RECEIVE_POLL_MS);
        if (!frame) {
            logging::info("server connection ended: {}", frame.error());
            mark_disconnected();
            return;
        }
        if (!frame->has_value()) continue;

        auto& f = **frame;
        if (f.type != protocol::FrameType::Text) {
            logging::warn("ignoring unexpected binary frame from server");
            continue;
        }

        auto result = protocol::decode_result(f.payload);
        if (!result) {
            logging::error("{}", result.error().message);
            continue;
        }

        if (result->error) {
            logging::error("server returned error: {}", *result->error);
        } else {
            transcript_.on_result(result->text);
        }

        if (on_result_) on_result_(*result, transcript_.snapshot());

        {
            std::lock_guard lock(drain_mutex_);
            awaiting_eof_ = false;
        }
        drain_cv_.notify_all();
    }
}
