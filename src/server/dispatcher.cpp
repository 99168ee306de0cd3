#include "dispatcher.hpp"

#include "logging.hpp"
#include "recognition.hpp"

#include <chrono>
#include <exception>

Dispatcher::Dispatcher(Recognizer& recognizer, NotifyCallback notify)
    : recognizer_(recognizer), notify_(std::move(notify)) {}

Dispatcher::~Dispatcher() {
    shutdown();
}

void Dispatcher::start() {
    if (worker_.joinable()) return;
    worker_ = std::jthread([this](std::stop_token st) { run(st); });
}

void Dispatcher::submit(DispatchRequest req) {
    {
        std::lock_guard lock(mutex_);
        logging::debug("dispatch: queued session {} #{} ({} bytes, {} ahead)",
                       req.session_id, req.seq, req.audio.size(), queue_.size() + (busy_ ? 1 : 0));
        queue_.push_back(std::move(req));
    }
    cv_.notify_one();
}

size_t Dispatcher::cancel(SessionId session_id) {
    std::lock_guard lock(mutex_);
    auto removed = std::erase_if(queue_, [session_id](const DispatchRequest& r) {
        return r.session_id == session_id;
    });
    if (removed > 0) {
        logging::info("dispatch: cancelled {} queued request(s) of session {}", removed, session_id);
    }
    return removed;
}

std::vector<DispatchResult> Dispatcher::take_results() {
    std::lock_guard lock(mutex_);
    std::vector<DispatchResult> out;
    out.swap(results_);
    return out;
}

size_t Dispatcher::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size() + (busy_ ? 1 : 0);
}

protocol::RecognitionResult Dispatcher::recognize(const DispatchRequest& req) {
    if (req.audio.empty()) {
        logging::warn("session {}: empty audio, nothing to recognize", req.session_id);
        return {};
    }

    auto samples = pcm16le_to_float(req.audio);

    std::lock_guard lock(recognizer_mutex_);
    try {
        auto output = recognizer_.recognize(samples, req.sample_rate);
        if (!output) {
            logging::error("session {}: recognition failed: {}", req.session_id, output.error());
            return protocol::RecognitionResult::failure(output.error());
        }
        return map_recognizer_output(*output);
    } catch (const std::exception& e) {
        logging::error("session {}: recognizer threw: {}", req.session_id, e.what());
        return protocol::RecognitionResult::failure(e.what());
    }
}

void Dispatcher::shutdown() {
    if (worker_.joinable()) {
        worker_.request_stop();
        cv_.notify_all();
        worker_.join();
    }

    std::lock_guard lock(mutex_);
    if (!queue_.empty()) {
        logging::info("dispatch: dropping {} queued request(s) at shutdown", queue_.size());
        queue_.clear();
    }
}

void Dispatcher::run(std::stop_token st) {
    while (true) {
        DispatchRequest req;
        {
            std::unique_lock lock(mutex_);
            if (!cv_.wait(lock, st, [this] { return !queue_.empty(); }) || st.stop_requested()) return;
            req = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        auto start = std::chrono::steady_clock::now();
        auto result = recognize(req);
        auto end = std::chrono::steady_clock::now();

        DispatchResult done{
            .session_id = req.session_id,
            .seq = req.seq,
            .result = std::move(result),
            .audio_s = req.sample_rate > 0
                ? static_cast<double>(req.audio.size() / Session::SAMPLE_BYTES) / req.sample_rate
                : 0.0,
            .processing_s = std::chrono::duration<double>(end - start).count(),
        };

        {
            std::lock_guard lock(mutex_);
            results_.push_back(std::move(done));
            busy_ = false;
        }

        if (notify_) notify_();
    }
}
