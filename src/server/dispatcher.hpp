#pragma once

#include "protocol.hpp"
#include "recognizer/recognizer.hpp"
#include "session.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

struct DispatchResult {
    SessionId session_id = 0;
    uint64_t seq = 0;
    protocol::RecognitionResult result;
    double audio_s = 0.0;
    double processing_s = 0.0;
};

// Runs recognition requests on a single worker thread in submission order.
// Requests of all sessions share the queue, so at most one recognition runs
// at a time and one session's load delays the others.
class Dispatcher {
public:
    // notify is called from the worker thread after each result is queued.
    using NotifyCallback = std::function<void()>;

    Dispatcher(Recognizer& recognizer, NotifyCallback notify);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Starts the worker thread. It inherits the caller's signal mask.
    void start();

    void submit(DispatchRequest req);

    // Drops queued (not yet running) requests of a session. Returns how many.
    size_t cancel(SessionId session_id);

    // Finished results in completion order, which is submission order.
    std::vector<DispatchResult> take_results();

    size_t pending() const;

    // Synchronous recognition of one request, serialized with the worker.
    // Never throws; failures come back in RecognitionResult::error.
    protocol::RecognitionResult recognize(const DispatchRequest& req);

    void shutdown();

private:
    void run(std::stop_token st);

    Recognizer& recognizer_;
    NotifyCallback notify_;

    std::mutex recognizer_mutex_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<DispatchRequest> queue_;
    std::vector<DispatchResult> results_;
    bool busy_ = false;

    std::jthread worker_;
};
