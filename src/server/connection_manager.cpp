#include "connection_manager.hpp"

#include "logging.hpp"

#include <memory>
#include <span>
#include <type_traits>
#include <variant>

ConnectionManager::ConnectionManager(Options options, SessionRegistry& registry,
                                     Dispatcher& dispatcher, SendCallback send)
    : options_(options), registry_(registry), dispatcher_(dispatcher),
      send_(std::move(send)) {}

SessionId ConnectionManager::open_session() {
    auto id = next_id_.fetch_add(1, std::memory_order_relaxed);
    auto session = std::make_shared<Session>(
        id, options_.default_sample_rate, options_.dispatch_threshold_bytes,
        [this](DispatchRequest req) { dispatcher_.submit(std::move(req)); });

    registry_.insert(std::move(session));
    logging::info("session {}: connected ({} live)", id, registry_.size());
    return id;
}

void ConnectionManager::on_frame(SessionId id, const protocol::Frame& frame) {
    auto session = registry_.find(id);
    if (!session) {
        logging::warn("frame for unknown session {} dropped", id);
        return;
    }

    if (frame.type == protocol::FrameType::Text) {
        on_control(*session, frame.payload);
    } else {
        on_audio(*session, frame.payload);
    }
}

void ConnectionManager::on_control(Session& session, const std::string& text) {
    logging::debug("session {}: control {}", session.id(), text);

    auto msg = protocol::decode_control(text);
    if (!msg) {
        logging::error("session {}: {}", session.id(), msg.error().message);
        return;
    }

    std::visit([&session](auto&& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, protocol::ConfigMessage>) {
            session.configure(m.sample_rate);
        } else if constexpr (std::is_same_v<T, protocol::EofMessage>) {
            session.flush();
        } else {
            logging::warn("session {}: ignoring control message of type \"{}\"",
                          session.id(), m.type);
        }
    }, *msg);
}

void ConnectionManager::on_audio(Session& session, const std::string& bytes) {
    std::span<const uint8_t> data(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
    session.append(data);
}

void ConnectionManager::close_session(SessionId id) {
    auto session = registry_.erase(id);
    if (!session) return;

    session->close();
    dispatcher_.cancel(id);
    logging::info("session {}: closed after {:.1f}s, {} dispatch(es) ({} live)",
                  id, session->age(), session->dispatch_count(), registry_.size());
}

size_t ConnectionManager::deliver_results() {
    size_t delivered = 0;
    for (auto& r : dispatcher_.take_results()) {
        if (!registry_.contains(r.session_id)) {
            logging::info("session {}: result #{} dropped, session closed", r.session_id, r.seq);
            continue;
        }

        logging::info("session {}: result #{} ({:.1f}s audio, {:.2f}s processing, {} chars{})",
                      r.session_id, r.seq, r.audio_s, r.processing_s, r.result.text.size(),
                      r.result.error ? ", error: " + *r.result.error : std::string());

        if (!send_(r.session_id, protocol::encode_result(r.result))) {
            // A partly written frame leaves the stream unusable
            logging::warn("session {}: failed to send result #{}, closing", r.session_id, r.seq);
            close_session(r.session_id);
            continue;
        }
        delivered++;
    }
    return delivered;
}

void ConnectionManager::close_all() {
    for (auto id : registry_.ids()) {
        close_session(id);
    }
}
