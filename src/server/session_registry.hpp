#pragma once

#include "session.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

// Authoritative set of live sessions, keyed by session id. Safe for
// concurrent insert/lookup/erase; the sessions themselves are not locked.
class SessionRegistry {
public:
    // Returns false if a session with the same id is already registered.
    bool insert(std::shared_ptr<Session> session) {
        std::lock_guard lock(mutex_);
        auto id = session->id();
        return sessions_.emplace(id, std::move(session)).second;
    }

    std::shared_ptr<Session> find(SessionId id) const {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(id);
        return it != sessions_.end() ? it->second : nullptr;
    }

    // Removes and returns the session, nullptr if it was not registered.
    std::shared_ptr<Session> erase(SessionId id) {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return nullptr;
        auto session = std::move(it->second);
        sessions_.erase(it);
        return session;
    }

    bool contains(SessionId id) const {
        std::lock_guard lock(mutex_);
        return sessions_.contains(id);
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

    std::vector<SessionId> ids() const {
        std::lock_guard lock(mutex_);
        std::vector<SessionId> out;
        out.reserve(sessions_.size());
        for (auto& [id, _] : sessions_) out.push_back(id);
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<SessionId, std::shared_ptr<Session>> sessions_;
};
