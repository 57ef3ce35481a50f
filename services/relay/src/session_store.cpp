#include "session_store.hpp"

InMemorySessionStore::InMemorySessionStore(std::chrono::seconds idle_timeout) : idle_timeout_(idle_timeout) {}

InMemorySessionStore::Session* InMemorySessionStore::touch(const std::string& session, Clock::time_point now) {
    auto it = sessions_.find(session);
    if (it == sessions_.end()) return nullptr;
    if (now - it->second.last_access > idle_timeout_) {
        sessions_.erase(it);
        return nullptr;
    }
    it->second.last_access = now;
    return &it->second;
}

std::optional<std::string> InMemorySessionStore::get(const std::string& session, const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    Session* s = touch(session, Clock::now());
    if (!s) return std::nullopt;
    auto it = s->values.find(key);
    if (it == s->values.end()) return std::nullopt;
    return it->second;
}

void InMemorySessionStore::set(const std::string& session, const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto now = Clock::now();
    Session* s = touch(session, now);
    if (!s) {
        s = &sessions_[session];
        s->last_access = now;
    }
    s->values[key] = value;
}

std::optional<std::string> InMemorySessionStore::take(const std::string& session, const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    Session* s = touch(session, Clock::now());
    if (!s) return std::nullopt;
    auto it = s->values.find(key);
    if (it == s->values.end()) return std::nullopt;
    std::string v = std::move(it->second);
    s->values.erase(it);
    return v;
}

bool InMemorySessionStore::remove(const std::string& session, const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    Session* s = touch(session, Clock::now());
    if (!s) return false;
    return s->values.erase(key) > 0;
}

std::size_t InMemorySessionStore::purge_expired() {
    std::lock_guard<std::mutex> lock(mtx_);
    auto now = Clock::now();
    std::size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now - it->second.last_access > idle_timeout_) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t InMemorySessionStore::session_count() {
    std::lock_guard<std::mutex> lock(mtx_);
    return sessions_.size();
}

void InMemorySessionStore::age_session(const std::string& session, std::chrono::seconds age) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = sessions_.find(session);
    if (it != sessions_.end()) it->second.last_access = Clock::now() - age;
}
