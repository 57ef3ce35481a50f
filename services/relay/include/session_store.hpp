#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Server-held key/value storage partitioned by session token. Sessions idle for
// longer than the timeout are dropped with everything in them.
class SessionStore {
public:
    virtual ~SessionStore() = default;
    virtual std::optional<std::string> get(const std::string& session, const std::string& key) = 0;
    virtual void set(const std::string& session, const std::string& key, const std::string& value) = 0;
    // Atomic read-and-remove.
    virtual std::optional<std::string> take(const std::string& session, const std::string& key) = 0;
    virtual bool remove(const std::string& session, const std::string& key) = 0;
    // Returns the number of sessions dropped.
    virtual std::size_t purge_expired() = 0;
};

class InMemorySessionStore : public SessionStore {
public:
    using Clock = std::chrono::steady_clock;

    explicit InMemorySessionStore(std::chrono::seconds idle_timeout);

    std::optional<std::string> get(const std::string& session, const std::string& key) override;
    void set(const std::string& session, const std::string& key, const std::string& value) override;
    std::optional<std::string> take(const std::string& session, const std::string& key) override;
    bool remove(const std::string& session, const std::string& key) override;
    std::size_t purge_expired() override;

    std::size_t session_count();
    // Test hook: pretend the session was last used `age` ago.
    void age_session(const std::string& session, std::chrono::seconds age);

private:
    struct Session {
        Clock::time_point last_access;
        std::unordered_map<std::string, std::string> values;
    };

    // Returns nullptr if absent or expired (expired sessions are erased). Caller holds mtx_.
    Session* touch(const std::string& session, Clock::time_point now);

    std::mutex mtx_;
    std::chrono::seconds idle_timeout_;
    std::unordered_map<std::string, Session> sessions_;
};

class SqliteSessionStore : public SessionStore {
public:
    SqliteSessionStore(const std::string& db_path, std::chrono::seconds idle_timeout);
    ~SqliteSessionStore();
    SqliteSessionStore(const SqliteSessionStore&) = delete;
    SqliteSessionStore& operator=(const SqliteSessionStore&) = delete;

    std::optional<std::string> get(const std::string& session, const std::string& key) override;
    void set(const std::string& session, const std::string& key, const std::string& value) override;
    std::optional<std::string> take(const std::string& session, const std::string& key) override;
    bool remove(const std::string& session, const std::string& key) override;
    std::size_t purge_expired() override;

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();
    bool touch(const std::string& session, long long now);
    std::optional<std::string> select_value(const std::string& session, const std::string& key);
    bool delete_value(const std::string& session, const std::string& key);

    std::mutex mtx_;
    long long idle_timeout_s_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* select_session_stmt_ {nullptr};
    struct sqlite3_stmt* upsert_session_stmt_ {nullptr};
    struct sqlite3_stmt* select_value_stmt_ {nullptr};
    struct sqlite3_stmt* upsert_value_stmt_ {nullptr};
    struct sqlite3_stmt* delete_value_stmt_ {nullptr};
};
