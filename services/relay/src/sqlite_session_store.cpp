#include "session_store.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <initializer_list>

namespace {
void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

long long now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string column_text(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, col)) : std::string();
}

// Rolls back unless committed.
struct Transaction {
    sqlite3* db;
    bool done{false};
    explicit Transaction(sqlite3* d) : db(d) {
        if (sqlite3_exec(db, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("SQLite begin failed: ") + sqlite3_errmsg(db));
        }
    }
    void commit() {
        if (sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("SQLite commit failed: ") + sqlite3_errmsg(db));
        }
        done = true;
    }
    ~Transaction() { if (!done) sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr); }
};
}

SqliteSessionStore::SqliteSessionStore(const std::string& db_path, std::chrono::seconds idle_timeout)
    : idle_timeout_s_(idle_timeout.count()) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        throw std::runtime_error("Failed to open SQLite DB: " + db_path + " (" + msg + ")");
    }
    init();
    prepare_statements();
}

SqliteSessionStore::~SqliteSessionStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SqliteSessionStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS sessions (\n"
         "  session TEXT PRIMARY KEY,\n"
         "  last_access INTEGER\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS session_entries (\n"
         "  session TEXT,\n"
         "  key TEXT,\n"
         "  value TEXT,\n"
         "  PRIMARY KEY (session, key)\n"
         ");");
}

void SqliteSessionStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void SqliteSessionStore::prepare_statements() {
    struct { const char* sql; sqlite3_stmt** out; } stmts[] = {
        {"SELECT last_access FROM sessions WHERE session = ?;", &select_session_stmt_},
        {"INSERT OR REPLACE INTO sessions (session, last_access) VALUES (?, ?);", &upsert_session_stmt_},
        {"SELECT value FROM session_entries WHERE session = ? AND key = ?;", &select_value_stmt_},
        {"INSERT OR REPLACE INTO session_entries (session, key, value) VALUES (?, ?, ?);", &upsert_value_stmt_},
        {"DELETE FROM session_entries WHERE session = ? AND key = ?;", &delete_value_stmt_},
    };
    for (auto& s : stmts) {
        if (sqlite3_prepare_v2(db_, s.sql, -1, s.out, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
    }
}

void SqliteSessionStore::close_statements() {
    for (sqlite3_stmt** st : {&select_session_stmt_, &upsert_session_stmt_, &select_value_stmt_,
                              &upsert_value_stmt_, &delete_value_stmt_}) {
        if (*st) { sqlite3_finalize(*st); *st = nullptr; }
    }
}

// Drops the session if it has expired. Returns whether it is still live afterwards;
// a live session gets its last_access refreshed.
bool SqliteSessionStore::touch(const std::string& session, long long now) {
    sqlite3_reset(select_session_stmt_);
    bind_text(select_session_stmt_, 1, session);
    bool exists = false;
    long long last = 0;
    if (sqlite3_step(select_session_stmt_) == SQLITE_ROW) {
        exists = true;
        last = sqlite3_column_int64(select_session_stmt_, 0);
    }
    sqlite3_reset(select_session_stmt_);
    if (!exists) return false;
    if (now - last > idle_timeout_s_) {
        sqlite3_stmt* st = nullptr;
        for (const char* sql : {"DELETE FROM session_entries WHERE session = ?;",
                                "DELETE FROM sessions WHERE session = ?;"}) {
            if (sqlite3_prepare_v2(db_, sql, -1, &st, nullptr) != SQLITE_OK) {
                throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db_));
            }
            bind_text(st, 1, session);
            int rc = sqlite3_step(st);
            sqlite3_finalize(st);
            if (rc != SQLITE_DONE) throw std::runtime_error("expire session failed");
        }
        return false;
    }
    sqlite3_reset(upsert_session_stmt_);
    bind_text(upsert_session_stmt_, 1, session);
    sqlite3_bind_int64(upsert_session_stmt_, 2, now);
    if (sqlite3_step(upsert_session_stmt_) != SQLITE_DONE) {
        throw std::runtime_error("touch session failed");
    }
    sqlite3_reset(upsert_session_stmt_);
    return true;
}

std::optional<std::string> SqliteSessionStore::select_value(const std::string& session, const std::string& key) {
    sqlite3_reset(select_value_stmt_);
    bind_text(select_value_stmt_, 1, session);
    bind_text(select_value_stmt_, 2, key);
    std::optional<std::string> out;
    if (sqlite3_step(select_value_stmt_) == SQLITE_ROW) out = column_text(select_value_stmt_, 0);
    sqlite3_reset(select_value_stmt_);
    return out;
}

bool SqliteSessionStore::delete_value(const std::string& session, const std::string& key) {
    sqlite3_reset(delete_value_stmt_);
    bind_text(delete_value_stmt_, 1, session);
    bind_text(delete_value_stmt_, 2, key);
    if (sqlite3_step(delete_value_stmt_) != SQLITE_DONE) {
        throw std::runtime_error("delete entry failed");
    }
    sqlite3_reset(delete_value_stmt_);
    return sqlite3_changes(db_) > 0;
}

std::optional<std::string> SqliteSessionStore::get(const std::string& session, const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);
    std::optional<std::string> out;
    if (touch(session, now_seconds())) out = select_value(session, key);
    tx.commit();
    return out;
}

void SqliteSessionStore::set(const std::string& session, const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);
    long long now = now_seconds();
    if (!touch(session, now)) {
        sqlite3_reset(upsert_session_stmt_);
        bind_text(upsert_session_stmt_, 1, session);
        sqlite3_bind_int64(upsert_session_stmt_, 2, now);
        if (sqlite3_step(upsert_session_stmt_) != SQLITE_DONE) {
            throw std::runtime_error("create session failed");
        }
        sqlite3_reset(upsert_session_stmt_);
    }
    sqlite3_reset(upsert_value_stmt_);
    sqlite3_clear_bindings(upsert_value_stmt_);
    bind_text(upsert_value_stmt_, 1, session);
    bind_text(upsert_value_stmt_, 2, key);
    bind_text(upsert_value_stmt_, 3, value);
    if (sqlite3_step(upsert_value_stmt_) != SQLITE_DONE) {
        throw std::runtime_error("upsert entry failed");
    }
    sqlite3_reset(upsert_value_stmt_);
    tx.commit();
}

std::optional<std::string> SqliteSessionStore::take(const std::string& session, const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);
    std::optional<std::string> out;
    if (touch(session, now_seconds())) {
        out = select_value(session, key);
        if (out) delete_value(session, key);
    }
    tx.commit();
    return out;
}

bool SqliteSessionStore::remove(const std::string& session, const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);
    bool removed = touch(session, now_seconds()) && delete_value(session, key);
    tx.commit();
    return removed;
}

std::size_t SqliteSessionStore::purge_expired() {
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);
    long long cutoff = now_seconds() - idle_timeout_s_;
    sqlite3_stmt* st = nullptr;
    std::size_t removed = 0;
    for (const char* sql : {"DELETE FROM session_entries WHERE session IN "
                            "(SELECT session FROM sessions WHERE last_access < ?);",
                            "DELETE FROM sessions WHERE last_access < ?;"}) {
        if (sqlite3_prepare_v2(db_, sql, -1, &st, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
        sqlite3_bind_int64(st, 1, cutoff);
        int rc = sqlite3_step(st);
        sqlite3_finalize(st);
        if (rc != SQLITE_DONE) throw std::runtime_error("purge sessions failed");
        removed = (std::size_t)sqlite3_changes(db_);
    }
    tx.commit();
    return removed;
}
