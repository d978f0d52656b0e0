#include "session/context_store.hpp"

#include <filesystem>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace termgate::session {
namespace {

std::int64_t ToEpochMillis(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

}  // namespace

ContextStore::ContextStore(std::string db_path, std::size_t max_messages)
    : db_path_(std::move(db_path))
    , max_messages_(max_messages) {
    EnsureSchema();
}

ContextStore::~ContextStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void ContextStore::EnsureSchema() {
    if (db_) {
        return;
    }
    if (db_path_ != ":memory:") {
        std::error_code ec;
        const auto parent = std::filesystem::path(db_path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
    }
    if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
        utils::Log(utils::LogLevel::kError, "context", "failed to open sqlite db",
                   {{"path", db_path_}, {"error", db_ ? sqlite3_errmsg(db_) : "out of memory"}});
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    Exec(db_, "PRAGMA journal_mode=WAL;");
    Exec(db_, "CREATE TABLE IF NOT EXISTS sessions ("
             "id TEXT PRIMARY KEY,"
             "created_at TEXT,"
             "last_activity INTEGER"
             ");");
    Exec(db_, "CREATE TABLE IF NOT EXISTS messages ("
             "id INTEGER PRIMARY KEY AUTOINCREMENT,"
             "session_id TEXT,"
             "role TEXT,"
             "content TEXT,"
             "timestamp TEXT"
             ");");
    Exec(db_, "CREATE INDEX IF NOT EXISTS idx_messages_session ON messages(session_id);");
}

void ContextStore::TouchLocked(const std::string& session_id, std::int64_t now_ms) {
    sqlite3_stmt* stmt = nullptr;
    const std::string sql =
        "INSERT INTO sessions(id, created_at, last_activity) VALUES(?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET last_activity=excluded.last_activity;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        const auto created_at = utils::NowIso();
        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, created_at.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, now_ms);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            utils::Log(utils::LogLevel::kWarn, "context", "touch failed",
                       {{"session", session_id}, {"error", sqlite3_errmsg(db_)}});
        }
    }
    sqlite3_finalize(stmt);
}

void ContextStore::Touch(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return;
    }
    TouchLocked(session_id, ToEpochMillis(utils::Now()));
}

void ContextStore::Append(const std::string& session_id, const std::string& role, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return;
    }
    Exec(db_, "BEGIN TRANSACTION;");
    TouchLocked(session_id, ToEpochMillis(utils::Now()));

    sqlite3_stmt* stmt = nullptr;
    const std::string insert_sql =
        "INSERT INTO messages(session_id, role, content, timestamp) VALUES(?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, insert_sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        const auto timestamp = utils::NowIso();
        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, role.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, content.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, timestamp.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            utils::Log(utils::LogLevel::kWarn, "context", "append failed",
                       {{"session", session_id}, {"error", sqlite3_errmsg(db_)}});
        }
    }
    sqlite3_finalize(stmt);

    const std::string trim_sql =
        "DELETE FROM messages WHERE session_id = ? AND id NOT IN ("
        "SELECT id FROM messages WHERE session_id = ? ORDER BY id DESC LIMIT ?);";
    if (sqlite3_prepare_v2(db_, trim_sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, session_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(max_messages_));
        sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);
    Exec(db_, "COMMIT;");
}

std::vector<ContextMessage> ContextStore::Fetch(const std::string& session_id,
                                                std::optional<std::size_t> limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ContextMessage> messages;
    if (!db_) {
        return messages;
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string sql =
        "SELECT role, content, timestamp FROM ("
        "SELECT id, role, content, timestamp FROM messages WHERE session_id = ? "
        "ORDER BY id DESC LIMIT ?) ORDER BY id ASC;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return messages;
    }
    const sqlite3_int64 row_limit = limit && *limit > 0 ? static_cast<sqlite3_int64>(*limit) : -1;
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, row_limit);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ContextMessage msg{};
        msg.role = SafeText(sqlite3_column_text(stmt, 0));
        msg.content = SafeText(sqlite3_column_text(stmt, 1));
        msg.timestamp = SafeText(sqlite3_column_text(stmt, 2));
        messages.push_back(std::move(msg));
    }
    sqlite3_finalize(stmt);
    return messages;
}

bool ContextStore::Exists(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }
    sqlite3_stmt* stmt = nullptr;
    bool found = false;
    if (sqlite3_prepare_v2(db_, "SELECT 1 FROM sessions WHERE id = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
        found = sqlite3_step(stmt) == SQLITE_ROW;
    }
    sqlite3_finalize(stmt);
    return found;
}

bool ContextStore::DeleteLocked(const std::string& session_id) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM messages WHERE session_id = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);
    bool removed = false;
    if (sqlite3_prepare_v2(db_, "DELETE FROM sessions WHERE id = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
        removed = sqlite3_step(stmt) == SQLITE_DONE && sqlite3_changes(db_) > 0;
    }
    sqlite3_finalize(stmt);
    return removed;
}

bool ContextStore::Clear(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }
    const bool removed = DeleteLocked(session_id);
    if (removed) {
        utils::Log(utils::LogLevel::kInfo, "context", "deleted session", {{"session", session_id}});
    }
    return removed;
}

std::size_t ContextStore::ExpireIdle(std::chrono::seconds ttl, std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }
    const auto cutoff = ToEpochMillis(now) - std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count();
    std::vector<std::string> expired;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT id FROM sessions WHERE last_activity < ?;", -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int64(stmt, 1, cutoff);
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            expired.push_back(SafeText(sqlite3_column_text(stmt, 0)));
        }
    }
    sqlite3_finalize(stmt);

    std::size_t removed = 0;
    Exec(db_, "BEGIN TRANSACTION;");
    for (const auto& id : expired) {
        if (DeleteLocked(id)) {
            ++removed;
        }
    }
    Exec(db_, "COMMIT;");
    if (removed > 0) {
        utils::Log(utils::LogLevel::kInfo, "context", "expired idle sessions", {{"count", std::to_string(removed)}});
    }
    return removed;
}

std::size_t ContextStore::ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }
    sqlite3_stmt* stmt = nullptr;
    std::size_t count = 0;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM sessions;", -1, &stmt, nullptr) == SQLITE_OK
        && sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

bool ContextStore::Exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        utils::Log(utils::LogLevel::kWarn, "context", "sqlite exec error", {{"error", err ? err : "unknown"}});
        sqlite3_free(err);
        return false;
    }
    return true;
}

std::string ContextStore::SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace termgate::session
