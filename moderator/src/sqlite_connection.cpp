#include "sqlite_connection.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace {

// Errors after which the handle is not put back into the pool
bool is_connection_fatal(int code) {
    switch (code & 0xff) {
    case SQLITE_IOERR:
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
    case SQLITE_CANTOPEN:
        return true;
    default:
        return false;
    }
}

StorageError make_sqlite_error(sqlite3* db, int code, const std::string& context, bool* usable) {
    if (usable && is_connection_fatal(code)) {
        *usable = false;
    }
    const char* raw = db ? sqlite3_errmsg(db) : nullptr;
    std::string message = raw ? raw : sqlite3_errstr(code);
    return StorageError("sqlite", context + ": " + message + " (" + std::to_string(code) + ")");
}

class Statement {
public:
    Statement(sqlite3* db, const char* sql, bool* usable)
        : db_(db)
        , usable_(usable)
    {
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            throw make_sqlite_error(db_, rc, "prepare failed", usable_);
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        if (rc != SQLITE_OK) {
            throw make_sqlite_error(db_, rc, "bind text failed", usable_);
        }
    }

    void bind(int index, int64_t value) {
        int rc = sqlite3_bind_int64(stmt_, index, value);
        if (rc != SQLITE_OK) {
            throw make_sqlite_error(db_, rc, "bind int failed", usable_);
        }
    }

    // True while a row is available
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw make_sqlite_error(db_, rc, "step failed", usable_);
    }

    std::string text(int column) const {
        auto* value = sqlite3_column_text(stmt_, column);
        return value ? reinterpret_cast<const char*>(value) : "";
    }

    int integer(int column) const { return sqlite3_column_int(stmt_, column); }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    bool* usable_;
};

const char* kSelectColumns =
    "SELECT group_id, user_id, user_name, violation_count, forbidden_words, "
    "original_text, ban_duration, last_violation_date, created_at FROM violations ";

ViolationRecord read_record(const Statement& stmt) {
    ViolationRecord record;
    record.group_id = stmt.text(0);
    record.user_id = stmt.text(1);
    record.user_name = stmt.text(2);
    record.violation_count = stmt.integer(3);
    record.forbidden_words = decode_words(stmt.text(4), "sqlite");
    record.original_text = stmt.text(5);
    record.ban_duration = stmt.integer(6);
    record.last_violation_date = decode_date(stmt.text(7), "sqlite");
    record.created_at = stmt.text(8);

    if (record.violation_count < 1) {
        throw CorruptRecord("sqlite", "violation_count " + std::to_string(record.violation_count));
    }
    return record;
}

// Listing reads skip undecodable rows instead of failing the whole query
std::vector<ViolationRecord> read_all(Statement& stmt) {
    std::vector<ViolationRecord> records;
    while (stmt.step()) {
        try {
            records.push_back(read_record(stmt));
        } catch (const CorruptRecord& e) {
            spdlog::warn("Skipping unreadable violation row: {}", e.what());
        }
    }
    return records;
}

} // namespace

SqliteLedgerConnection::SqliteLedgerConnection(const std::string& path, int busy_timeout_ms) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        StorageError error = make_sqlite_error(db_, rc, "open " + path + " failed", nullptr);
        sqlite3_close(db_);
        db_ = nullptr;
        throw error;
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);

    try {
        exec("PRAGMA journal_mode=WAL", "enable WAL");
        exec("PRAGMA synchronous=NORMAL", "set synchronous");
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteLedgerConnection::~SqliteLedgerConnection() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteLedgerConnection::exec(const char* sql, const char* context) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        if (is_connection_fatal(rc)) {
            usable_ = false;
        }
        throw StorageError("sqlite", std::string(context) + ": " + message);
    }
}

void SqliteLedgerConnection::init_schema() {
    exec(R"(
        CREATE TABLE IF NOT EXISTS violations (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            group_id TEXT NOT NULL,
            user_id TEXT NOT NULL,
            user_name TEXT,
            violation_count INTEGER NOT NULL DEFAULT 1,
            forbidden_words TEXT,
            original_text TEXT,
            ban_duration INTEGER NOT NULL DEFAULT 0,
            last_violation_date TEXT NOT NULL,
            created_at TEXT NOT NULL,
            UNIQUE(group_id, user_id)
        )
    )", "create violations");

    exec("CREATE INDEX IF NOT EXISTS idx_violations_date ON violations(last_violation_date)",
         "create date index");
}

void SqliteLedgerConnection::begin_exclusive(const std::string&, const std::string&) {
    // Takes the database write lock up front so the read-modify-write cannot interleave
    exec("BEGIN IMMEDIATE", "begin");
}

void SqliteLedgerConnection::commit() {
    exec("COMMIT", "commit");
}

void SqliteLedgerConnection::rollback() {
    exec("ROLLBACK", "rollback");
}

std::optional<ViolationRecord> SqliteLedgerConnection::latest(const std::string& group_id,
                                                              const std::string& user_id) {
    std::string sql = std::string(kSelectColumns) +
        "WHERE group_id = ? AND user_id = ? ORDER BY created_at DESC, id DESC LIMIT 1";
    Statement stmt(db_, sql.c_str(), &usable_);
    stmt.bind(1, group_id);
    stmt.bind(2, user_id);

    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_record(stmt);
}

std::vector<ViolationRecord> SqliteLedgerConnection::history(const std::string& group_id,
                                                             const std::string& user_id) {
    std::string sql = std::string(kSelectColumns) +
        "WHERE group_id = ? AND user_id = ? ORDER BY created_at DESC, id DESC";
    Statement stmt(db_, sql.c_str(), &usable_);
    stmt.bind(1, group_id);
    stmt.bind(2, user_id);
    return read_all(stmt);
}

std::vector<ViolationRecord> SqliteLedgerConnection::group_records(const std::string& group_id, int limit) {
    std::string sql = std::string(kSelectColumns) +
        "WHERE group_id = ? ORDER BY last_violation_date DESC, violation_count DESC LIMIT ?";
    Statement stmt(db_, sql.c_str(), &usable_);
    stmt.bind(1, group_id);
    stmt.bind(2, static_cast<int64_t>(limit));
    return read_all(stmt);
}

void SqliteLedgerConnection::upsert(const ViolationRecord& record) {
    Statement stmt(db_, R"(
        INSERT INTO violations
            (group_id, user_id, user_name, violation_count, forbidden_words,
             original_text, ban_duration, last_violation_date, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(group_id, user_id) DO UPDATE SET
            user_name = excluded.user_name,
            violation_count = excluded.violation_count,
            forbidden_words = excluded.forbidden_words,
            original_text = excluded.original_text,
            ban_duration = excluded.ban_duration,
            last_violation_date = excluded.last_violation_date,
            created_at = excluded.created_at
    )", &usable_);

    stmt.bind(1, record.group_id);
    stmt.bind(2, record.user_id);
    stmt.bind(3, record.user_name);
    stmt.bind(4, static_cast<int64_t>(record.violation_count));
    stmt.bind(5, encode_words(record.forbidden_words));
    stmt.bind(6, record.original_text);
    stmt.bind(7, static_cast<int64_t>(record.ban_duration));
    stmt.bind(8, record.last_violation_date.to_string());
    stmt.bind(9, record.created_at);
    stmt.step();
}

int SqliteLedgerConnection::delete_older_than(const util::CivilDate& cutoff) {
    Statement stmt(db_, "DELETE FROM violations WHERE last_violation_date < ?", &usable_);
    stmt.bind(1, cutoff.to_string());
    stmt.step();
    return sqlite3_changes(db_);
}

int SqliteLedgerConnection::delete_pair(const std::string& group_id, const std::string& user_id) {
    Statement stmt(db_, "DELETE FROM violations WHERE group_id = ? AND user_id = ?", &usable_);
    stmt.bind(1, group_id);
    stmt.bind(2, user_id);
    stmt.step();
    return sqlite3_changes(db_);
}

int SqliteLedgerConnection::delete_group(const std::string& group_id) {
    Statement stmt(db_, "DELETE FROM violations WHERE group_id = ?", &usable_);
    stmt.bind(1, group_id);
    stmt.step();
    return sqlite3_changes(db_);
}

bool SqliteLedgerConnection::ping() {
    try {
        Statement stmt(db_, "SELECT 1", &usable_);
        return stmt.step();
    } catch (const StorageError& e) {
        spdlog::warn("SQLite ping failed: {}", e.what());
        return false;
    }
}
