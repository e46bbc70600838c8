#include "pg_connection.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace {

const char* kSelectColumns =
    "SELECT group_id, user_id, user_name, violation_count, forbidden_words, original_text, "
    "ban_duration, to_char(last_violation_date, 'YYYY-MM-DD'), "
    "to_char(created_at, 'YYYY-MM-DD HH24:MI:SS') FROM violations ";

ViolationRecord read_record(const pqxx::row& row) {
    ViolationRecord record;
    record.group_id = row[0].as<std::string>();
    record.user_id = row[1].as<std::string>();
    record.user_name = row[2].is_null() ? "" : row[2].as<std::string>();
    record.violation_count = row[3].as<int>();
    record.forbidden_words = decode_words(row[4].is_null() ? "" : row[4].as<std::string>(), "postgres");
    record.original_text = row[5].is_null() ? "" : row[5].as<std::string>();
    record.ban_duration = row[6].as<int>();
    record.last_violation_date = decode_date(row[7].as<std::string>(), "postgres");
    record.created_at = row[8].as<std::string>();

    if (record.violation_count < 1) {
        throw CorruptRecord("postgres", "violation_count " + std::to_string(record.violation_count));
    }
    return record;
}

std::vector<ViolationRecord> read_all(const pqxx::result& result) {
    std::vector<ViolationRecord> records;
    for (const auto& row : result) {
        try {
            records.push_back(read_record(row));
        } catch (const CorruptRecord& e) {
            spdlog::warn("Skipping unreadable violation row: {}", e.what());
        }
    }
    return records;
}

} // namespace

PostgresLedgerConnection::PostgresLedgerConnection(const std::string& dsn) {
    try {
        conn_ = std::make_unique<pqxx::connection>(dsn);

        pqxx::nontransaction session(*conn_);
        session.exec("SET synchronous_commit = off");

    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to {}: {}", util::redact_dsn(dsn), e.what());
        throw StorageError("postgres", std::string("connect failed: ") + e.what());
    }
}

template <typename... Args>
pqxx::result PostgresLedgerConnection::run(const std::string& context, const std::string& sql, Args&&... args) {
    try {
        if (txn_) {
            return txn_->exec_params(sql, std::forward<Args>(args)...);
        }

        pqxx::work txn(*conn_);
        auto result = txn.exec_params(sql, std::forward<Args>(args)...);
        txn.commit();
        return result;

    } catch (const std::exception& e) {
        throw StorageError("postgres", context + ": " + e.what());
    }
}

void PostgresLedgerConnection::init_schema() {
    try {
        pqxx::work txn(*conn_);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS violations (
                id BIGSERIAL PRIMARY KEY,
                group_id TEXT NOT NULL,
                user_id TEXT NOT NULL,
                user_name TEXT,
                violation_count INT NOT NULL DEFAULT 1,
                forbidden_words TEXT,
                original_text TEXT,
                ban_duration INT NOT NULL DEFAULT 0,
                last_violation_date DATE NOT NULL,
                created_at TIMESTAMP NOT NULL DEFAULT NOW(),
                UNIQUE (group_id, user_id)
            )
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_violations_date ON violations(last_violation_date)");

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize violations schema: {}", e.what());
        throw StorageError("postgres", std::string("init schema: ") + e.what());
    }
}

void PostgresLedgerConnection::begin_exclusive(const std::string& group_id, const std::string& user_id) {
    if (txn_) {
        throw StorageError("postgres", "transaction already open");
    }

    try {
        txn_ = std::make_unique<pqxx::work>(*conn_);
        // Released automatically at commit or rollback
        txn_->exec_params("SELECT pg_advisory_xact_lock(hashtext($1))", group_id + "/" + user_id);
    } catch (const std::exception& e) {
        txn_.reset();
        throw StorageError("postgres", std::string("begin: ") + e.what());
    }
}

void PostgresLedgerConnection::commit() {
    if (!txn_) {
        throw StorageError("postgres", "commit without transaction");
    }

    try {
        txn_->commit();
        txn_.reset();
    } catch (const std::exception& e) {
        txn_.reset();
        throw StorageError("postgres", std::string("commit: ") + e.what());
    }
}

void PostgresLedgerConnection::rollback() {
    if (!txn_) {
        return;
    }

    try {
        txn_->abort();
        txn_.reset();
    } catch (const std::exception& e) {
        txn_.reset();
        throw StorageError("postgres", std::string("rollback: ") + e.what());
    }
}

std::optional<ViolationRecord> PostgresLedgerConnection::latest(const std::string& group_id,
                                                                const std::string& user_id) {
    auto result = run("latest",
        std::string(kSelectColumns) +
        "WHERE group_id = $1 AND user_id = $2 ORDER BY created_at DESC, id DESC LIMIT 1",
        group_id, user_id);

    if (result.empty()) {
        return std::nullopt;
    }
    return read_record(result[0]);
}

std::vector<ViolationRecord> PostgresLedgerConnection::history(const std::string& group_id,
                                                               const std::string& user_id) {
    auto result = run("history",
        std::string(kSelectColumns) +
        "WHERE group_id = $1 AND user_id = $2 ORDER BY created_at DESC, id DESC",
        group_id, user_id);
    return read_all(result);
}

std::vector<ViolationRecord> PostgresLedgerConnection::group_records(const std::string& group_id, int limit) {
    auto result = run("group records",
        std::string(kSelectColumns) +
        "WHERE group_id = $1 ORDER BY last_violation_date DESC, violation_count DESC LIMIT $2",
        group_id, limit);
    return read_all(result);
}

void PostgresLedgerConnection::upsert(const ViolationRecord& record) {
    run("upsert",
        "INSERT INTO violations "
        "(group_id, user_id, user_name, violation_count, forbidden_words, "
        " original_text, ban_duration, last_violation_date, created_at) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8::date, $9::timestamp) "
        "ON CONFLICT (group_id, user_id) DO UPDATE SET "
        "user_name = EXCLUDED.user_name, "
        "violation_count = EXCLUDED.violation_count, "
        "forbidden_words = EXCLUDED.forbidden_words, "
        "original_text = EXCLUDED.original_text, "
        "ban_duration = EXCLUDED.ban_duration, "
        "last_violation_date = EXCLUDED.last_violation_date, "
        "created_at = EXCLUDED.created_at",
        record.group_id,
        record.user_id,
        record.user_name,
        record.violation_count,
        encode_words(record.forbidden_words),
        record.original_text,
        record.ban_duration,
        record.last_violation_date.to_string(),
        record.created_at);
}

int PostgresLedgerConnection::delete_older_than(const util::CivilDate& cutoff) {
    auto result = run("retention delete",
        "DELETE FROM violations WHERE last_violation_date < $1::date",
        cutoff.to_string());
    return static_cast<int>(result.affected_rows());
}

int PostgresLedgerConnection::delete_pair(const std::string& group_id, const std::string& user_id) {
    auto result = run("delete pair",
        "DELETE FROM violations WHERE group_id = $1 AND user_id = $2",
        group_id, user_id);
    return static_cast<int>(result.affected_rows());
}

int PostgresLedgerConnection::delete_group(const std::string& group_id) {
    auto result = run("delete group",
        "DELETE FROM violations WHERE group_id = $1",
        group_id);
    return static_cast<int>(result.affected_rows());
}

bool PostgresLedgerConnection::ping() {
    try {
        pqxx::nontransaction txn(*conn_);
        txn.exec("SELECT 1");
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Postgres ping failed: {}", e.what());
        return false;
    }
}

bool PostgresLedgerConnection::is_usable() const {
    return conn_ && conn_->is_open();
}
