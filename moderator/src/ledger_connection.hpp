#pragma once

#include "util.hpp"
#include <optional>
#include <string>
#include <vector>

struct ViolationRecord {
    std::string group_id;
    std::string user_id;
    std::string user_name;
    int violation_count = 1;
    std::vector<std::string> forbidden_words;
    std::string original_text;
    int ban_duration = 0;
    util::CivilDate last_violation_date;
    std::string created_at;
};

// One storage handle for the violations table. Not thread-safe; the pool
// hands each handle to a single caller at a time.
class LedgerConnection {
public:
    virtual ~LedgerConnection() = default;

    virtual std::string backend_name() const = 0;
    virtual void init_schema() = 0;

    // Exclusive write transaction serializing writers of the (group, user) pair
    virtual void begin_exclusive(const std::string& group_id, const std::string& user_id) = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;

    // Throws CorruptRecord if the stored row cannot be decoded
    virtual std::optional<ViolationRecord> latest(const std::string& group_id,
                                                  const std::string& user_id) = 0;
    virtual std::vector<ViolationRecord> history(const std::string& group_id,
                                                 const std::string& user_id) = 0;
    virtual std::vector<ViolationRecord> group_records(const std::string& group_id, int limit) = 0;

    virtual void upsert(const ViolationRecord& record) = 0;

    virtual int delete_older_than(const util::CivilDate& cutoff) = 0;
    virtual int delete_pair(const std::string& group_id, const std::string& user_id) = 0;
    virtual int delete_group(const std::string& group_id) = 0;

    virtual bool ping() = 0;

    // False once the handle hit a connection-level failure
    virtual bool is_usable() const = 0;
};

// Rolls back on scope exit unless committed
class LedgerTransaction {
public:
    LedgerTransaction(LedgerConnection& conn, const std::string& group_id, const std::string& user_id);
    ~LedgerTransaction();

    LedgerTransaction(const LedgerTransaction&) = delete;
    LedgerTransaction& operator=(const LedgerTransaction&) = delete;

    void commit();

private:
    LedgerConnection& conn_;
    bool done_ = false;
};

// forbidden_words column codec (JSON array of strings)
std::string encode_words(const std::vector<std::string>& words);
std::vector<std::string> decode_words(const std::string& text, const std::string& backend);

util::CivilDate decode_date(const std::string& text, const std::string& backend);
