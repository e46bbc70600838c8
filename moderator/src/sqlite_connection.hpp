#pragma once

#include "ledger_connection.hpp"
#include <string>

struct sqlite3;

class SqliteLedgerConnection : public LedgerConnection {
public:
    explicit SqliteLedgerConnection(const std::string& path, int busy_timeout_ms = 5000);
    ~SqliteLedgerConnection() override;

    SqliteLedgerConnection(const SqliteLedgerConnection&) = delete;
    SqliteLedgerConnection& operator=(const SqliteLedgerConnection&) = delete;

    std::string backend_name() const override { return "sqlite"; }
    void init_schema() override;

    void begin_exclusive(const std::string& group_id, const std::string& user_id) override;
    void commit() override;
    void rollback() override;

    std::optional<ViolationRecord> latest(const std::string& group_id,
                                          const std::string& user_id) override;
    std::vector<ViolationRecord> history(const std::string& group_id,
                                         const std::string& user_id) override;
    std::vector<ViolationRecord> group_records(const std::string& group_id, int limit) override;

    void upsert(const ViolationRecord& record) override;

    int delete_older_than(const util::CivilDate& cutoff) override;
    int delete_pair(const std::string& group_id, const std::string& user_id) override;
    int delete_group(const std::string& group_id) override;

    bool ping() override;
    bool is_usable() const override { return usable_; }

private:
    sqlite3* db_ = nullptr;
    bool usable_ = true;

    void exec(const char* sql, const char* context);
};
