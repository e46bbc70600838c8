#pragma once

#include "ledger_connection.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <string>

class PostgresLedgerConnection : public LedgerConnection {
public:
    explicit PostgresLedgerConnection(const std::string& dsn);

    std::string backend_name() const override { return "postgres"; }
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
    bool is_usable() const override;

private:
    std::unique_ptr<pqxx::connection> conn_;
    std::unique_ptr<pqxx::work> txn_;  // set between begin_exclusive and commit/rollback

    // Runs inside the open exclusive transaction, or in its own one
    template <typename... Args>
    pqxx::result run(const std::string& context, const std::string& sql, Args&&... args);
};
