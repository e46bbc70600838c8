#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis, std::shared_ptr<ViolationLedger> ledger)
    : redis_(redis), ledger_(ledger) {}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = redis_->ping();
    bool ledger_ok = ledger_->ping();

    return {
        {"ok", redis_ok && ledger_ok},
        {"redis", redis_ok},
        {"ledger", ledger_ok},
        {"ts", util::current_iso8601()}
    };
}

bool HealthCheck::is_healthy() const {
    return redis_->ping() && ledger_->ping();
}
