#pragma once
#include "redis_bus.hpp"
#include "violation_ledger.hpp"
#include <nlohmann/json.hpp>
#include <memory>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<RedisBus> redis, std::shared_ptr<ViolationLedger> ledger);
    nlohmann::json get_status();
    bool is_healthy() const;

private:
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<ViolationLedger> ledger_;
};
