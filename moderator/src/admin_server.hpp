#pragma once

#include "config.hpp"
#include "orchestrator.hpp"
#include "moderation_stats.hpp"
#include "user_cooldown.hpp"
#include "health.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <thread>

// Operator HTTP API: health, status, stats, violation records, keywords, dry-run check
class AdminServer {
public:
    AdminServer(const Config& config,
                std::shared_ptr<ModerationOrchestrator> orchestrator,
                std::shared_ptr<ModerationStats> stats,
                std::shared_ptr<UserCooldownGate> cooldown,
                std::shared_ptr<HealthCheck> health);

    void start();
    void stop();
    bool is_running() const { return running_; }

    nlohmann::json status_json();

private:
    const Config& config_;
    std::shared_ptr<ModerationOrchestrator> orchestrator_;
    std::shared_ptr<ModerationStats> stats_;
    std::shared_ptr<UserCooldownGate> cooldown_;
    std::shared_ptr<HealthCheck> health_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;

    void setup_routes();
    bool authorized(const httplib::Request& req, httplib::Response& res) const;

    void handle_get_violations(const httplib::Request& req, httplib::Response& res);
    void handle_delete_violations(const httplib::Request& req, httplib::Response& res);
    void handle_keywords(const httplib::Request& req, httplib::Response& res);
    void handle_add_keyword(const httplib::Request& req, httplib::Response& res);
    void handle_remove_keyword(const httplib::Request& req, httplib::Response& res);
    void handle_check(const httplib::Request& req, httplib::Response& res);
};
