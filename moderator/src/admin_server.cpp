#include "admin_server.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace {

nlohmann::json record_json(const ViolationRecord& record) {
    return {
        {"group_id", record.group_id},
        {"user_id", record.user_id},
        {"user_name", record.user_name},
        {"violation_count", record.violation_count},
        {"forbidden_words", record.forbidden_words},
        {"original_text", record.original_text},
        {"ban_duration", record.ban_duration},
        {"last_violation_date", record.last_violation_date.to_string()},
        {"created_at", record.created_at}
    };
}

void reply(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    "application/json");
}

void reply_error(httplib::Response& res, int status, const std::string& message) {
    reply(res, status, {{"ok", false}, {"error", message}});
}

} // namespace

AdminServer::AdminServer(const Config& config,
                         std::shared_ptr<ModerationOrchestrator> orchestrator,
                         std::shared_ptr<ModerationStats> stats,
                         std::shared_ptr<UserCooldownGate> cooldown,
                         std::shared_ptr<HealthCheck> health)
    : config_(config)
    , orchestrator_(std::move(orchestrator))
    , stats_(std::move(stats))
    , cooldown_(std::move(cooldown))
    , health_(std::move(health))
    , server_(std::make_unique<httplib::Server>())
{}

void AdminServer::start() {
    if (running_) return;

    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Admin HTTP server listening on {}:{}",
                     config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("Admin HTTP server failed to bind {}:{}",
                          config_.listen_addr, config_.listen_port);
        }
    });
}

void AdminServer::stop() {
    if (!running_) return;

    running_ = false;
    server_->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    spdlog::info("Admin HTTP server stopped");
}

bool AdminServer::authorized(const httplib::Request& req, httplib::Response& res) const {
    if (config_.admin_token.empty()) {
        reply_error(res, 403, "admin token not configured");
        return false;
    }
    if (req.get_header_value("Authorization") != "Bearer " + config_.admin_token) {
        reply_error(res, 401, "unauthorized");
        return false;
    }
    return true;
}

void AdminServer::setup_routes() {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        auto status = health_->get_status();
        reply(res, status["ok"].get<bool>() ? 200 : 503, status);
    });

    server_->Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        reply(res, 200, status_json());
    });

    server_->Get("/stats", [this](const httplib::Request& req, httplib::Response& res) {
        size_t top_n = 10;
        if (req.has_param("top")) {
            try {
                top_n = static_cast<size_t>(std::stoul(req.get_param_value("top")));
            } catch (const std::exception&) {
                reply_error(res, 400, "top must be a number");
                return;
            }
        }
        reply(res, 200, stats_->to_json(top_n));
    });

    server_->Get("/violations", [this](const httplib::Request& req, httplib::Response& res) {
        handle_get_violations(req, res);
    });

    server_->Delete("/violations", [this](const httplib::Request& req, httplib::Response& res) {
        if (authorized(req, res)) handle_delete_violations(req, res);
    });

    server_->Get("/keywords", [this](const httplib::Request& req, httplib::Response& res) {
        handle_keywords(req, res);
    });

    server_->Post("/keywords", [this](const httplib::Request& req, httplib::Response& res) {
        if (authorized(req, res)) handle_add_keyword(req, res);
    });

    server_->Delete("/keywords", [this](const httplib::Request& req, httplib::Response& res) {
        if (authorized(req, res)) handle_remove_keyword(req, res);
    });

    server_->Post("/check", [this](const httplib::Request& req, httplib::Response& res) {
        if (authorized(req, res)) handle_check(req, res);
    });
}

nlohmann::json AdminServer::status_json() {
    auto client = orchestrator_->client();
    auto keywords = orchestrator_->keywords();
    auto ledger = orchestrator_->ledger();

    nlohmann::json client_json = nullptr;
    if (client) {
        auto s = client->stats();
        auto window = client->limiter().snapshot();
        client_json = {
            {"requests", s.requests},
            {"cache_hits", s.cache_hits},
            {"rate_limited", s.rate_limited},
            {"attempted", s.attempted},
            {"succeeded", s.succeeded},
            {"failed", s.failed},
            {"retries", s.retries},
            {"cache_entries", client->cache().size()},
            {"window", {
                {"minute", window.minute_count},
                {"hour", window.hour_count},
                {"max_per_minute", window.max_per_minute},
                {"max_per_hour", window.max_per_hour},
                {"cooldown_remaining_seconds", window.cooldown_remaining_seconds}
            }}
        };
    }

    auto pool = ledger->pool_stats();
    const auto& opts = ledger->options();

    return {
        {"service", config_.service_name},
        {"config", {
            {"monitored_groups", config_.monitored_groups},
            {"admin_targets", config_.admin_targets.size()},
            {"exempt_roles", config_.exempt_roles},
            {"auto_ban", config_.enable_auto_ban},
            {"message_delete", config_.enable_message_delete},
            {"local_check", config_.enable_local_check},
            {"group_notice", config_.group_notice_enabled},
            {"user_cooldown", cooldown_->enabled()},
            {"user_cooldown_seconds", config_.user_cooldown_seconds},
            {"ban_ladder", {opts.ladder.tier1_seconds, opts.ladder.tier2_seconds, opts.ladder.tier3_seconds}},
            {"reset_hour", opts.reset_hour},
            {"max_log_days", opts.max_log_days},
            {"ledger_backend", config_.ledger_backend}
        }},
        {"keywords", keywords ? keywords->size() : 0},
        {"cooldown_tracked", cooldown_->tracked()},
        {"client", client_json},
        {"pool", {
            {"total", pool.total},
            {"idle", pool.idle},
            {"in_use", pool.in_use},
            {"created", pool.created},
            {"waits", pool.waits},
            {"exhausted", pool.exhausted}
        }},
        {"stats", stats_->to_json(5)},
        {"ts", util::current_iso8601()}
    };
}

void AdminServer::handle_get_violations(const httplib::Request& req, httplib::Response& res) {
    std::string group_id = req.get_param_value("group_id");
    if (group_id.empty()) {
        reply_error(res, 400, "group_id is required");
        return;
    }

    auto ledger = orchestrator_->ledger();

    try {
        nlohmann::json records = nlohmann::json::array();

        if (req.has_param("user_id")) {
            std::string user_id = req.get_param_value("user_id");
            for (const auto& record : ledger->history(group_id, user_id)) {
                records.push_back(record_json(record));
            }

            auto tier = ledger->current_tier(group_id, user_id);
            reply(res, 200, {
                {"ok", true},
                {"records", records},
                {"next_tier", tier.tier},
                {"stored_count", tier.stored_count},
                {"as_of", tier.as_of.to_string()}
            });
            return;
        }

        int limit = 20;
        if (req.has_param("limit")) {
            limit = std::stoi(req.get_param_value("limit"));
        }
        for (const auto& record : ledger->group_records(group_id, limit)) {
            records.push_back(record_json(record));
        }
        reply(res, 200, {{"ok", true}, {"records", records}});

    } catch (const StorageError& e) {
        spdlog::error("Violation query failed: {}", e.what());
        reply_error(res, 503, e.what());
    } catch (const std::exception& e) {
        reply_error(res, 400, e.what());
    }
}

void AdminServer::handle_delete_violations(const httplib::Request& req, httplib::Response& res) {
    std::string group_id = req.get_param_value("group_id");
    if (group_id.empty()) {
        reply_error(res, 400, "group_id is required");
        return;
    }

    auto ledger = orchestrator_->ledger();

    try {
        int removed = req.has_param("user_id")
            ? ledger->reset_user(group_id, req.get_param_value("user_id"))
            : ledger->reset_group(group_id);
        reply(res, 200, {{"ok", true}, {"removed", removed}});
    } catch (const StorageError& e) {
        spdlog::error("Violation reset failed: {}", e.what());
        reply_error(res, 503, e.what());
    }
}

void AdminServer::handle_keywords(const httplib::Request&, httplib::Response& res) {
    auto keywords = orchestrator_->keywords();
    nlohmann::json words = keywords ? keywords->words() : std::vector<std::string>{};
    reply(res, 200, {{"ok", true}, {"words", words}});
}

void AdminServer::handle_add_keyword(const httplib::Request& req, httplib::Response& res) {
    std::string word;
    try {
        auto body = nlohmann::json::parse(req.body);
        word = body.value("word", "");
    } catch (const nlohmann::json::exception& e) {
        reply_error(res, 400, e.what());
        return;
    }

    auto keywords = orchestrator_->keywords();
    if (util::trim(word).empty() || !keywords) {
        reply_error(res, 400, "word is required");
        return;
    }

    bool added = keywords->add(word);
    if (added) {
        spdlog::info("Keyword added: {}", word);
    }
    reply(res, added ? 201 : 409, {{"ok", added}, {"word", word}, {"count", keywords->size()}});
}

void AdminServer::handle_remove_keyword(const httplib::Request& req, httplib::Response& res) {
    std::string word = req.get_param_value("word");
    auto keywords = orchestrator_->keywords();
    if (word.empty() || !keywords) {
        reply_error(res, 400, "word is required");
        return;
    }

    bool removed = keywords->remove(word);
    if (removed) {
        spdlog::info("Keyword removed: {}", word);
    }
    reply(res, removed ? 200 : 404, {{"ok", removed}, {"word", word}, {"count", keywords->size()}});
}

void AdminServer::handle_check(const httplib::Request& req, httplib::Response& res) {
    std::string text;
    try {
        auto body = nlohmann::json::parse(req.body);
        text = body.value("text", "");
    } catch (const nlohmann::json::exception& e) {
        reply_error(res, 400, e.what());
        return;
    }

    if (util::trim(text).empty()) {
        reply_error(res, 400, "text is required");
        return;
    }

    try {
        auto decision = orchestrator_->check(text);
        reply(res, 200, {
            {"ok", true},
            {"outcome", outcome_name(decision.outcome)},
            {"source", source_name(decision.source)},
            {"words", decision.matched_words},
            {"original_text", decision.source_text},
            {"masked_text", decision.masked_text}
        });
    } catch (const OperationCancelled& e) {
        reply_error(res, 503, e.what());
    }
}
