#pragma once

#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Service
    std::string service_name;
    std::string log_level;
    int worker_threads;

    // Redis transport
    std::string redis_url;
    std::string stream_inbound;
    std::string stream_actions;
    std::string consumer_group;

    // Admin HTTP
    std::string listen_addr;
    int listen_port;
    std::string admin_token;

    // Upstream classifier
    std::string api_endpoint;
    int api_timeout_ms;
    int api_max_per_minute;
    int api_max_per_hour;
    int api_failure_cooldown_seconds;
    int api_throttled_cooldown_seconds;
    int api_max_inline_wait_seconds;
    int api_max_retries;
    int api_retry_base_ms;
    int api_retry_max_ms;
    int api_retry_jitter_ms;

    // Content cache
    int cache_ttl_seconds;
    int cache_max_entries;

    // Ledger storage
    std::string ledger_backend;  // "sqlite" or "postgres"
    std::string ledger_path;
    std::string pg_dsn;
    int ledger_pool_min;
    int ledger_pool_max;
    int ledger_pool_wait_ms;
    int ledger_max_text;

    // Escalation
    int ban_tier1_seconds;
    int ban_tier2_seconds;
    int ban_tier3_seconds;
    int reset_hour;
    int max_log_days;

    // Moderation behaviour
    bool enable_auto_ban;
    bool enable_message_delete;
    bool enable_local_check;
    bool group_notice_enabled;
    bool statistics_enabled;
    bool user_cooldown_enabled;
    int user_cooldown_seconds;
    std::vector<std::string> monitored_groups;
    std::vector<std::string> admin_targets;
    std::vector<std::string> exempt_roles;
    std::vector<std::string> custom_forbidden_words;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static bool get_env_bool(const char* name, bool default_val);
    static std::vector<std::string> get_env_list(const char* name, const std::string& default_val = "");
};
