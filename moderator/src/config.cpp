#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val || util::trim(val).empty()) return default_val;

    std::string text = util::trim(val);
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " is not an integer: '" + text + "'");
    }
    if (consumed != text.size()) {
        throw ConfigError(std::string(name) + " is not an integer: '" + text + "'");
    }
    return parsed;
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val || util::trim(val).empty()) return default_val;

    std::string text = util::to_lower_ascii(util::trim(val));
    if (text == "1" || text == "true" || text == "yes" || text == "on") return true;
    if (text == "0" || text == "false" || text == "no" || text == "off") return false;
    throw ConfigError(std::string(name) + " is not a boolean: '" + text + "'");
}

std::vector<std::string> Config::get_env_list(const char* name, const std::string& default_val) {
    return util::split(get_env(name, default_val), ',');
}

Config Config::from_env() {
    Config cfg;

    cfg.service_name = get_env("SERVICE_NAME", "wordguard");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    cfg.worker_threads = get_env_int("WORKER_THREADS", 4);

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_inbound = get_env("STREAM_INBOUND", "wordguard.messages");
    cfg.stream_actions = get_env("STREAM_ACTIONS", "wordguard.actions");
    cfg.consumer_group = get_env("CONSUMER_GROUP", "wordguard");

    cfg.listen_addr = get_env("LISTEN_ADDR", "127.0.0.1");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);
    cfg.admin_token = get_env("ADMIN_TOKEN");

    cfg.api_endpoint = get_env("API_ENDPOINT", "https://uapis.cn/api/v1/text/profanitycheck");
    cfg.api_timeout_ms = get_env_int("API_TIMEOUT_MS", 10000);
    cfg.api_max_per_minute = get_env_int("API_MAX_PER_MINUTE", 30);
    cfg.api_max_per_hour = get_env_int("API_MAX_PER_HOUR", 1000);
    cfg.api_failure_cooldown_seconds = get_env_int("API_FAILURE_COOLDOWN_SECONDS", 30);
    cfg.api_throttled_cooldown_seconds = get_env_int("API_THROTTLED_COOLDOWN_SECONDS",
                                                     cfg.api_failure_cooldown_seconds * 2);
    cfg.api_max_inline_wait_seconds = get_env_int("API_MAX_INLINE_WAIT_SECONDS", 5);
    cfg.api_max_retries = get_env_int("API_MAX_RETRIES", 2);
    cfg.api_retry_base_ms = get_env_int("API_RETRY_BASE_MS", 500);
    cfg.api_retry_max_ms = get_env_int("API_RETRY_MAX_MS", 8000);
    cfg.api_retry_jitter_ms = get_env_int("API_RETRY_JITTER_MS", 250);

    cfg.cache_ttl_seconds = get_env_int("CACHE_TTL_SECONDS", 3600);
    cfg.cache_max_entries = get_env_int("CACHE_MAX_ENTRIES", 5000);

    cfg.ledger_backend = util::to_lower_ascii(get_env("LEDGER_BACKEND", "sqlite"));
    cfg.ledger_path = get_env("LEDGER_PATH", "data/violations.db");
    cfg.pg_dsn = get_env("PG_DSN");
    cfg.ledger_pool_min = get_env_int("LEDGER_POOL_MIN", 5);
    cfg.ledger_pool_max = get_env_int("LEDGER_POOL_MAX", 10);
    cfg.ledger_pool_wait_ms = get_env_int("LEDGER_POOL_WAIT_MS", 2000);
    cfg.ledger_max_text = get_env_int("LEDGER_MAX_TEXT", 500);

    cfg.ban_tier1_seconds = get_env_int("BAN_TIER1_SECONDS", 60);
    cfg.ban_tier2_seconds = get_env_int("BAN_TIER2_SECONDS", 600);
    cfg.ban_tier3_seconds = get_env_int("BAN_TIER3_SECONDS", 86400);
    cfg.reset_hour = get_env_int("RESET_HOUR", 4);
    cfg.max_log_days = get_env_int("MAX_LOG_DAYS", 30);

    cfg.enable_auto_ban = get_env_bool("ENABLE_AUTO_BAN", true);
    cfg.enable_message_delete = get_env_bool("ENABLE_MESSAGE_DELETE", true);
    cfg.enable_local_check = get_env_bool("ENABLE_LOCAL_CHECK", true);
    cfg.group_notice_enabled = get_env_bool("GROUP_NOTICE_ENABLED", true);
    cfg.statistics_enabled = get_env_bool("STATISTICS_ENABLED", true);
    cfg.user_cooldown_enabled = get_env_bool("USER_COOLDOWN_ENABLED", false);
    cfg.user_cooldown_seconds = get_env_int("USER_COOLDOWN_SECONDS", 60);
    cfg.monitored_groups = get_env_list("MONITORED_GROUPS");
    cfg.admin_targets = get_env_list("ADMIN_TARGETS");
    cfg.exempt_roles = get_env_list("EXEMPT_ROLES", "owner,admin");
    cfg.custom_forbidden_words = get_env_list("CUSTOM_FORBIDDEN_WORDS");

    return cfg;
}

void Config::validate() const {
    auto require_positive = [](const char* name, int value) {
        if (value <= 0) {
            throw ConfigError(std::string(name) + " must be positive, got " + std::to_string(value));
        }
    };

    require_positive("WORKER_THREADS", worker_threads);
    require_positive("API_TIMEOUT_MS", api_timeout_ms);
    require_positive("API_MAX_PER_MINUTE", api_max_per_minute);
    require_positive("API_MAX_PER_HOUR", api_max_per_hour);
    require_positive("API_FAILURE_COOLDOWN_SECONDS", api_failure_cooldown_seconds);
    require_positive("API_THROTTLED_COOLDOWN_SECONDS", api_throttled_cooldown_seconds);
    require_positive("API_RETRY_BASE_MS", api_retry_base_ms);
    require_positive("API_RETRY_MAX_MS", api_retry_max_ms);
    require_positive("CACHE_TTL_SECONDS", cache_ttl_seconds);
    require_positive("CACHE_MAX_ENTRIES", cache_max_entries);
    require_positive("LEDGER_POOL_MIN", ledger_pool_min);
    require_positive("LEDGER_POOL_MAX", ledger_pool_max);
    require_positive("LEDGER_POOL_WAIT_MS", ledger_pool_wait_ms);
    require_positive("LEDGER_MAX_TEXT", ledger_max_text);
    require_positive("MAX_LOG_DAYS", max_log_days);

    if (api_max_retries < 0 || api_retry_jitter_ms < 0 || api_max_inline_wait_seconds < 0) {
        throw ConfigError("retry counts and waits cannot be negative");
    }
    if (ledger_pool_min > ledger_pool_max) {
        throw ConfigError("LEDGER_POOL_MIN exceeds LEDGER_POOL_MAX");
    }
    if (ban_tier1_seconds < 0 || ban_tier2_seconds < 0 || ban_tier3_seconds < 0) {
        throw ConfigError("ban durations cannot be negative");
    }
    if (reset_hour < 0 || reset_hour > 23) {
        throw ConfigError("RESET_HOUR must be within 0-23, got " + std::to_string(reset_hour));
    }
    if (ledger_backend != "sqlite" && ledger_backend != "postgres") {
        throw ConfigError("LEDGER_BACKEND must be sqlite or postgres, got '" + ledger_backend + "'");
    }
    if (ledger_backend == "postgres" && pg_dsn.empty()) {
        throw ConfigError("PG_DSN is required when LEDGER_BACKEND=postgres");
    }
    if (user_cooldown_enabled && user_cooldown_seconds <= 0) {
        throw ConfigError("USER_COOLDOWN_SECONDS must be positive when the cooldown is enabled");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Upstream: {} ({}/min, {}/h)", api_endpoint, api_max_per_minute, api_max_per_hour);
    spdlog::info("  Ban ladder: {}s/{}s/{}s, reset hour {}",
                 ban_tier1_seconds, ban_tier2_seconds, ban_tier3_seconds, reset_hour);
    spdlog::info("  Ledger: {} (pool {}-{}), retention {} days",
                 ledger_backend == "postgres" ? util::redact_dsn(pg_dsn) : ledger_path,
                 ledger_pool_min, ledger_pool_max, max_log_days);
    spdlog::info("  Local words: {}, monitored groups: {}, user cooldown: {}",
                 custom_forbidden_words.size(),
                 monitored_groups.empty() ? std::string("all") : std::to_string(monitored_groups.size()),
                 user_cooldown_enabled ? "on" : "off");
}
