#include "config.hpp"
#include "errors.hpp"
#include "shutdown_signal.hpp"
#include "consumer_loop.hpp"
#include "ledger_backend.hpp"
#include "violation_ledger.hpp"
#include "http_client.hpp"
#include "classification_client.hpp"
#include "keyword_matcher.hpp"
#include "orchestrator.hpp"
#include "moderation_stats.hpp"
#include "user_cooldown.hpp"
#include "moderation_service.hpp"
#include "redis_bus.hpp"
#include "stream_event.hpp"
#include "health.hpp"
#include "admin_server.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    (void)signal;
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("wordguard", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

std::shared_ptr<ClassificationClient> build_client(const Config& config, ShutdownSignal& shutdown) {
    ClientOptions options;
    options.endpoint = config.api_endpoint;
    options.max_inline_wait_seconds = config.api_max_inline_wait_seconds;
    options.retry.max_retries = config.api_max_retries;
    options.retry.base_delay = std::chrono::milliseconds(config.api_retry_base_ms);
    options.retry.max_delay = std::chrono::milliseconds(config.api_retry_max_ms);
    options.retry.jitter_max = std::chrono::milliseconds(config.api_retry_jitter_ms);

    auto limiter = std::make_unique<SlidingWindowLimiter>(
        config.api_max_per_minute,
        config.api_max_per_hour,
        config.api_failure_cooldown_seconds,
        config.api_throttled_cooldown_seconds);

    auto cache = std::make_unique<ContentCache>(
        config.cache_ttl_seconds,
        static_cast<size_t>(config.cache_max_entries));

    return std::make_shared<ClassificationClient>(
        options,
        std::make_shared<HttpClient>(config.api_timeout_ms),
        std::move(limiter),
        std::move(cache),
        [&shutdown](std::chrono::milliseconds delay) { return shutdown.wait_for(delay); });
}

void run_worker(int index,
                const Config& config,
                RedisBus& bus,
                ModerationService& service,
                ShutdownSignal& shutdown) {
    std::string consumer = config.service_name + "-" + std::to_string(index);
    spdlog::info("Worker {} consuming {}", consumer, config.stream_inbound);

    ConsumerLoop loop(
        consumer,
        [&]() {
            return bus.read_messages(config.stream_inbound, config.consumer_group, consumer, 10, 1000);
        },
        [&](const std::string& msg_id, const nlohmann::json& payload) {
            StreamPlatformEvent event(bus, config.stream_actions, payload);
            auto result = service.handle(event);
            spdlog::debug("Message {} {}", msg_id, handle_result_name(result));
        },
        [&](const std::string& msg_id) {
            bus.ack_message(config.stream_inbound, config.consumer_group, msg_id);
        });

    loop.run(shutdown);
}

void run_maintenance(ClassificationClient& client,
                     UserCooldownGate& cooldown,
                     ModerationStats& stats,
                     ViolationLedger& ledger,
                     ShutdownSignal& shutdown) {
    const auto interval = std::chrono::minutes(5);
    const size_t max_stat_tallies = 10000;

    while (shutdown.wait_for(interval)) {
        size_t evicted = client.cache().evict();
        size_t pruned = cooldown.prune() + stats.prune(max_stat_tallies);

        int removed = 0;
        try {
            removed = ledger.cleanup_expired();
        } catch (const StorageError& e) {
            spdlog::warn("Scheduled retention cleanup failed: {}", e.what());
        }

        spdlog::debug("Maintenance: {} cache entries evicted, {} cooldowns and tallies pruned, {} records removed",
                      evicted, pruned, removed);
    }
}

int main() {
    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();

        spdlog::info("Starting {} (admin on {}:{})",
                     config.service_name, config.listen_addr, config.listen_port);

        curl_global_init(CURL_GLOBAL_DEFAULT);

        ShutdownSignal shutdown;

        // Ledger
        LedgerOptions ledger_options;
        ledger_options.ladder.tier1_seconds = config.ban_tier1_seconds;
        ledger_options.ladder.tier2_seconds = config.ban_tier2_seconds;
        ledger_options.ladder.tier3_seconds = config.ban_tier3_seconds;
        ledger_options.reset_hour = config.reset_hour;
        ledger_options.max_log_days = config.max_log_days;
        ledger_options.max_text = static_cast<size_t>(config.ledger_max_text);

        auto ledger = std::make_shared<ViolationLedger>(create_ledger_pool(config), ledger_options);
        ledger->init_schema();

        // Decision pipeline
        auto client = build_client(config, shutdown);
        auto keywords = std::make_shared<KeywordMatcher>(config.custom_forbidden_words);

        OrchestratorOptions orchestrator_options;
        orchestrator_options.enable_local_check = config.enable_local_check;
        orchestrator_options.enable_auto_ban = config.enable_auto_ban;

        auto orchestrator = std::make_shared<ModerationOrchestrator>(
            client, keywords, ledger, orchestrator_options);

        auto stats = std::make_shared<ModerationStats>(config.statistics_enabled);
        auto cooldown = std::make_shared<UserCooldownGate>(
            config.user_cooldown_enabled, config.user_cooldown_seconds);

        // Transport
        auto bus = std::make_shared<RedisBus>(config.redis_url);
        if (!bus->ping()) {
            spdlog::error("Failed to connect to Redis");
            return 1;
        }
        bus->create_consumer_group(config.stream_inbound, config.consumer_group);

        ServiceOptions service_options;
        service_options.monitored_groups = config.monitored_groups;
        service_options.exempt_roles = config.exempt_roles;
        service_options.admin_targets = config.admin_targets;
        service_options.enable_message_delete = config.enable_message_delete;
        service_options.group_notice_enabled = config.group_notice_enabled;

        const std::string actions_stream = config.stream_actions;
        ModerationService service(orchestrator, cooldown, stats, service_options,
            [bus, actions_stream](const nlohmann::json& notice) {
                bus->publish(actions_stream, notice);
            });

        // Admin API
        auto health = std::make_shared<HealthCheck>(bus, ledger);
        AdminServer admin(config, orchestrator, stats, cooldown, health);
        admin.start();

        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        std::vector<std::thread> workers;
        for (int i = 0; i < config.worker_threads; i++) {
            workers.emplace_back(run_worker, i, std::cref(config), std::ref(*bus),
                                 std::ref(service), std::ref(shutdown));
        }

        std::thread maintenance(run_maintenance, std::ref(*client), std::ref(*cooldown), std::ref(*stats),
                                std::ref(*ledger), std::ref(shutdown));

        spdlog::info("{} running with {} workers", config.service_name, config.worker_threads);

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        // Graceful shutdown
        spdlog::info("Shutting down gracefully");
        shutdown.trigger();

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        if (maintenance.joinable()) {
            maintenance.join();
        }

        admin.stop();
        curl_global_cleanup();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
