#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <iterator>
#include <unordered_map>

RedisBus::RedisBus(const std::string& redis_url) {
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        spdlog::info("Connected to Redis: {}", redis_url);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

bool RedisBus::publish(const std::string& stream, const nlohmann::json& data) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["data"] = data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

        redis_->xadd(stream, "*", fields.begin(), fields.end());
        spdlog::debug("Published {} to {}", data.value("action", "entry"), stream);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish to {}: {}", stream, e.what());
        return false;
    }
}

void RedisBus::create_consumer_group(const std::string& stream, const std::string& group) {
    try {
        redis_->xgroup_create(stream, group, "$", true);
        spdlog::info("Created consumer group {} on stream {}", group, stream);
    } catch (const sw::redis::Error& e) {
        // BUSYGROUP when it already exists
        spdlog::debug("Consumer group may already exist: {}", e.what());
    }
}

std::vector<std::pair<std::string, nlohmann::json>>
RedisBus::read_messages(const std::string& stream, const std::string& group,
                        const std::string& consumer, int count, int block_ms) {
    std::vector<std::pair<std::string, nlohmann::json>> results;

    try {
        std::unordered_map<std::string, sw::redis::ItemStream> items;

        redis_->xreadgroup(group, consumer,
            stream, ">",
            count,
            std::chrono::milliseconds(block_ms),
            std::inserter(items, items.end()));

        for (const auto& [stream_name, item_stream] : items) {
            for (const auto& item : item_stream) {
                auto it = item.second.find("data");
                if (it == item.second.end()) {
                    // Nothing to moderate; ack so it does not sit in the PEL
                    ack_message(stream_name, group, item.first);
                    continue;
                }
                try {
                    results.emplace_back(item.first, nlohmann::json::parse(it->second));
                } catch (const nlohmann::json::exception& e) {
                    spdlog::error("Failed to parse message {}: {}", item.first, e.what());
                    ack_message(stream_name, group, item.first);
                }
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to read messages from {}: {}", stream, e.what());
        throw;
    }

    return results;
}

void RedisBus::ack_message(const std::string& stream, const std::string& group,
                           const std::string& msg_id) {
    try {
        redis_->xack(stream, group, msg_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to ack message: {}", e.what());
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Redis ping failed: {}", e.what());
        return false;
    }
}
