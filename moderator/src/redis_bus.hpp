#pragma once

#include <string>
#include <memory>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

class RedisBus {
public:
    explicit RedisBus(const std::string& redis_url);

    // Returns false when the entry could not be written
    bool publish(const std::string& stream, const nlohmann::json& data);

    void create_consumer_group(const std::string& stream, const std::string& group);

    // Redis errors (connection loss, NOGROUP) propagate
    std::vector<std::pair<std::string, nlohmann::json>>
        read_messages(const std::string& stream, const std::string& group,
                      const std::string& consumer, int count = 10, int block_ms = 1000);

    void ack_message(const std::string& stream, const std::string& group,
                     const std::string& msg_id);

    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
};
