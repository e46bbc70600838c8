#include "stream_event.hpp"
#include "util.hpp"
#include <utility>

StreamPlatformEvent::StreamPlatformEvent(RedisBus& bus, std::string actions_stream, nlohmann::json message)
    : bus_(bus)
    , actions_stream_(std::move(actions_stream))
    , message_(std::move(message))
{}

std::string StreamPlatformEvent::field(const char* name) const {
    if (!message_.is_object() || !message_.contains(name)) {
        return "";
    }
    const auto& value = message_[name];
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<int64_t>());
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

bool StreamPlatformEvent::delete_message() {
    nlohmann::json action = {
        {"action", "delete_message"},
        {"group_id", group_id()},
        {"user_id", user_id()},
        {"message_id", message_id()},
        {"ts", util::current_iso8601()}
    };
    return bus_.publish(actions_stream_, action);
}

bool StreamPlatformEvent::set_ban(int duration_seconds) {
    nlohmann::json action = {
        {"action", "ban"},
        {"group_id", group_id()},
        {"user_id", user_id()},
        {"duration", duration_seconds},
        {"ts", util::current_iso8601()}
    };
    return bus_.publish(actions_stream_, action);
}
