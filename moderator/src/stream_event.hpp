#pragma once

#include "platform_event.hpp"
#include "redis_bus.hpp"
#include <nlohmann/json.hpp>
#include <string>

// PlatformEvent over one inbound stream entry:
// {group_id, user_id, user_name, role, message_id, text}.
// Actions are published as entries on the actions stream.
class StreamPlatformEvent : public PlatformEvent {
public:
    StreamPlatformEvent(RedisBus& bus, std::string actions_stream, nlohmann::json message);

    std::string group_id() const override { return field("group_id"); }
    std::string user_id() const override { return field("user_id"); }
    std::string user_name() const override { return field("user_name"); }
    std::string role() const override { return field("role"); }
    std::string text() const override { return field("text"); }
    std::string message_id() const { return field("message_id"); }

    bool delete_message() override;
    bool set_ban(int duration_seconds) override;

private:
    RedisBus& bus_;
    std::string actions_stream_;
    nlohmann::json message_;

    // Identifiers may arrive as numbers; they are rendered as strings
    std::string field(const char* name) const;
};
