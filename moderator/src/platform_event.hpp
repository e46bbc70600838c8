#pragma once

#include <string>

// One inbound chat message plus the platform actions that can be taken on it
class PlatformEvent {
public:
    virtual ~PlatformEvent() = default;

    virtual std::string group_id() const = 0;
    virtual std::string user_id() const = 0;
    virtual std::string user_name() const = 0;
    virtual std::string role() const = 0;
    virtual std::string text() const = 0;

    virtual bool delete_message() = 0;
    virtual bool set_ban(int duration_seconds) = 0;
};
