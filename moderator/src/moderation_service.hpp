#pragma once

#include "orchestrator.hpp"
#include "platform_event.hpp"
#include "user_cooldown.hpp"
#include "moderation_stats.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

enum class HandleResult {
    Ignored,      // unmonitored group or empty text
    CoolingDown,
    Clean,
    Unknown,
    Actioned,
    Dropped       // violation found but the ledger write failed twice
};

const char* handle_result_name(HandleResult result);

struct ServiceOptions {
    std::vector<std::string> monitored_groups;   // empty = every group
    std::vector<std::string> exempt_roles;
    std::vector<std::string> admin_targets;
    bool enable_message_delete = true;
    bool group_notice_enabled = true;
};

using NoticePublisher = std::function<void(const nlohmann::json&)>;

// Applies moderation decisions to platform events
class ModerationService {
public:
    ModerationService(std::shared_ptr<ModerationOrchestrator> orchestrator,
                      std::shared_ptr<UserCooldownGate> cooldown,
                      std::shared_ptr<ModerationStats> stats,
                      ServiceOptions options,
                      NoticePublisher notices);

    // OperationCancelled propagates
    HandleResult handle(PlatformEvent& event);

    bool is_monitored(const std::string& group_id) const;
    bool is_exempt(const std::string& role) const;

    static nlohmann::json build_group_notice(const ModerationRequest& request,
                                             const ModerationDecision& decision,
                                             bool banned);
    static nlohmann::json build_admin_notice(const std::string& target,
                                             const ModerationRequest& request,
                                             const ModerationDecision& decision,
                                             bool banned);

private:
    std::shared_ptr<ModerationOrchestrator> orchestrator_;
    std::shared_ptr<UserCooldownGate> cooldown_;
    std::shared_ptr<ModerationStats> stats_;
    ServiceOptions options_;
    NoticePublisher notices_;

    bool decide(const ModerationRequest& request, ModerationDecision& decision);
    void publish_notices(const ModerationRequest& request, const ModerationDecision& decision, bool banned);
};
