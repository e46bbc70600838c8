#include "moderation_service.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace {

std::string excerpt(const std::string& text, size_t max_chars) {
    if (util::utf8_length(text) <= max_chars) {
        return text;
    }
    return util::truncate_utf8(text, max_chars) + "...";
}

nlohmann::json notice_body(const ModerationRequest& request,
                           const ModerationDecision& decision,
                           bool banned,
                           size_t excerpt_chars) {
    return {
        {"action", "notice"},
        {"group_id", request.group_id},
        {"user_id", request.user_id},
        {"user_name", request.user_name},
        {"source", source_name(decision.source)},
        {"words", decision.matched_words},
        {"excerpt", excerpt(decision.source_text, excerpt_chars)},
        {"tier", decision.tier},
        {"ban_duration", decision.ban_duration},
        {"banned", banned},
        {"ban_text", banned ? util::humanize_seconds(decision.ban_duration) : ""},
        {"severe", decision.tier >= 3},
        {"ts", util::current_iso8601()}
    };
}

} // namespace

const char* handle_result_name(HandleResult result) {
    switch (result) {
    case HandleResult::Ignored: return "ignored";
    case HandleResult::CoolingDown: return "cooling_down";
    case HandleResult::Clean: return "clean";
    case HandleResult::Unknown: return "unknown";
    case HandleResult::Actioned: return "actioned";
    case HandleResult::Dropped: return "dropped";
    }
    return "unknown";
}

ModerationService::ModerationService(std::shared_ptr<ModerationOrchestrator> orchestrator,
                                     std::shared_ptr<UserCooldownGate> cooldown,
                                     std::shared_ptr<ModerationStats> stats,
                                     ServiceOptions options,
                                     NoticePublisher notices)
    : orchestrator_(std::move(orchestrator))
    , cooldown_(std::move(cooldown))
    , stats_(std::move(stats))
    , options_(std::move(options))
    , notices_(std::move(notices))
{}

bool ModerationService::is_monitored(const std::string& group_id) const {
    if (options_.monitored_groups.empty()) {
        return true;
    }
    return std::find(options_.monitored_groups.begin(), options_.monitored_groups.end(), group_id)
        != options_.monitored_groups.end();
}

bool ModerationService::is_exempt(const std::string& role) const {
    if (role.empty()) {
        return false;
    }
    std::string folded = util::fold_case(role);
    for (const auto& exempt : options_.exempt_roles) {
        if (util::fold_case(exempt) == folded) {
            return true;
        }
    }
    return false;
}

bool ModerationService::decide(const ModerationRequest& request, ModerationDecision& decision) {
    try {
        decision = orchestrator_->moderate(request);
        return true;
    } catch (const StorageError& e) {
        spdlog::warn("Ledger write for {}/{} failed, retrying once: {}",
                     request.group_id, request.user_id, e.what());
    }

    try {
        decision = orchestrator_->moderate(request);
        return true;
    } catch (const StorageError& e) {
        spdlog::error("Dropping violation by {}/{} after retry: {}",
                      request.group_id, request.user_id, e.what());
        return false;
    }
}

HandleResult ModerationService::handle(PlatformEvent& event) {
    ModerationRequest request;
    request.group_id = event.group_id();
    request.user_id = event.user_id();
    request.user_name = event.user_name();
    request.text = event.text();

    if (!is_monitored(request.group_id) || util::trim(request.text).empty()) {
        return HandleResult::Ignored;
    }

    if (!cooldown_->allow(request.group_id, request.user_id)) {
        spdlog::debug("User {}/{} within cooldown, skipped", request.group_id, request.user_id);
        return HandleResult::CoolingDown;
    }

    ModerationDecision decision;
    if (!decide(request, decision)) {
        stats_->record_unknown();
        return HandleResult::Dropped;
    }

    if (decision.outcome == Outcome::Clean) {
        stats_->record_clean();
        return HandleResult::Clean;
    }

    if (decision.outcome == Outcome::Unknown) {
        // Could not classify: no action either way
        stats_->record_unknown();
        return HandleResult::Unknown;
    }

    if (options_.enable_message_delete && !event.delete_message()) {
        spdlog::warn("Failed to delete message from {}/{}", request.group_id, request.user_id);
    }

    bool banned = false;
    if (decision.ban_duration > 0) {
        if (is_exempt(event.role())) {
            spdlog::info("User {}/{} has exempt role {}, not banned",
                         request.group_id, request.user_id, event.role());
        } else {
            banned = event.set_ban(decision.ban_duration);
            if (!banned) {
                spdlog::warn("Failed to ban {}/{} for {}s",
                             request.group_id, request.user_id, decision.ban_duration);
            }
        }
    }

    stats_->record_violation(request.group_id, request.user_id, decision.matched_words, banned);
    publish_notices(request, decision, banned);

    return HandleResult::Actioned;
}

void ModerationService::publish_notices(const ModerationRequest& request,
                                        const ModerationDecision& decision,
                                        bool banned) {
    if (!notices_) {
        return;
    }

    if (options_.group_notice_enabled) {
        notices_(build_group_notice(request, decision, banned));
    }

    for (const auto& target : options_.admin_targets) {
        notices_(build_admin_notice(target, request, decision, banned));
    }
}

nlohmann::json ModerationService::build_group_notice(const ModerationRequest& request,
                                                     const ModerationDecision& decision,
                                                     bool banned) {
    auto notice = notice_body(request, decision, banned, 50);
    notice["scope"] = "group";
    return notice;
}

nlohmann::json ModerationService::build_admin_notice(const std::string& target,
                                                     const ModerationRequest& request,
                                                     const ModerationDecision& decision,
                                                     bool banned) {
    auto notice = notice_body(request, decision, banned, 100);
    notice["scope"] = "admin";
    notice["target"] = target;
    return notice;
}
