#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include "../src/moderation_service.hpp"

namespace {

class FakeEvent : public PlatformEvent {
public:
    FakeEvent(std::string text, std::string user = "u1", std::string group = "g1")
        : text_(std::move(text)), user_(std::move(user)), group_(std::move(group)) {}

    std::string group_id() const override { return group_; }
    std::string user_id() const override { return user_; }
    std::string user_name() const override { return "alice"; }
    std::string role() const override { return role_; }
    std::string text() const override { return text_; }

    bool delete_message() override {
        deleted++;
        return delete_ok;
    }

    bool set_ban(int duration_seconds) override {
        bans.push_back(duration_seconds);
        return ban_ok;
    }

    std::string role_ = "member";
    int deleted = 0;
    std::vector<int> bans;
    bool delete_ok = true;
    bool ban_ok = true;

private:
    std::string text_;
    std::string user_;
    std::string group_;
};

struct ServiceHarness {
    explicit ServiceHarness(ServiceOptions options = ServiceOptions{},
                            LedgerOptions ledger_options = LedgerOptions{},
                            int pool_max = 8,
                            std::chrono::milliseconds pool_wait = std::chrono::milliseconds(10000))
        : ledger(ledger_options, pool_max, pool_wait)
    {
        keywords = std::make_shared<KeywordMatcher>(std::vector<std::string>{"casino"});
        orchestrator = std::make_shared<ModerationOrchestrator>(
            client.client, keywords, ledger.ledger, OrchestratorOptions{});
        cooldown = std::make_shared<UserCooldownGate>(true, 3, [this]() { return cooldown_now_ms; });
        stats = std::make_shared<ModerationStats>(true);

        if (options.exempt_roles.empty()) {
            options.exempt_roles = {"admin", "Owner"};
        }

        service = std::make_unique<ModerationService>(
            orchestrator, cooldown, stats, options,
            [this](const nlohmann::json& notice) { notices.push_back(notice); });
    }

    // Moves past the per-user cooldown between messages
    HandleResult handle(FakeEvent& event) {
        cooldown_now_ms += 10000;
        return service->handle(event);
    }

    ClientHarness client;
    TempLedger ledger;
    int64_t cooldown_now_ms = 1000000;
    std::shared_ptr<KeywordMatcher> keywords;
    std::shared_ptr<ModerationOrchestrator> orchestrator;
    std::shared_ptr<UserCooldownGate> cooldown;
    std::shared_ptr<ModerationStats> stats;
    std::vector<nlohmann::json> notices;
    std::unique_ptr<ModerationService> service;
};

} // namespace

TEST_CASE("Moderation service actions", "[moderation_service]") {
    ServiceHarness h;

    SECTION("Violation deletes, bans and notifies") {
        FakeEvent event("come to the casino");

        REQUIRE(h.handle(event) == HandleResult::Actioned);
        REQUIRE(event.deleted == 1);
        REQUIRE(event.bans == std::vector<int>{60});

        REQUIRE(h.notices.size() == 1);
        REQUIRE(h.notices[0]["scope"] == "group");
        REQUIRE(h.notices[0]["tier"] == 1);
        REQUIRE(h.notices[0]["banned"] == true);
        REQUIRE(h.notices[0]["ban_text"] == "1 minute");
        REQUIRE(h.notices[0]["severe"] == false);

        REQUIRE(h.stats->detected() == 1);
        REQUIRE(h.stats->auto_bans() == 1);
    }

    SECTION("Repeat offenders get longer bans") {
        FakeEvent event("casino");
        h.handle(event);
        h.handle(event);
        h.handle(event);

        REQUIRE(event.bans == std::vector<int>{60, 600, 86400});
        REQUIRE(h.notices.back()["severe"] == true);
        REQUIRE(h.notices.back()["ban_text"] == "24 hours");
    }

    SECTION("Clean messages are left alone") {
        FakeEvent event("nice weather today");

        REQUIRE(h.handle(event) == HandleResult::Clean);
        REQUIRE(event.deleted == 0);
        REQUIRE(event.bans.empty());
        REQUIRE(h.notices.empty());
        REQUIRE(h.stats->total_checks() == 1);
    }

    SECTION("Unknown verdicts take no action") {
        h.client.http->fallback = FakeHttpClient::http_status(500);
        FakeEvent event("hello");

        REQUIRE(h.handle(event) == HandleResult::Unknown);
        REQUIRE(event.deleted == 0);
        REQUIRE(event.bans.empty());
        REQUIRE(h.stats->unknown() == 1);
    }

    SECTION("Exempt roles lose the message but keep their access") {
        FakeEvent event("casino");
        event.role_ = "ADMIN";

        REQUIRE(h.handle(event) == HandleResult::Actioned);
        REQUIRE(event.deleted == 1);
        REQUIRE(event.bans.empty());
        REQUIRE(h.notices[0]["banned"] == false);
        REQUIRE(h.notices[0]["ban_text"] == "");
        REQUIRE(h.ledger.ledger->current_tier("g1", "u1").stored_count == 1);
    }

    SECTION("A failed ban is reported but the violation still counts") {
        FakeEvent event("casino");
        event.ban_ok = false;
        event.delete_ok = false;

        REQUIRE(h.handle(event) == HandleResult::Actioned);
        REQUIRE(h.stats->detected() == 1);
        REQUIRE(h.stats->auto_bans() == 0);
    }

    SECTION("Blank text is ignored") {
        FakeEvent event("   ");
        REQUIRE(h.handle(event) == HandleResult::Ignored);
        REQUIRE(h.client.http->calls == 0);
    }
}

TEST_CASE("Moderation service gating", "[moderation_service]") {
    SECTION("Unmonitored groups are ignored") {
        ServiceOptions options;
        options.monitored_groups = {"g1"};
        ServiceHarness h(options);

        FakeEvent outside("casino", "u1", "g9");
        REQUIRE(h.handle(outside) == HandleResult::Ignored);
        REQUIRE(outside.deleted == 0);

        FakeEvent inside("casino", "u1", "g1");
        REQUIRE(h.handle(inside) == HandleResult::Actioned);
    }

    SECTION("A user is checked once per cooldown window") {
        ServiceHarness h;
        FakeEvent event("hello");

        REQUIRE(h.service->handle(event) == HandleResult::Clean);
        REQUIRE(h.service->handle(event) == HandleResult::CoolingDown);
        REQUIRE(h.client.http->calls == 1);

        FakeEvent other("hello", "u2");
        REQUIRE(h.service->handle(other) == HandleResult::Clean);

        h.cooldown_now_ms += 3000;
        REQUIRE(h.service->handle(event) == HandleResult::Clean);
    }

    SECTION("Admin targets each get a notice") {
        ServiceOptions options;
        options.admin_targets = {"ops-a", "ops-b"};
        options.group_notice_enabled = false;
        ServiceHarness h(options);

        FakeEvent event("casino");
        h.handle(event);

        REQUIRE(h.notices.size() == 2);
        REQUIRE(h.notices[0]["scope"] == "admin");
        REQUIRE(h.notices[0]["target"] == "ops-a");
        REQUIRE(h.notices[1]["target"] == "ops-b");
    }

    SECTION("Message deletion can be switched off") {
        ServiceOptions options;
        options.enable_message_delete = false;
        ServiceHarness h(options);

        FakeEvent event("casino");
        REQUIRE(h.handle(event) == HandleResult::Actioned);
        REQUIRE(event.deleted == 0);
        REQUIRE(event.bans.size() == 1);
    }
}

TEST_CASE("Moderation service storage failure", "[moderation_service]") {
    ServiceHarness h(ServiceOptions{}, LedgerOptions{}, 1, std::chrono::milliseconds(20));
    auto held = h.ledger.pool->acquire();

    FakeEvent event("casino");
    REQUIRE(h.handle(event) == HandleResult::Dropped);
    REQUIRE(event.deleted == 0);
    REQUIRE(event.bans.empty());
    REQUIRE(h.notices.empty());
    REQUIRE(h.stats->unknown() == 1);
}

TEST_CASE("Moderation notices", "[moderation_service]") {
    ModerationRequest request{"g1", "u1", "alice", ""};
    ModerationDecision decision;
    decision.outcome = Outcome::Violation;
    decision.source = VerdictSource::Remote;
    decision.tier = 2;
    decision.ban_duration = 600;
    decision.matched_words = {"spam"};
    decision.source_text = std::string(120, 'x');

    SECTION("Group notices carry a short excerpt") {
        auto notice = ModerationService::build_group_notice(request, decision, true);
        REQUIRE(notice["excerpt"].get<std::string>() == std::string(50, 'x') + "...");
        REQUIRE(notice["ban_text"] == "10 minutes");
        REQUIRE(notice["source"] == "remote");
        REQUIRE(notice["words"] == nlohmann::json::array({"spam"}));
    }

    SECTION("Admin notices carry a longer excerpt") {
        auto notice = ModerationService::build_admin_notice("ops", request, decision, false);
        REQUIRE(notice["excerpt"].get<std::string>() == std::string(100, 'x') + "...");
        REQUIRE(notice["target"] == "ops");
        REQUIRE(notice["banned"] == false);
    }

    SECTION("Short text is not marked as cut") {
        decision.source_text = "short";
        auto notice = ModerationService::build_group_notice(request, decision, true);
        REQUIRE(notice["excerpt"] == "short");
    }
}

TEST_CASE("Exempt roles match without case", "[moderation_service]") {
    ServiceHarness h;
    REQUIRE(h.service->is_exempt("owner"));
    REQUIRE(h.service->is_exempt("Admin"));
    REQUIRE_FALSE(h.service->is_exempt("member"));
    REQUIRE_FALSE(h.service->is_exempt(""));
    REQUIRE(h.service->is_monitored("anything"));
    REQUIRE(std::string(handle_result_name(HandleResult::Dropped)) == "dropped");
}
