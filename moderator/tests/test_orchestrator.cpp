#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include "../src/errors.hpp"
#include "../src/orchestrator.hpp"

namespace {

ModerationRequest request(const std::string& text, const std::string& user = "u1") {
    return {"g1", user, "alice", text};
}

} // namespace

TEST_CASE("Moderation orchestrator", "[orchestrator]") {
    ClientHarness h;
    TempLedger t;
    auto keywords = std::make_shared<KeywordMatcher>(std::vector<std::string>{"casino", "Free Money"});

    OrchestratorOptions options;
    ModerationOrchestrator orchestrator(h.client, keywords, t.ledger, options);

    SECTION("Clean remote verdict records nothing") {
        auto d = orchestrator.moderate(request("good morning"));

        REQUIRE(d.outcome == Outcome::Clean);
        REQUIRE(d.source == VerdictSource::Remote);
        REQUIRE(d.tier == 0);
        REQUIRE(t.ledger->current_tier("g1", "u1").stored_count == 0);
    }

    SECTION("Local keyword hit skips the classifier") {
        auto d = orchestrator.moderate(request("Get FREE MONEY at the casino"));

        REQUIRE(d.outcome == Outcome::Violation);
        REQUIRE(d.source == VerdictSource::Local);
        REQUIRE(d.matched_words == std::vector<std::string>{"casino", "Free Money"});
        REQUIRE(d.tier == 1);
        REQUIRE(d.ban_duration == 60);
        REQUIRE(h.http->calls == 0);
    }

    SECTION("Remote violation escalates through the ledger") {
        h.http->fallback = FakeHttpClient::forbidden({"scam"}, "click this scam");

        auto first = orchestrator.moderate(request("click this scam"));
        auto second = orchestrator.moderate(request("click this scam"));

        REQUIRE(first.outcome == Outcome::Violation);
        REQUIRE(first.source == VerdictSource::Remote);
        REQUIRE(first.tier == 1);
        REQUIRE(second.tier == 2);
        REQUIRE(second.ban_duration == 600);
        REQUIRE(second.masked_text == "***");

        auto rows = t.ledger->history("g1", "u1");
        REQUIRE(rows[0].forbidden_words == std::vector<std::string>{"scam"});
        REQUIRE(rows[0].original_text == "click this scam");
    }

    SECTION("Unknown verdict leaves the ledger alone") {
        h.http->fallback = FakeHttpClient::http_status(502);

        auto d = orchestrator.moderate(request("hello"));
        REQUIRE(d.outcome == Outcome::Unknown);
        REQUIRE(d.source == VerdictSource::None);
        REQUIRE(t.ledger->current_tier("g1", "u1").stored_count == 0);
    }

    SECTION("Check classifies without recording") {
        auto d = orchestrator.check("casino night");
        REQUIRE(d.outcome == Outcome::Violation);
        REQUIRE(d.tier == 0);
        REQUIRE(t.ledger->current_tier("g1", "u1").stored_count == 0);
    }

    SECTION("Swapped keyword list applies to later messages") {
        orchestrator.replace_keywords(std::make_shared<KeywordMatcher>(std::vector<std::string>{"lottery"}));

        REQUIRE(orchestrator.check("casino").source == VerdictSource::Remote);
        REQUIRE(orchestrator.check("lottery win").source == VerdictSource::Local);
        REQUIRE(orchestrator.keywords()->size() == 1);
    }

    SECTION("Without a client, undecided text is unknown") {
        orchestrator.replace_client(nullptr);

        REQUIRE(orchestrator.check("hello").outcome == Outcome::Unknown);
        REQUIRE(orchestrator.check("casino").outcome == Outcome::Violation);
    }
}

TEST_CASE("Moderation orchestrator options", "[orchestrator]") {
    ClientHarness h;
    TempLedger t;
    auto keywords = std::make_shared<KeywordMatcher>(std::vector<std::string>{"casino"});

    SECTION("Disabled local check sends everything upstream") {
        OrchestratorOptions options;
        options.enable_local_check = false;
        ModerationOrchestrator orchestrator(h.client, keywords, t.ledger, options);

        auto d = orchestrator.moderate(request("casino"));
        REQUIRE(d.outcome == Outcome::Clean);
        REQUIRE(h.http->calls == 1);
    }

    SECTION("Disabled auto-ban still escalates but with zero duration") {
        OrchestratorOptions options;
        options.enable_auto_ban = false;
        ModerationOrchestrator orchestrator(h.client, keywords, t.ledger, options);

        auto first = orchestrator.moderate(request("casino"));
        auto second = orchestrator.moderate(request("casino"));
        REQUIRE(first.tier == 1);
        REQUIRE(first.ban_duration == 0);
        REQUIRE(second.tier == 2);
        REQUIRE(second.ban_duration == 0);
    }
}

TEST_CASE("Moderation orchestrator storage failure", "[orchestrator]") {
    ClientHarness h;
    TempLedger t(LedgerOptions{}, 1, std::chrono::milliseconds(20));
    auto keywords = std::make_shared<KeywordMatcher>(std::vector<std::string>{"casino"});
    ModerationOrchestrator orchestrator(h.client, keywords, t.ledger, OrchestratorOptions{});

    auto held = t.pool->acquire();
    REQUIRE_THROWS_AS(orchestrator.moderate(request("casino")), StorageError);

    held.release();
    REQUIRE(orchestrator.moderate(request("casino")).tier == 1);
}

TEST_CASE("Outcome names", "[orchestrator]") {
    REQUIRE(std::string(outcome_name(Outcome::Clean)) == "clean");
    REQUIRE(std::string(outcome_name(Outcome::Violation)) == "violation");
    REQUIRE(std::string(outcome_name(Outcome::Unknown)) == "unknown");
    REQUIRE(std::string(source_name(VerdictSource::Local)) == "local");
    REQUIRE(std::string(source_name(VerdictSource::Remote)) == "remote");
}
