#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/moderation_stats.hpp"

TEST_CASE("Moderation stats", "[moderation_stats]") {
    ModerationStats stats(true);

    SECTION("Counters follow recorded outcomes") {
        stats.record_clean();
        stats.record_clean();
        stats.record_unknown();
        stats.record_violation("g1", "u1", {"spam"}, true);

        REQUIRE(stats.total_checks() == 4);
        REQUIRE(stats.detected() == 1);
        REQUIRE(stats.unknown() == 1);
        REQUIRE(stats.auto_bans() == 1);

        auto j = stats.to_json();
        REQUIRE_THAT(j["detection_rate"].get<double>(), Catch::Matchers::WithinAbs(25.0, 0.001));
    }

    SECTION("Groups count distinct users") {
        stats.record_violation("g1", "u1", {"spam"}, true);
        stats.record_violation("g1", "u1", {"spam"}, false);
        stats.record_violation("g1", "u2", {"scam"}, true);

        auto g = stats.to_json()["groups"]["g1"];
        REQUIRE(g["total"] == 3);
        REQUIRE(g["bans"] == 2);
        REQUIRE(g["users"] == 2);
    }

    SECTION("Top lists rank by hits, then name") {
        stats.record_violation("g1", "u1", {"spam", "scam"}, true);
        stats.record_violation("g1", "u2", {"scam"}, false);
        stats.record_violation("g1", "u2", {"casino"}, false);

        auto j = stats.to_json(2);
        REQUIRE(j["top_words"].size() == 2);
        REQUIRE(j["top_words"][0]["word"] == "scam");
        REQUIRE(j["top_words"][0]["total"] == 2);
        REQUIRE(j["top_words"][1]["word"] == "casino");

        REQUIRE(j["top_users"][0]["user"] == "g1:u2");
        REQUIRE(j["top_users"][0]["bans"] == 0);
    }

    SECTION("Empty stats report a zero rate") {
        auto j = stats.to_json();
        REQUIRE(j["detection_rate"].get<double>() == 0.0);
        REQUIRE(j["top_users"].empty());
    }

    SECTION("Reset clears everything") {
        stats.record_violation("g1", "u1", {"spam"}, true);
        stats.reset();

        REQUIRE(stats.total_checks() == 0);
        REQUIRE(stats.to_json()["groups"].empty());
    }
}

TEST_CASE("Disabled stats record nothing", "[moderation_stats]") {
    ModerationStats stats(false);
    stats.record_clean();
    stats.record_violation("g1", "u1", {"spam"}, true);

    REQUIRE(stats.total_checks() == 0);
    REQUIRE(stats.to_json()["enabled"] == false);
}

TEST_CASE("Moderation stats pruning", "[moderation_stats]") {
    ModerationStats stats(true);

    stats.record_violation("g1", "u1", {"spam", "scam"}, true);
    stats.record_violation("g1", "u1", {"spam"}, true);
    stats.record_violation("g1", "u2", {"spam"}, false);
    stats.record_violation("g1", "u3", {"casino"}, false);

    SECTION("Keeps the busiest users and words") {
        REQUIRE(stats.prune(1) == 4);

        auto j = stats.to_json();
        REQUIRE(j["top_users"].size() == 1);
        REQUIRE(j["top_users"][0]["user"] == "g1:u1");
        REQUIRE(j["top_words"].size() == 1);
        REQUIRE(j["top_words"][0]["word"] == "spam");
    }

    SECTION("Counters and groups are untouched") {
        stats.prune(1);
        REQUIRE(stats.detected() == 4);
        REQUIRE(stats.to_json()["groups"]["g1"]["users"] == 3);
    }

    SECTION("Nothing to drop under the limit") {
        REQUIRE(stats.prune(10) == 0);
        REQUIRE(stats.to_json()["top_users"].size() == 3);
    }
}
