#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include "../src/errors.hpp"

using std::chrono::milliseconds;

TEST_CASE("Classification client gating", "[classification_client]") {
    SECTION("Minute budget defers the call without contacting upstream") {
        ClientHarness h(2);

        REQUIRE(h.client->classify("first message").has_value());
        REQUIRE(h.client->classify("second message").has_value());
        REQUIRE_FALSE(h.client->classify("third message").has_value());

        REQUIRE(h.http->calls == 2);
        REQUIRE(h.client->stats().rate_limited == 1);
        REQUIRE(h.sleeps.empty());
    }

    SECTION("Short limiter waits are absorbed inline") {
        ClientHarness h(2);

        h.client->classify("first message");
        h.client->classify("second message");

        // Oldest call leaves the minute window in 3s
        h.now_ms += 57000;
        auto verdict = h.client->classify("third message");

        REQUIRE(verdict.has_value());
        REQUIRE(h.sleeps.size() == 1);
        REQUIRE(h.sleeps[0] == milliseconds(3000));
        REQUIRE(h.http->calls == 3);
    }

    SECTION("Interrupted inline wait cancels the call") {
        ClientHarness h(1);

        h.client->classify("first message");
        h.now_ms += 58000;
        h.allow_sleep = false;

        REQUIRE_THROWS_AS(h.client->classify("second message"), OperationCancelled);
        REQUIRE(h.http->calls == 1);
    }

    SECTION("Blank text is clean without a call") {
        ClientHarness h;

        auto verdict = h.client->classify("  \n\t ");
        REQUIRE(verdict.has_value());
        REQUIRE_FALSE(verdict->is_violation);
        REQUIRE(h.http->calls == 0);
    }
}

TEST_CASE("Classification client caching", "[classification_client]") {
    ClientHarness h;

    SECTION("Violations are served from the cache") {
        h.http->fallback = FakeHttpClient::forbidden({"spam"}, "Buy spam");

        auto first = h.client->classify("Buy spam");
        auto second = h.client->classify("  buy SPAM ");

        REQUIRE(first.has_value());
        REQUIRE(first->is_violation);
        REQUIRE(second.has_value());
        REQUIRE(second->matched_terms == std::vector<std::string>{"spam"});
        REQUIRE(h.http->calls == 1);
        REQUIRE(h.client->stats().cache_hits == 1);
    }

    SECTION("Clean verdicts are re-checked every time") {
        h.client->classify("hello there");
        h.client->classify("hello there");

        REQUIRE(h.http->calls == 2);
        REQUIRE(h.client->stats().cache_hits == 0);
        REQUIRE(h.client->cache().size() == 0);
    }

    SECTION("Failures are not cached") {
        h.http->fallback = FakeHttpClient::transport_error();
        REQUIRE_FALSE(h.client->classify("hello").has_value());
        REQUIRE(h.client->cache().size() == 0);
    }
}

TEST_CASE("Classification client failures", "[classification_client]") {
    SECTION("Server errors are retried, then the limiter cools down") {
        ClientHarness h;
        h.http->fallback = FakeHttpClient::http_status(500);

        REQUIRE_FALSE(h.client->classify("hello").has_value());
        REQUIRE(h.http->calls == 3);

        auto s = h.client->stats();
        REQUIRE(s.attempted == 1);
        REQUIRE(s.failed == 1);
        REQUIRE(s.retries == 2);
        REQUIRE(h.sleeps.size() == 2);

        REQUIRE(h.client->limiter().snapshot().cooldown_remaining_seconds == 30.0);

        // Cooldown is longer than the inline wait, so nothing reaches upstream
        h.http->fallback = FakeHttpClient::clean();
        REQUIRE_FALSE(h.client->classify("hello").has_value());
        REQUIRE(h.http->calls == 3);
    }

    SECTION("Throttling uses the longer cooldown") {
        ClientHarness h;
        h.http->fallback = FakeHttpClient::http_status(429);

        REQUIRE_FALSE(h.client->classify("hello").has_value());
        REQUIRE(h.client->limiter().snapshot().cooldown_remaining_seconds == 60.0);
    }

    SECTION("A transient failure recovers on retry") {
        ClientHarness h;
        h.http->scripted.push_back(FakeHttpClient::transport_error());
        h.http->fallback = FakeHttpClient::forbidden({"scam"}, "scam link");

        auto verdict = h.client->classify("scam link");
        REQUIRE(verdict.has_value());
        REQUIRE(verdict->is_violation);
        REQUIRE(h.http->calls == 2);
        REQUIRE(h.client->stats().retries == 1);
        REQUIRE(h.client->stats().succeeded == 1);
        REQUIRE(h.client->limiter().snapshot().cooldown_remaining_seconds == 0.0);
        REQUIRE(h.client->limiter().snapshot().minute_count == 1);
    }

    SECTION("Unparseable bodies count as failures") {
        ClientHarness h;
        h.http->fallback = HttpResponse{200, "<html>gateway</html>", ""};

        REQUIRE_FALSE(h.client->classify("hello").has_value());
        REQUIRE(h.http->calls == 3);
    }

    SECTION("Shutdown during backoff cancels the call") {
        ClientHarness h;
        h.http->fallback = FakeHttpClient::http_status(503);
        h.allow_sleep = false;

        REQUIRE_THROWS_AS(h.client->classify("hello"), OperationCancelled);
        REQUIRE(h.http->calls == 1);
    }

    SECTION("Retries can be disabled") {
        ClientHarness h(30, 1000, 0);
        h.http->fallback = FakeHttpClient::http_status(500);

        REQUIRE_FALSE(h.client->classify("hello").has_value());
        REQUIRE(h.http->calls == 1);
        REQUIRE(h.sleeps.empty());
    }
}

TEST_CASE("Classification response parsing", "[classification_client]") {
    SECTION("Forbidden status is a violation") {
        auto v = ClassificationClient::parse_verdict(
            R"({"status":"forbidden","forbidden_words":["spam",7,"scam"],"original_text":"x","masked_text":"*"})");
        REQUIRE(v.has_value());
        REQUIRE(v->is_violation);
        REQUIRE(v->matched_terms == std::vector<std::string>{"spam", "scam"});
        REQUIRE(v->original_text == "x");
        REQUIRE(v->masked_text == "*");
    }

    SECTION("Any other status is clean") {
        auto v = ClassificationClient::parse_verdict(R"({"status":"ok"})");
        REQUIRE(v.has_value());
        REQUIRE_FALSE(v->is_violation);
        REQUIRE(v->matched_terms.empty());
    }

    SECTION("Missing or malformed status is a failure") {
        REQUIRE_FALSE(ClassificationClient::parse_verdict(R"({"forbidden_words":[]})").has_value());
        REQUIRE_FALSE(ClassificationClient::parse_verdict(R"({"status":1})").has_value());
        REQUIRE_FALSE(ClassificationClient::parse_verdict("[]").has_value());
        REQUIRE_FALSE(ClassificationClient::parse_verdict("").has_value());
    }
}
