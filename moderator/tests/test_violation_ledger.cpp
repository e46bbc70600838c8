#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include "../src/errors.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <future>
#include <mutex>
#include <thread>

namespace {

RecordedViolation hit(TempLedger& t, const std::string& user = "u1", const std::string& group = "g1") {
    return t.ledger->record_violation(group, user, "alice", {"spam"}, "buy spam now");
}

void corrupt_words(const std::string& path, const std::string& user) {
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    std::string sql = "UPDATE violations SET forbidden_words = '{not json' WHERE user_id = '" + user + "'";
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    sqlite3_free(err);
    sqlite3_close(db);
    REQUIRE(rc == SQLITE_OK);
}

// Store whose retention delete always fails
class PurgeFailingConnection : public SqliteLedgerConnection {
public:
    using SqliteLedgerConnection::SqliteLedgerConnection;

    int delete_older_than(const util::CivilDate&) override {
        throw StorageError("sqlite", "database disk image is malformed");
    }
};

} // namespace

TEST_CASE("Violation ledger escalation", "[violation_ledger]") {
    TempLedger t;

    SECTION("Same-day violations climb the ladder") {
        auto first = hit(t);
        auto second = hit(t);
        auto third = hit(t);
        auto fourth = hit(t);

        REQUIRE(first.tier == 1);
        REQUIRE(first.ban_duration == 60);
        REQUIRE(second.tier == 2);
        REQUIRE(second.ban_duration == 600);
        REQUIRE(third.tier == 3);
        REQUIRE(third.ban_duration == 86400);
        REQUIRE(fourth.tier == 4);
        REQUIRE(fourth.ban_duration == 86400);
    }

    SECTION("A later violation-day starts over at tier 1") {
        hit(t);
        hit(t);

        t.now = at(2024, 6, 11, 12);
        auto next_day = hit(t);
        REQUIRE(next_day.tier == 1);
        REQUIRE(next_day.ban_duration == 60);
        REQUIRE(next_day.violation_day == util::CivilDate{2024, 6, 11});
    }

    SECTION("Pairs escalate independently") {
        hit(t, "u1");
        hit(t, "u1");

        REQUIRE(hit(t, "u2").tier == 1);
        REQUIRE(hit(t, "u1", "g2").tier == 1);
        REQUIRE(hit(t, "u1").tier == 3);
    }

    SECTION("Only the latest state is kept per pair") {
        hit(t);
        hit(t);

        auto rows = t.ledger->history("g1", "u1");
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].violation_count == 2);
        REQUIRE(rows[0].ban_duration == 600);
        REQUIRE(rows[0].forbidden_words == std::vector<std::string>{"spam"});
        REQUIRE(rows[0].last_violation_date == util::CivilDate{2024, 6, 10});
    }

    SECTION("Duration override is stored without changing the tier") {
        auto recorded = t.ledger->record_violation("g1", "u1", "alice", {"spam"}, "text", 0);
        REQUIRE(recorded.tier == 1);
        REQUIRE(recorded.ban_duration == 0);

        auto second = hit(t);
        REQUIRE(second.tier == 2);
        REQUIRE(t.ledger->history("g1", "u1")[0].ban_duration == 600);
    }

    SECTION("Stored text is cut to max_text code points") {
        std::string long_text;
        for (int i = 0; i < 600; i++) {
            long_text += "\xC3\xA9";  // é
        }
        t.ledger->record_violation("g1", "u1", "alice", {"spam"}, long_text);

        auto rows = t.ledger->history("g1", "u1");
        REQUIRE(util::utf8_length(rows[0].original_text) == 500);
        REQUIRE(rows[0].original_text.size() == 1000);
    }
}

TEST_CASE("Violation ledger current tier", "[violation_ledger]") {
    TempLedger t;

    SECTION("Unknown pair is tier 1 with nothing stored") {
        auto status = t.ledger->current_tier("g1", "nobody");
        REQUIRE(status.tier == 1);
        REQUIRE(status.stored_count == 0);
        REQUIRE(status.as_of == util::CivilDate{2024, 6, 10});
    }

    SECTION("Reports the tier the next violation would get without writing") {
        hit(t);
        hit(t);

        auto status = t.ledger->current_tier("g1", "u1");
        REQUIRE(status.tier == 3);
        REQUIRE(status.stored_count == 2);

        REQUIRE(t.ledger->current_tier("g1", "u1").tier == 3);
        REQUIRE(hit(t).tier == 3);
    }

    SECTION("A lapsed cycle reads as tier 1") {
        hit(t);
        hit(t);

        t.now = at(2024, 6, 11, 9);
        auto status = t.ledger->current_tier("g1", "u1");
        REQUIRE(status.tier == 1);
        REQUIRE(status.stored_count == 2);
    }
}

TEST_CASE("Violation ledger reset hour", "[violation_ledger]") {
    TempLedger t;

    SECTION("Before and after the reset hour are different days") {
        t.now = at(2024, 6, 10, 3);
        REQUIRE(hit(t).tier == 1);
        t.now = at(2024, 6, 10, 5);
        REQUIRE(hit(t).tier == 1);
    }

    SECTION("Morning and late evening share a day") {
        t.now = at(2024, 6, 10, 5);
        REQUIRE(hit(t).tier == 1);
        t.now = at(2024, 6, 10, 23);
        REQUIRE(hit(t).tier == 2);
    }

    SECTION("Early hours belong to the previous day") {
        t.now = at(2024, 6, 10, 23);
        REQUIRE(hit(t).tier == 1);
        t.now = at(2024, 6, 11, 3);
        auto recorded = hit(t);
        REQUIRE(recorded.tier == 2);
        REQUIRE(recorded.violation_day == util::CivilDate{2024, 6, 10});
    }

    SECTION("The reset hour itself opens a new day") {
        t.now = at(2024, 6, 11, 3, 59);
        REQUIRE(hit(t).tier == 1);
        t.now = at(2024, 6, 11, 4, 0);
        REQUIRE(hit(t).tier == 1);
    }
}

TEST_CASE("Violation ledger concurrent writes", "[violation_ledger]") {
    TempLedger t;

    const size_t threads = 16;
    std::mutex results_mutex;
    std::vector<int> tiers;
    std::vector<std::thread> workers;

    for (size_t i = 0; i < threads; i++) {
        workers.emplace_back([&t, &results_mutex, &tiers]() {
            auto recorded = t.ledger->record_violation("g1", "u1", "alice", {"spam"}, "spam");
            std::lock_guard<std::mutex> lock(results_mutex);
            tiers.push_back(recorded.tier);
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    std::sort(tiers.begin(), tiers.end());
    REQUIRE(tiers.size() == threads);
    for (size_t i = 0; i < threads; i++) {
        REQUIRE(tiers[i] == static_cast<int>(i) + 1);
    }

    auto rows = t.ledger->history("g1", "u1");
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].violation_count == static_cast<int>(threads));
}

TEST_CASE("Violation ledger retention", "[violation_ledger]") {
    TempLedger t;

    t.now = at(2024, 5, 30, 12);
    hit(t, "old");
    t.now = at(2024, 5, 31, 12);
    hit(t, "edge");

    SECTION("Cleanup removes rows older than the window") {
        t.now = at(2024, 6, 30, 12);
        REQUIRE(t.ledger->cleanup_expired() == 1);
        REQUIRE(t.ledger->history("g1", "old").empty());
        REQUIRE(t.ledger->history("g1", "edge").size() == 1);

        REQUIRE(t.ledger->cleanup_expired() == 0);
    }

    SECTION("Writes purge expired rows as a side effect") {
        t.now = at(2024, 6, 30, 12);
        hit(t, "fresh");

        REQUIRE(t.ledger->history("g1", "old").empty());
        REQUIRE(t.ledger->history("g1", "edge").size() == 1);
        REQUIRE(t.ledger->history("g1", "fresh").size() == 1);
    }
}

TEST_CASE("Violation ledger retention failure", "[violation_ledger]") {
    TempLedger t;
    t.now = at(2024, 5, 1, 12);
    hit(t, "old");

    std::string db_path = t.path();
    auto pool = std::make_shared<ConnectionPool>(
        [db_path]() -> std::unique_ptr<LedgerConnection> {
            return std::make_unique<PurgeFailingConnection>(db_path);
        },
        1, 2, std::chrono::milliseconds(1000));
    ViolationLedger ledger(pool, LedgerOptions{}, []() { return at(2024, 6, 30, 12); });

    auto recorded = ledger.record_violation("g1", "u1", "alice", {"spam"}, "buy spam now");
    REQUIRE(recorded.tier == 1);
    REQUIRE(recorded.ban_duration == 60);

    auto rows = ledger.history("g1", "u1");
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].last_violation_date == util::CivilDate{2024, 6, 30});
    REQUIRE(ledger.history("g1", "old").size() == 1);

    REQUIRE_THROWS_AS(ledger.cleanup_expired(), StorageError);
}

TEST_CASE("Violation ledger clock ordering", "[violation_ledger]") {
    TempLedger t;

    SECTION("A clock stepping back keeps the stored day") {
        t.now = at(2024, 6, 10, 4, 0);
        REQUIRE(hit(t).violation_day == util::CivilDate{2024, 6, 10});

        t.now = at(2024, 6, 10, 3, 59);
        auto recorded = hit(t);
        REQUIRE(recorded.tier == 2);
        REQUIRE(recorded.violation_day == util::CivilDate{2024, 6, 10});

        t.now = at(2024, 6, 10, 4, 0);
        REQUIRE(hit(t).tier == 3);
    }

    SECTION("Time is read once the writer holds the pair") {
        // First caller's clock stalls before answering 03:59; later callers see 04:00
        std::promise<void> entered;
        std::promise<void> release;
        std::shared_future<void> released = release.get_future().share();
        std::atomic<int> calls{0};

        ViolationLedger ledger(t.pool, LedgerOptions{}, [&]() {
            if (calls++ == 0) {
                entered.set_value();
                released.wait();
                return at(2024, 6, 10, 3, 59);
            }
            return at(2024, 6, 10, 4, 0);
        });

        std::thread first([&ledger]() {
            ledger.record_violation("g1", "u1", "alice", {"spam"}, "spam");
        });
        entered.get_future().wait();

        std::thread second([&ledger]() {
            ledger.record_violation("g1", "u1", "alice", {"spam"}, "spam");
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        release.set_value();

        first.join();
        second.join();

        auto rows = ledger.history("g1", "u1");
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].last_violation_date == util::CivilDate{2024, 6, 10});

        auto next = ledger.record_violation("g1", "u1", "alice", {"spam"}, "spam");
        REQUIRE(next.violation_day == util::CivilDate{2024, 6, 10});
        REQUIRE(next.tier == rows[0].violation_count + 1);
    }
}

TEST_CASE("Violation ledger unreadable records", "[violation_ledger]") {
    TempLedger t;

    hit(t);
    hit(t);
    corrupt_words(t.path(), "u1");

    SECTION("Tier lookup falls back to tier 1") {
        auto status = t.ledger->current_tier("g1", "u1");
        REQUIRE(status.tier == 1);
        REQUIRE(status.stored_count == 0);
    }

    SECTION("The next write treats the row as absent and overwrites it") {
        auto recorded = hit(t);
        REQUIRE(recorded.tier == 1);

        auto rows = t.ledger->history("g1", "u1");
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].forbidden_words == std::vector<std::string>{"spam"});
        REQUIRE(hit(t).tier == 2);
    }

    SECTION("Listings skip the unreadable row") {
        hit(t, "u2");
        auto rows = t.ledger->group_records("g1");
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].user_id == "u2");
    }
}

TEST_CASE("Violation ledger administration", "[violation_ledger]") {
    TempLedger t;

    hit(t, "u1");
    hit(t, "u1");
    hit(t, "u2");
    hit(t, "u3", "g2");

    SECTION("Group records are ordered by day then count") {
        auto rows = t.ledger->group_records("g1");
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[0].user_id == "u1");
        REQUIRE(rows[1].user_id == "u2");

        REQUIRE(t.ledger->group_records("g1", 1).size() == 1);
    }

    SECTION("Reset user clears only that pair") {
        REQUIRE(t.ledger->reset_user("g1", "u1") == 1);
        REQUIRE(t.ledger->current_tier("g1", "u1").stored_count == 0);
        REQUIRE(t.ledger->current_tier("g1", "u2").stored_count == 1);
        REQUIRE(hit(t, "u1").tier == 1);
    }

    SECTION("Reset group clears every pair in the group") {
        REQUIRE(t.ledger->reset_group("g1") == 2);
        REQUIRE(t.ledger->group_records("g1").empty());
        REQUIRE(t.ledger->group_records("g2").size() == 1);
    }

    SECTION("Ping succeeds on a healthy store") {
        REQUIRE(t.ledger->ping());
    }
}

TEST_CASE("Violation ledger pool exhaustion", "[violation_ledger]") {
    TempLedger t(LedgerOptions{}, 1, std::chrono::milliseconds(50));

    hit(t);
    auto held = t.pool->acquire();

    SECTION("Writes propagate PoolExhausted") {
        REQUIRE_THROWS_AS(hit(t), PoolExhausted);
    }

    SECTION("Tier lookups degrade to tier 1") {
        auto status = t.ledger->current_tier("g1", "u1");
        REQUIRE(status.tier == 1);
        REQUIRE(status.stored_count == 0);
    }

    SECTION("Ping reports failure") {
        REQUIRE_FALSE(t.ledger->ping());
    }
}

TEST_CASE("Tier ladder", "[violation_ledger]") {
    TierLadder ladder;
    REQUIRE(ladder.duration_for(1) == 60);
    REQUIRE(ladder.duration_for(2) == 600);
    REQUIRE(ladder.duration_for(3) == 86400);
    REQUIRE(ladder.duration_for(12) == 86400);

    ladder.tier2_seconds = 300;
    REQUIRE(ladder.duration_for(2) == 300);
}
