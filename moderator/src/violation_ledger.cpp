#include "violation_ledger.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <functional>
#include <utility>

int TierLadder::duration_for(int tier) const {
    if (tier <= 1) {
        return tier1_seconds;
    }
    if (tier == 2) {
        return tier2_seconds;
    }
    return tier3_seconds;
}

ViolationLedger::ViolationLedger(std::shared_ptr<ConnectionPool> pool,
                                 LedgerOptions options,
                                 util::LocalClock clock)
    : pool_(std::move(pool))
    , options_(options)
    , clock_(std::move(clock))
{}

void ViolationLedger::init_schema() {
    try {
        auto conn = pool_->acquire();
        conn->init_schema();
        spdlog::info("Violation ledger schema ready ({})", conn->backend_name());
    } catch (const StorageError& e) {
        spdlog::error("Failed to initialize ledger schema: {}", e.what());
        throw;
    }
}

std::mutex& ViolationLedger::lock_for(const std::string& group_id, const std::string& user_id) {
    size_t h = std::hash<std::string>{}(group_id) * 31 + std::hash<std::string>{}(user_id);
    return pair_locks_[h % kLockStripes];
}

util::CivilDate ViolationLedger::today() const {
    return util::violation_day(clock_(), options_.reset_hour);
}

int ViolationLedger::next_tier(const std::optional<ViolationRecord>& previous, const util::CivilDate& today) {
    if (!previous) {
        return 1;
    }
    if (previous->last_violation_date < today) {
        return 1;
    }
    return previous->violation_count + 1;
}

RecordedViolation ViolationLedger::record_violation(const std::string& group_id,
                                                    const std::string& user_id,
                                                    const std::string& user_name,
                                                    const std::vector<std::string>& words,
                                                    const std::string& text,
                                                    std::optional<int> duration_override) {
    RecordedViolation recorded;

    {
        std::lock_guard<std::mutex> pair_lock(lock_for(group_id, user_id));

        try {
            auto conn = pool_->acquire();
            LedgerTransaction txn(*conn, group_id, user_id);

            std::optional<ViolationRecord> previous;
            try {
                previous = conn->latest(group_id, user_id);
            } catch (const CorruptRecord& e) {
                spdlog::warn("Treating record {}/{} as absent: {}", group_id, user_id, e.what());
            }

            // Clock is read inside the transaction
            const util::LocalDateTime now = clock_();
            util::CivilDate day = util::violation_day(now, options_.reset_hour);
            if (previous && day < previous->last_violation_date) {
                // The stored day never moves backwards
                day = previous->last_violation_date;
            }

            recorded.violation_day = day;
            recorded.tier = next_tier(previous, day);
            recorded.ban_duration = duration_override ? *duration_override
                                                      : options_.ladder.duration_for(recorded.tier);

            ViolationRecord record;
            record.group_id = group_id;
            record.user_id = user_id;
            record.user_name = user_name;
            record.violation_count = recorded.tier;
            record.forbidden_words = words;
            record.original_text = util::truncate_utf8(text, options_.max_text);
            record.ban_duration = recorded.ban_duration;
            record.last_violation_date = day;
            record.created_at = now.to_string();

            conn->upsert(record);
            txn.commit();

        } catch (const StorageError& e) {
            spdlog::error("Failed to record violation for {}/{}: {}", group_id, user_id, e.what());
            throw;
        }
    }

    spdlog::debug("Recorded violation {}/{} tier {} ({}s)",
                  group_id, user_id, recorded.tier, recorded.ban_duration);

    // Piggybacked retention; never fails the write that triggered it
    try {
        purge_before(recorded.violation_day.add_days(-options_.max_log_days));
    } catch (const StorageError& e) {
        spdlog::warn("Retention cleanup after write failed: {}", e.what());
    }

    return recorded;
}

TierStatus ViolationLedger::current_tier(const std::string& group_id, const std::string& user_id) {
    TierStatus status;
    status.as_of = today();

    try {
        auto conn = pool_->acquire();
        auto record = conn->latest(group_id, user_id);
        status.stored_count = record ? record->violation_count : 0;
        status.tier = next_tier(record, status.as_of);

    } catch (const CorruptRecord& e) {
        spdlog::warn("Unreadable record {}/{}, assuming tier 1: {}", group_id, user_id, e.what());
        status.tier = 1;
        status.stored_count = 0;
    } catch (const StorageError& e) {
        spdlog::error("Tier lookup for {}/{} failed, assuming tier 1: {}", group_id, user_id, e.what());
        status.tier = 1;
        status.stored_count = 0;
    }

    return status;
}

std::vector<ViolationRecord> ViolationLedger::history(const std::string& group_id, const std::string& user_id) {
    auto conn = pool_->acquire();
    return conn->history(group_id, user_id);
}

std::vector<ViolationRecord> ViolationLedger::group_records(const std::string& group_id, int limit) {
    auto conn = pool_->acquire();
    return conn->group_records(group_id, limit);
}

int ViolationLedger::reset_user(const std::string& group_id, const std::string& user_id) {
    std::lock_guard<std::mutex> pair_lock(lock_for(group_id, user_id));

    auto conn = pool_->acquire();
    int removed = conn->delete_pair(group_id, user_id);
    spdlog::info("Reset violations for {}/{} ({} rows)", group_id, user_id, removed);
    return removed;
}

int ViolationLedger::reset_group(const std::string& group_id) {
    auto conn = pool_->acquire();
    int removed = conn->delete_group(group_id);
    spdlog::info("Reset violations for group {} ({} rows)", group_id, removed);
    return removed;
}

int ViolationLedger::cleanup_expired() {
    return purge_before(today().add_days(-options_.max_log_days));
}

int ViolationLedger::purge_before(const util::CivilDate& cutoff) {
    auto conn = pool_->acquire();
    int removed = conn->delete_older_than(cutoff);
    if (removed > 0) {
        spdlog::info("Removed {} violation records older than {}", removed, cutoff.to_string());
    }
    return removed;
}

bool ViolationLedger::ping() {
    try {
        auto conn = pool_->acquire();
        return conn->ping();
    } catch (const StorageError& e) {
        spdlog::warn("Ledger ping failed: {}", e.what());
        return false;
    }
}
