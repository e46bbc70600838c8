#pragma once

#include "verdict.hpp"
#include "util.hpp"
#include <string>
#include <optional>
#include <unordered_map>
#include <mutex>

class ContentCache {
public:
    ContentCache(int ttl_seconds = 3600,
                 size_t max_entries = 5000,
                 util::MillisClock clock = util::current_timestamp_ms);

    std::optional<Verdict> get(const std::string& text);
    void put(const std::string& text, const Verdict& verdict);

    // Drops expired entries, then oldest insertions until within capacity
    size_t evict();

    size_t size() const;
    void clear();

    // trim + case-fold + digest; texts differing only in case/outer whitespace collide
    static std::string make_key(const std::string& text);

private:
    struct Entry {
        Verdict verdict;
        int64_t inserted_at_ms;
    };

    const int64_t ttl_ms_;
    const size_t max_entries_;
    util::MillisClock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;

    bool is_expired(const Entry& entry, int64_t now_ms) const;
    size_t evict_locked(int64_t now_ms);
};
