#include "content_cache.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>
#include <vector>

ContentCache::ContentCache(int ttl_seconds, size_t max_entries, util::MillisClock clock)
    : ttl_ms_(static_cast<int64_t>(ttl_seconds) * 1000)
    , max_entries_(max_entries)
    , clock_(std::move(clock))
{}

std::string ContentCache::make_key(const std::string& text) {
    return util::content_digest(util::fold_case(util::trim(text)));
}

bool ContentCache::is_expired(const Entry& entry, int64_t now_ms) const {
    return now_ms - entry.inserted_at_ms >= ttl_ms_;
}

std::optional<Verdict> ContentCache::get(const std::string& text) {
    std::string key = make_key(text);

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (is_expired(it->second, clock_())) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.verdict;
}

void ContentCache::put(const std::string& text, const Verdict& verdict) {
    std::string key = make_key(text);

    std::lock_guard<std::mutex> lock(mutex_);

    int64_t now_ms = clock_();
    entries_[key] = Entry{verdict, now_ms};

    if (entries_.size() > max_entries_) {
        evict_locked(now_ms);
    }
}

size_t ContentCache::evict() {
    std::lock_guard<std::mutex> lock(mutex_);
    return evict_locked(clock_());
}

size_t ContentCache::evict_locked(int64_t now_ms) {
    size_t removed = 0;

    for (auto it = entries_.begin(); it != entries_.end();) {
        if (is_expired(it->second, now_ms)) {
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    if (entries_.size() > max_entries_) {
        std::vector<std::pair<int64_t, std::string>> by_age;
        by_age.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            by_age.emplace_back(entry.inserted_at_ms, key);
        }

        size_t excess = entries_.size() - max_entries_;
        std::nth_element(by_age.begin(), by_age.begin() + excess - 1, by_age.end());
        for (size_t i = 0; i < excess; i++) {
            entries_.erase(by_age[i].second);
        }
        removed += excess;
    }

    if (removed > 0) {
        spdlog::debug("Content cache evicted {} entries ({} remain)", removed, entries_.size());
    }
    return removed;
}

size_t ContentCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ContentCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}
