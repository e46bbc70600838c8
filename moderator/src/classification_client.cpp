#include "classification_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <utility>

ClassificationClient::ClassificationClient(ClientOptions options,
                                           std::shared_ptr<HttpClient> http,
                                           std::unique_ptr<SlidingWindowLimiter> limiter,
                                           std::unique_ptr<ContentCache> cache,
                                           RetrySleeper sleeper)
    : options_(std::move(options))
    , http_(std::move(http))
    , limiter_(std::move(limiter))
    , cache_(std::move(cache))
    , sleeper_(std::move(sleeper))
    , retry_(options_.retry, sleeper_)
{
    spdlog::info("ClassificationClient initialized (endpoint={}, retries={})",
                 options_.endpoint, options_.retry.max_retries);
}

std::optional<Verdict> ClassificationClient::classify(const std::string& text) {
    requests_++;

    if (util::trim(text).empty()) {
        return Verdict{};
    }

    auto cached = cache_->get(text);
    if (cached) {
        cache_hits_++;
        return cached;
    }

    if (!pass_rate_gate()) {
        rate_limited_++;
        return std::nullopt;
    }

    attempted_++;
    bool throttled = false;

    auto outcome = retry_.run<Verdict>(
        [this, &text, &throttled]() { return call_upstream(text, throttled); },
        "classification");

    if (outcome.attempts > 1) {
        retries_ += outcome.attempts - 1;
    }

    if (!outcome.succeeded) {
        failed_++;
        limiter_->record_outcome(false, throttled);
        return std::nullopt;
    }

    succeeded_++;
    limiter_->record_outcome(true);

    // Clean verdicts are not cached so upstream policy changes take effect
    if (outcome.result->is_violation) {
        cache_->put(text, *outcome.result);
    }
    return outcome.result;
}

bool ClassificationClient::pass_rate_gate() {
    auto decision = limiter_->try_acquire();
    if (decision.permitted) {
        return true;
    }

    if (decision.retry_after_seconds > options_.max_inline_wait_seconds) {
        spdlog::debug("Classification deferred, limiter wait {:.1f}s exceeds {}s",
                      decision.retry_after_seconds, options_.max_inline_wait_seconds);
        return false;
    }

    auto wait = std::chrono::milliseconds(
        static_cast<int64_t>(std::ceil(decision.retry_after_seconds * 1000.0)));
    if (!sleeper_(wait)) {
        throw OperationCancelled("classification rate-limit wait");
    }

    decision = limiter_->try_acquire();
    if (!decision.permitted) {
        spdlog::debug("Classification still rate limited after {}ms wait", wait.count());
        return false;
    }
    return true;
}

std::optional<Verdict> ClassificationClient::call_upstream(const std::string& text, bool& throttled) {
    nlohmann::json payload = {{"text", text}};
    HttpResponse response = http_->post_json(options_.endpoint, payload);

    if (!response.transport_ok()) {
        return std::nullopt;
    }

    if (response.status == 429) {
        throttled = true;
        spdlog::warn("Classification API throttled (HTTP 429)");
        return std::nullopt;
    }

    if (!response.ok()) {
        spdlog::warn("Classification API returned HTTP {}", response.status);
        return std::nullopt;
    }

    return parse_verdict(response.body);
}

std::optional<Verdict> ClassificationClient::parse_verdict(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        if (!j.is_object() || !j.contains("status") || !j["status"].is_string()) {
            spdlog::warn("Classification response missing status field");
            return std::nullopt;
        }

        Verdict verdict;
        verdict.is_violation = j["status"].get<std::string>() == "forbidden";

        if (j.contains("forbidden_words") && j["forbidden_words"].is_array()) {
            for (const auto& word : j["forbidden_words"]) {
                if (word.is_string()) {
                    verdict.matched_terms.push_back(word.get<std::string>());
                }
            }
        }
        verdict.original_text = j.value("original_text", "");
        verdict.masked_text = j.value("masked_text", "");

        return verdict;

    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Failed to parse classification response: {}", e.what());
        return std::nullopt;
    }
}

ClientStats ClassificationClient::stats() const {
    ClientStats s;
    s.requests = requests_.load();
    s.cache_hits = cache_hits_.load();
    s.rate_limited = rate_limited_.load();
    s.attempted = attempted_.load();
    s.succeeded = succeeded_.load();
    s.failed = failed_.load();
    s.retries = retries_.load();
    return s;
}
