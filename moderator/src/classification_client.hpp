#pragma once

#include "verdict.hpp"
#include "rate_limiter.hpp"
#include "content_cache.hpp"
#include "retry_policy.hpp"
#include "http_client.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>

struct ClientOptions {
    std::string endpoint;
    int max_inline_wait_seconds = 5;
    RetryOptions retry;
};

struct ClientStats {
    int64_t requests = 0;
    int64_t cache_hits = 0;
    int64_t rate_limited = 0;
    int64_t attempted = 0;
    int64_t succeeded = 0;
    int64_t failed = 0;
    int64_t retries = 0;
};

// Rate-limited, cached, retrying front for the upstream text classifier.
// classify() returns nullopt when the verdict could not be determined; that
// is never the same thing as a clean verdict.
class ClassificationClient {
public:
    ClassificationClient(ClientOptions options,
                         std::shared_ptr<HttpClient> http,
                         std::unique_ptr<SlidingWindowLimiter> limiter,
                         std::unique_ptr<ContentCache> cache,
                         RetrySleeper sleeper);

    // Throws OperationCancelled if shutdown interrupts a wait
    std::optional<Verdict> classify(const std::string& text);

    ClientStats stats() const;

    SlidingWindowLimiter& limiter() { return *limiter_; }
    ContentCache& cache() { return *cache_; }
    const ClientOptions& options() const { return options_; }

    // Decodes an upstream response body; nullopt when the body is malformed
    static std::optional<Verdict> parse_verdict(const std::string& body);

private:
    ClientOptions options_;
    std::shared_ptr<HttpClient> http_;
    std::unique_ptr<SlidingWindowLimiter> limiter_;
    std::unique_ptr<ContentCache> cache_;
    RetrySleeper sleeper_;
    RetryPolicy retry_;

    std::atomic<int64_t> requests_{0};
    std::atomic<int64_t> cache_hits_{0};
    std::atomic<int64_t> rate_limited_{0};
    std::atomic<int64_t> attempted_{0};
    std::atomic<int64_t> succeeded_{0};
    std::atomic<int64_t> failed_{0};
    std::atomic<int64_t> retries_{0};

    bool pass_rate_gate();
    std::optional<Verdict> call_upstream(const std::string& text, bool& throttled);
};
