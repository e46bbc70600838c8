#pragma once

#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

struct RetryOptions {
    int max_retries = 2;
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{8000};
    std::chrono::milliseconds jitter_max{250};
};

template <typename T>
struct RetryOutcome {
    std::optional<T> result;
    bool succeeded = false;
    int attempts = 0;
};

// Sleeps for the given duration; returns false if interrupted by shutdown
using RetrySleeper = std::function<bool(std::chrono::milliseconds)>;

class RetryPolicy {
public:
    RetryPolicy(RetryOptions options, RetrySleeper sleeper);

    // Backoff before the retry that follows failed attempt number `attempt` (0-based)
    std::chrono::milliseconds delay_for(int attempt) const;

    const RetryOptions& options() const { return options_; }

    // An attempt fails when it returns nullopt or throws. Failures are swallowed
    // into the outcome; OperationCancelled propagates.
    template <typename T>
    RetryOutcome<T> run(const std::function<std::optional<T>()>& operation,
                        const std::string& label = "operation") const;

private:
    RetryOptions options_;
    RetrySleeper sleeper_;
};

template <typename T>
RetryOutcome<T> RetryPolicy::run(const std::function<std::optional<T>()>& operation,
                                 const std::string& label) const {
    RetryOutcome<T> outcome;
    const int total_attempts = options_.max_retries + 1;

    for (int attempt = 0; attempt < total_attempts; attempt++) {
        outcome.attempts = attempt + 1;

        try {
            auto result = operation();
            if (result.has_value()) {
                outcome.result = std::move(result);
                outcome.succeeded = true;
                return outcome;
            }
        } catch (const OperationCancelled&) {
            throw;
        } catch (const std::exception& e) {
            spdlog::warn("{} attempt {}/{} threw: {}", label, attempt + 1, total_attempts, e.what());
        }

        if (attempt + 1 < total_attempts) {
            auto delay = delay_for(attempt);
            spdlog::debug("{} attempt {}/{} failed, retrying in {}ms",
                          label, attempt + 1, total_attempts, delay.count());
            if (!sleeper_(delay)) {
                throw OperationCancelled(label);
            }
        }
    }

    spdlog::warn("{} failed after {} attempts", label, outcome.attempts);
    return outcome;
}
