#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

// Process-wide cancellation point for waits that must not outlive shutdown
class ShutdownSignal {
public:
    void trigger();
    bool triggered() const;

    // Returns false if the signal fired before the duration elapsed
    bool wait_for(std::chrono::milliseconds duration);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool triggered_ = false;
};
