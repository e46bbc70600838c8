#include "shutdown_signal.hpp"

void ShutdownSignal::trigger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        triggered_ = true;
    }
    cv_.notify_all();
}

bool ShutdownSignal::triggered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return triggered_;
}

bool ShutdownSignal::wait_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this]() { return triggered_; });
}
