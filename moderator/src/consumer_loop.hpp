#pragma once

#include "shutdown_signal.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

// Read-handle-ack cycle of one stream consumer
class ConsumerLoop {
public:
    using Batch = std::vector<std::pair<std::string, nlohmann::json>>;
    using Reader = std::function<Batch()>;
    using Handler = std::function<void(const std::string& msg_id, const nlohmann::json& payload)>;
    using Acker = std::function<void(const std::string& msg_id)>;

    ConsumerLoop(std::string name,
                 Reader reader,
                 Handler handler,
                 Acker acker,
                 std::chrono::milliseconds error_backoff = std::chrono::seconds(1));

    // Runs until shutdown. A failed read waits error_backoff before the next
    // one; OperationCancelled from the handler stops the loop without acking.
    void run(ShutdownSignal& shutdown);

    uint64_t read_failures() const { return read_failures_.load(); }
    uint64_t handled() const { return handled_.load(); }

private:
    std::string name_;
    Reader reader_;
    Handler handler_;
    Acker acker_;
    std::chrono::milliseconds error_backoff_;

    std::atomic<uint64_t> read_failures_{0};
    std::atomic<uint64_t> handled_{0};
};
