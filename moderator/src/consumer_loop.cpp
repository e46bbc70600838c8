#include "consumer_loop.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

ConsumerLoop::ConsumerLoop(std::string name,
                           Reader reader,
                           Handler handler,
                           Acker acker,
                           std::chrono::milliseconds error_backoff)
    : name_(std::move(name))
    , reader_(std::move(reader))
    , handler_(std::move(handler))
    , acker_(std::move(acker))
    , error_backoff_(error_backoff)
{}

void ConsumerLoop::run(ShutdownSignal& shutdown) {
    spdlog::info("Worker {} started", name_);

    while (!shutdown.triggered()) {
        Batch messages;
        try {
            messages = reader_();
        } catch (const std::exception& e) {
            read_failures_++;
            spdlog::error("Worker {} read failed, retrying in {}ms: {}",
                          name_, error_backoff_.count(), e.what());
            if (!shutdown.wait_for(error_backoff_)) {
                break;
            }
            continue;
        }

        for (const auto& [msg_id, payload] : messages) {
            try {
                handler_(msg_id, payload);
            } catch (const OperationCancelled& e) {
                // Left unacked so another consumer picks it up after restart
                spdlog::info("Worker {} stopping mid-message: {}", name_, e.what());
                return;
            } catch (const std::exception& e) {
                spdlog::error("Error handling message {}: {}", msg_id, e.what());
            }

            handled_++;
            acker_(msg_id);
        }
    }

    spdlog::info("Worker {} stopped", name_);
}
