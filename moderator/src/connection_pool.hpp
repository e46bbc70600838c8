#pragma once

#include "ledger_connection.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

using ConnectionFactory = std::function<std::unique_ptr<LedgerConnection>()>;

struct PoolStats {
    int total = 0;
    int idle = 0;
    int in_use = 0;
    int64_t created = 0;
    int64_t waits = 0;
    int64_t exhausted = 0;
};

class ConnectionPool;

// Exclusive lease on one pooled handle; returns it on destruction
class PooledConnection {
public:
    PooledConnection() = default;
    PooledConnection(ConnectionPool* pool, std::unique_ptr<LedgerConnection> conn);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    LedgerConnection* operator->() const { return conn_.get(); }
    LedgerConnection& operator*() const { return *conn_; }
    explicit operator bool() const { return conn_ != nullptr; }

    // Idempotent
    void release();

private:
    ConnectionPool* pool_ = nullptr;
    std::unique_ptr<LedgerConnection> conn_;
};

class ConnectionPool {
public:
    ConnectionPool(ConnectionFactory factory,
                   int min_size,
                   int max_size,
                   std::chrono::milliseconds acquire_timeout);

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Throws PoolExhausted when nothing frees up within acquire_timeout,
    // StorageError when a new handle cannot be opened
    PooledConnection acquire();
    void release(PooledConnection& handle);

    PoolStats stats() const;

private:
    friend class PooledConnection;

    ConnectionFactory factory_;
    const int min_size_;
    const int max_size_;
    const std::chrono::milliseconds acquire_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<LedgerConnection>> idle_;
    int total_ = 0;
    int in_use_ = 0;
    int64_t created_ = 0;
    int64_t waits_ = 0;
    int64_t exhausted_ = 0;

    std::unique_ptr<LedgerConnection> open_connection();
    void give_back(std::unique_ptr<LedgerConnection> conn);
};
