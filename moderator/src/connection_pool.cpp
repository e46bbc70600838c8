#include "connection_pool.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <utility>

PooledConnection::PooledConnection(ConnectionPool* pool, std::unique_ptr<LedgerConnection> conn)
    : pool_(pool)
    , conn_(std::move(conn))
{}

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool_(other.pool_)
    , conn_(std::move(other.conn_))
{
    other.pool_ = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        conn_ = std::move(other.conn_);
        other.pool_ = nullptr;
    }
    return *this;
}

void PooledConnection::release() {
    if (pool_ && conn_) {
        pool_->give_back(std::move(conn_));
    }
    pool_ = nullptr;
    conn_.reset();
}

ConnectionPool::ConnectionPool(ConnectionFactory factory,
                               int min_size,
                               int max_size,
                               std::chrono::milliseconds acquire_timeout)
    : factory_(std::move(factory))
    , min_size_(min_size)
    , max_size_(max_size)
    , acquire_timeout_(acquire_timeout)
{
    for (int i = 0; i < min_size_; i++) {
        idle_.push_back(open_connection());
        total_++;
        created_++;
    }

    spdlog::info("Connection pool ready ({} warm, max {})", min_size_, max_size_);
}

std::unique_ptr<LedgerConnection> ConnectionPool::open_connection() {
    auto conn = factory_();
    if (!conn) {
        throw StorageError("pool", "connection factory returned no handle");
    }
    return conn;
}

PooledConnection ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    const auto deadline = std::chrono::steady_clock::now() + acquire_timeout_;
    bool counted_wait = false;

    while (true) {
        if (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            in_use_++;
            return PooledConnection(this, std::move(conn));
        }

        if (total_ < max_size_) {
            // Reserve the slot, then open outside the lock
            total_++;
            in_use_++;
            lock.unlock();

            std::unique_ptr<LedgerConnection> conn;
            try {
                conn = open_connection();
            } catch (const std::exception& e) {
                spdlog::error("Failed to open pooled connection: {}", e.what());
                lock.lock();
                total_--;
                in_use_--;
                available_.notify_one();
                throw;
            }

            lock.lock();
            created_++;
            return PooledConnection(this, std::move(conn));
        }

        if (!counted_wait) {
            waits_++;
            counted_wait = true;
        }

        if (available_.wait_until(lock, deadline) == std::cv_status::timeout &&
            idle_.empty() && total_ >= max_size_) {
            exhausted_++;
            spdlog::warn("Connection pool exhausted ({} in use)", in_use_);
            throw PoolExhausted(fmt::format("no connection free within {}ms", acquire_timeout_.count()));
        }
    }
}

void ConnectionPool::release(PooledConnection& handle) {
    handle.release();
}

void ConnectionPool::give_back(std::unique_ptr<LedgerConnection> conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_use_--;

    if (conn->is_usable()) {
        idle_.push_back(std::move(conn));
    } else {
        total_--;
        spdlog::warn("Discarding broken {} connection", conn->backend_name());
    }

    available_.notify_one();
}

PoolStats ConnectionPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PoolStats s;
    s.total = total_;
    s.idle = static_cast<int>(idle_.size());
    s.in_use = in_use_;
    s.created = created_;
    s.waits = waits_;
    s.exhausted = exhausted_;
    return s;
}
