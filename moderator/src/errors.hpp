#pragma once

#include <stdexcept>
#include <string>

class StorageError : public std::runtime_error {
public:
    StorageError(const std::string& backend, const std::string& message)
        : std::runtime_error("storage error [" + backend + "] " + message)
        , backend_(backend) {}

    const std::string& backend() const { return backend_; }

private:
    std::string backend_;
};

// Transient: no handle became free within the bounded wait
class PoolExhausted : public StorageError {
public:
    explicit PoolExhausted(const std::string& message)
        : StorageError("pool", message) {}
};

// A stored row could not be decoded
class CorruptRecord : public StorageError {
public:
    CorruptRecord(const std::string& backend, const std::string& message)
        : StorageError(backend, "corrupt record: " + message) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("invalid configuration: " + message) {}
};

class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& what)
        : std::runtime_error(what + " cancelled") {}
};
