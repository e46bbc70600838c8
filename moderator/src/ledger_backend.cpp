#include "ledger_backend.hpp"
#include "errors.hpp"
#include "pg_connection.hpp"
#include "sqlite_connection.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <system_error>

ConnectionFactory make_connection_factory(const Config& config) {
    if (config.ledger_backend == "sqlite") {
        std::filesystem::path path(config.ledger_path);
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                throw StorageError("sqlite", "cannot create " + path.parent_path().string() + ": " + ec.message());
            }
        }

        spdlog::info("Ledger backend: sqlite ({})", config.ledger_path);
        std::string db_path = config.ledger_path;
        return [db_path]() -> std::unique_ptr<LedgerConnection> {
            return std::make_unique<SqliteLedgerConnection>(db_path);
        };
    }

    if (config.ledger_backend == "postgres") {
        spdlog::info("Ledger backend: postgres ({})", util::redact_dsn(config.pg_dsn));
        std::string dsn = config.pg_dsn;
        return [dsn]() -> std::unique_ptr<LedgerConnection> {
            return std::make_unique<PostgresLedgerConnection>(dsn);
        };
    }

    throw ConfigError("unsupported LEDGER_BACKEND '" + config.ledger_backend + "'; expected sqlite or postgres");
}

std::shared_ptr<ConnectionPool> create_ledger_pool(const Config& config) {
    return std::make_shared<ConnectionPool>(
        make_connection_factory(config),
        config.ledger_pool_min,
        config.ledger_pool_max,
        std::chrono::milliseconds(config.ledger_pool_wait_ms));
}
