#pragma once

#include "config.hpp"
#include "connection_pool.hpp"
#include <memory>

// Handle factory for the configured LEDGER_BACKEND
ConnectionFactory make_connection_factory(const Config& config);

std::shared_ptr<ConnectionPool> create_ledger_pool(const Config& config);
