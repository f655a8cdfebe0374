#pragma once

#include <duckdb.h>
#include <mutex>
#include <string>

#include "config_manager.hpp"
#include "query_executor.hpp"

namespace sqlscript {

/**
 * Owns the DuckDB database handle described by a ConnectionConfig.
 * open() and close() may be called from several threads; executors handed
 * out by createQueryExecutor() must not outlive close().
 */
class DatabaseManager {
public:
    explicit DatabaseManager(ConnectionConfig config);
    ~DatabaseManager();
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // Opens the database once; later calls are no-ops.
    void open();
    // Closes the database; closing a closed database is a no-op.
    void close();
    bool isOpen() const;

    QueryExecutor createQueryExecutor();

    const ConnectionConfig& getConnectionConfig() const { return config_; }

private:
    void createAndInitializeDuckDBConfig(duckdb_config& config);
    void logDuckDBVersion();
    void runInitScript();

    ConnectionConfig config_;
    duckdb_database db_;
    mutable std::mutex db_mutex_;
};

} // namespace sqlscript
