#include "database_manager.hpp"
#include "error.hpp"
#include "sql_utils.hpp"
#include "statement_classifier.hpp"

#include <crow/logging.h>
#include <filesystem>

namespace sqlscript {

DatabaseManager::DatabaseManager(ConnectionConfig config)
    : config_(std::move(config)), db_(nullptr) {}

DatabaseManager::~DatabaseManager() {
    close();
}

void DatabaseManager::open() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        return;
    }

    const std::string db_path = config_.isInMemory() ? ":memory:" : config_.database;
    if (!config_.isInMemory() && !config_.create_if_missing && !std::filesystem::exists(db_path)) {
        throw DatabaseError("Database " + config_.name + " does not exist: " + db_path, true);
    }

    if (!config_.isInMemory() && config_.create_if_missing) {
        auto parent = std::filesystem::path(db_path).parent_path();
        std::error_code ec;
        if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
            CROW_LOG_INFO << "Creating directory for database " << config_.name << ": " << parent.string();
            if (!std::filesystem::create_directories(parent, ec) && ec) {
                throw DatabaseError("Failed to create directory " + parent.string() + ": " + ec.message(), true);
            }
        }
    }

    CROW_LOG_INFO << "Opening database " << config_.name << " (" << db_path << ")";

    duckdb_config config;
    createAndInitializeDuckDBConfig(config);

    char* error = nullptr;
    if (duckdb_open_ext(db_path.c_str(), &db_, config, &error) == DuckDBError) {
        std::string error_message = error ? error : "Unknown error";
        duckdb_free(error);
        duckdb_destroy_config(&config);
        db_ = nullptr;
        throw DatabaseError("Failed to open database: " + error_message, true);
    }
    duckdb_destroy_config(&config);

    try {
        logDuckDBVersion();
        runInitScript();
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "Failed to initialize database " << config_.name << ": " << e.what();
        duckdb_close(&db_);
        db_ = nullptr;
        throw;
    }
}

void DatabaseManager::close() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        CROW_LOG_DEBUG << "Closing database " << config_.name;
        duckdb_close(&db_);
        db_ = nullptr;
    }
}

bool DatabaseManager::isOpen() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return db_ != nullptr;
}

QueryExecutor DatabaseManager::createQueryExecutor() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_ == nullptr) {
        throw DatabaseError("Database not initialized", true);
    }
    return QueryExecutor(db_);
}

void DatabaseManager::createAndInitializeDuckDBConfig(duckdb_config& config) {
    if (duckdb_create_config(&config) == DuckDBError) {
        throw DatabaseError("Failed to create DuckDB configuration", true);
    }

    if (config_.read_only && duckdb_set_config(config, "access_mode", "READ_ONLY") == DuckDBError) {
        duckdb_destroy_config(&config);
        throw DatabaseError("Failed to set DuckDB configuration: access_mode", true);
    }

    for (const auto& [key, value] : config_.settings) {
        if (duckdb_set_config(config, key.c_str(), value.c_str()) == DuckDBError) {
            duckdb_destroy_config(&config);
            throw DatabaseError("Failed to set DuckDB configuration: " + key, true);
        }
    }
}

void DatabaseManager::logDuckDBVersion() {
    CROW_LOG_DEBUG << "DuckDB Library Version: " << duckdb_library_version();

    auto executor = QueryExecutor(db_);
    executor.execute("SELECT version()", "version check");
    if (executor.rowCount() != 1 || executor.columnCount() != 1) {
        throw DatabaseError("Unexpected result format for DuckDB version");
    }
    CROW_LOG_DEBUG << "DuckDB DB Version: " << executor.valueString(0, 0);
}

void DatabaseManager::runInitScript() {
    if (config_.init.empty()) {
        return;
    }

    auto statements = splitSqlStatements(config_.init);
    CROW_LOG_INFO << "Running " << statements.size() << " init statement(s) for " << config_.name;

    auto executor = QueryExecutor(db_);
    for (const auto& statement : statements) {
        if (firstKeyword(statement).empty()) {
            continue;
        }
        executor.execute(stripSqlComments(statement), "connection init");
    }
}

} // namespace sqlscript
