#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <crow/json.h>

#include "config_manager.hpp"
#include "database_manager.hpp"
#include "statement_classifier.hpp"

namespace sqlscript {

struct ResultMessage {
    std::chrono::system_clock::time_point date;
    std::string message;
};

// Outcome of one executed statement.
struct StatementResult {
    std::vector<std::string> cols;
    crow::json::wvalue results;  // array of row objects keyed by column name
    std::vector<ResultMessage> messages;
    std::string query;
    std::string request_id;
    std::string result_id;
    StatementKind kind = StatementKind::Unspecified;

    crow::json::wvalue toJson() const;
};

struct QueryOptions {
    std::string request_id;
};

struct ClassifiedStatement {
    std::string text;
    StatementKind kind;
};

/**
 * Explicit transaction on one executor. Rolled back on destruction unless
 * commit() or rollback() already ended it, so an exception of any type
 * never leaves the connection inside the transaction.
 */
class TransactionScope {
public:
    TransactionScope(QueryExecutor& executor, const std::string& context);
    ~TransactionScope();

    TransactionScope(const TransactionScope&) = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;

    // @throws DatabaseError if COMMIT fails; the destructor then rolls back
    void commit();
    void rollback();

    bool isOpen() const { return open_; }

private:
    QueryExecutor& executor_;
    std::string context_;
    bool open_ = false;
};

/**
 * Executes SQL scripts statement by statement, picking the transaction mode
 * from the statement kind:
 *   - queries run inside a single-use transaction that is rolled back, after
 *     a row count guard
 *   - DML runs in its own read/write transaction, one per statement
 *   - DDL is submitted as a schema update and awaited
 * A script containing an unsupported statement is rejected before anything
 * runs.
 */
class ScriptDriver {
public:
    ScriptDriver(std::shared_ptr<DatabaseManager> database, ExecutionConfig execution);

    /**
     * Splits, classifies and executes a script.
     * @throws UnsupportedStatementError if any statement is not a query, DML or DDL
     * @throws DatabaseError when the database cannot be opened or a statement fails
     */
    std::vector<StatementResult> query(std::string_view script, const QueryOptions& options = {});

    /**
     * Splits and classifies a script without executing it.
     * @throws UnsupportedStatementError on the first unsupported statement,
     *         including a segment that holds only comments
     */
    static std::vector<ClassifiedStatement> prepareScript(std::string_view script);

    // Opens the database and runs SELECT 1.
    void testConnection();

    std::int64_t getMaxQueryResults() const { return execution_.max_query_results; }

private:
    StatementResult executeQuery(QueryExecutor& executor, const std::string& sql, const QueryOptions& options);
    StatementResult executeDml(QueryExecutor& executor, const std::string& sql, const QueryOptions& options);
    StatementResult executeDdl(QueryExecutor& executor, const std::string& sql, const QueryOptions& options);

    std::shared_ptr<DatabaseManager> database_;
    ExecutionConfig execution_;
};

std::string generateResultId();

std::string resultTooLargeMessage(std::int64_t count, std::int64_t max_results);

std::string formatTimestamp(std::chrono::system_clock::time_point time);

} // namespace sqlscript
