#include "script_driver.hpp"
#include "error.hpp"
#include "sql_utils.hpp"

#include <crow/logging.h>
#include <fmt/core.h>
#include <ctime>
#include <random>

namespace sqlscript {

std::string generateResultId() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<std::uint64_t> dis;

    std::uint64_t high = dis(gen);
    std::uint64_t low = dis(gen);

    // RFC 4122 version 4, variant 1
    high = (high & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
    low = (low & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       high >> 32, (high >> 16) & 0xffff, high & 0xffff,
                       low >> 48, low & 0xffffffffffffULL);
}

std::string resultTooLargeMessage(std::int64_t count, std::int64_t max_results) {
    return fmt::format("Query result is too large with {} results. Limit the query results to max {} and rerun the query.",
                       count, max_results);
}

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                       utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                       utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(millis));
}

crow::json::wvalue StatementResult::toJson() const {
    crow::json::wvalue json;
    std::vector<crow::json::wvalue> columns;
    for (const auto& col : cols) {
        columns.emplace_back(col);
    }
    std::vector<crow::json::wvalue> message_list;
    for (const auto& msg : messages) {
        crow::json::wvalue entry;
        entry["date"] = formatTimestamp(msg.date);
        entry["message"] = msg.message;
        message_list.push_back(std::move(entry));
    }

    json["cols"] = crow::json::wvalue(columns);
    json["results"] = crow::json::wvalue(results);
    json["messages"] = crow::json::wvalue(message_list);
    json["query"] = query;
    json["kind"] = statementKindName(kind);
    json["requestId"] = request_id;
    json["resultId"] = result_id;
    return json;
}

namespace {

StatementResult makeResult(const std::string& sql, StatementKind kind, const QueryOptions& options,
                           std::vector<std::string> cols, crow::json::wvalue results, const std::string& message) {
    StatementResult result;
    result.cols = std::move(cols);
    result.results = std::move(results);
    result.messages.push_back(ResultMessage{std::chrono::system_clock::now(), message});
    result.query = sql;
    result.request_id = options.request_id;
    result.result_id = generateResultId();
    result.kind = kind;
    return result;
}

crow::json::wvalue singleRow(const std::string& column, crow::json::wvalue value) {
    crow::json::wvalue row;
    row[column] = std::move(value);
    std::vector<crow::json::wvalue> rows;
    rows.push_back(std::move(row));
    return crow::json::wvalue(rows);
}

} // namespace

ScriptDriver::ScriptDriver(std::shared_ptr<DatabaseManager> database, ExecutionConfig execution)
    : database_(std::move(database)), execution_(execution) {
    if (!database_) {
        throw std::invalid_argument("ScriptDriver requires a database");
    }
}

std::vector<ClassifiedStatement> ScriptDriver::prepareScript(std::string_view script) {
    std::vector<ClassifiedStatement> prepared;
    for (auto& statement : splitSqlStatements(script)) {
        StatementKind kind = classifyStatement(statement);
        if (kind == StatementKind::Unspecified) {
            throw UnsupportedStatementError(statement);
        }
        prepared.push_back(ClassifiedStatement{std::move(statement), kind});
    }
    return prepared;
}

std::vector<StatementResult> ScriptDriver::query(std::string_view script, const QueryOptions& options) {
    auto statements = prepareScript(script);

    database_->open();
    auto executor = database_->createQueryExecutor();

    std::vector<StatementResult> results;
    for (const auto& statement : statements) {
        if (execution_.log_queries) {
            CROW_LOG_INFO << "Executing " << statementKindName(statement.kind) << " statement: " << statement.text;
        }

        switch (statement.kind) {
            case StatementKind::Query:
                results.push_back(executeQuery(executor, statement.text, options));
                break;
            case StatementKind::DataChange:
                results.push_back(executeDml(executor, statement.text, options));
                break;
            case StatementKind::SchemaChange:
                results.push_back(executeDdl(executor, statement.text, options));
                break;
            case StatementKind::Unspecified:
                throw UnsupportedStatementError(statement.text);
        }
    }
    return results;
}

void ScriptDriver::testConnection() {
    database_->open();
    query("SELECT 1");
}

StatementResult ScriptDriver::executeQuery(QueryExecutor& executor, const std::string& sql, const QueryOptions& options) {
    const std::string executable = stripSqlComments(sql);

    // The transaction only gives the guard and the query the same snapshot; it never commits.
    TransactionScope transaction(executor, "query transaction");
    executor.execute("SELECT COUNT(*) FROM (" + executable + ")", "row count guard");
    std::int64_t count = executor.scalarInt64();
    if (count > execution_.max_query_results) {
        transaction.rollback();
        std::string message = resultTooLargeMessage(count, execution_.max_query_results);
        CROW_LOG_WARNING << message;
        return makeResult(sql, StatementKind::Query, options, {"Error"}, singleRow("Error", message), message);
    }

    executor.execute(executable, "query");
    auto cols = executor.columnNames();
    auto row_count = executor.rowCount();
    auto rows = executor.toJson();
    transaction.rollback();

    return makeResult(sql, StatementKind::Query, options, std::move(cols), std::move(rows),
                      fmt::format("Query ok with {} results", row_count));
}

StatementResult ScriptDriver::executeDml(QueryExecutor& executor, const std::string& sql, const QueryOptions& options) {
    const std::string executable = stripSqlComments(sql);

    TransactionScope transaction(executor, "DML transaction");
    executor.execute(executable, "DML statement");
    idx_t row_count = executor.rowsChanged();
    transaction.commit();

    return makeResult(sql, StatementKind::DataChange, options, {"rowCount"},
                      singleRow("rowCount", crow::json::wvalue(static_cast<std::uint64_t>(row_count))),
                      fmt::format("Update ok with {} updated rows", row_count));
}

StatementResult ScriptDriver::executeDdl(QueryExecutor& executor, const std::string& sql, const QueryOptions& options) {
    CROW_LOG_DEBUG << "Submitting schema update: " << sql;
    executor.execute(stripSqlComments(sql), "schema update");

    return makeResult(sql, StatementKind::SchemaChange, options, {"Result"}, singleRow("Result", "Success"),
                      "DDL statement executed successfully");
}

TransactionScope::TransactionScope(QueryExecutor& executor, const std::string& context)
    : executor_(executor), context_(context) {
    executor_.execute("BEGIN TRANSACTION", context_);
    open_ = true;
}

TransactionScope::~TransactionScope() {
    if (!open_) {
        return;
    }
    try {
        rollback();
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "Rollback of " << context_ << " failed: " << e.what();
    }
}

void TransactionScope::commit() {
    executor_.execute("COMMIT", context_ + " commit");
    open_ = false;
}

void TransactionScope::rollback() {
    open_ = false;
    try {
        executor_.execute("ROLLBACK", context_ + " rollback");
    } catch (const DatabaseError& e) {
        // A failed statement may already have aborted the transaction.
        CROW_LOG_DEBUG << "Rollback skipped: " << e.what();
    }
}

} // namespace sqlscript
