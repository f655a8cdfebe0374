#pragma once

#include <duckdb.h>
#include <crow/json.h>
#include <cstdint>
#include <string>
#include <vector>

#include "duckdb_raii.hpp"

namespace sqlscript {

// Converts DuckDB result chunks into JSON rows keyed by column name.
class QueryResult {
public:
    // Columns without a name are reported as _<index>.
    static std::vector<std::string> columnNames(duckdb_result& result);

    // Consumes the chunks of the result; a second call yields no rows.
    static crow::json::wvalue convertResultToJson(duckdb_result& result, const std::vector<std::string>& names);

    static crow::json::wvalue convertValueToJson(duckdb_vector vector, duckdb_logical_type type, idx_t row_idx);

private:
    static crow::json::wvalue convertVarchar(duckdb_vector vector, idx_t row_idx);
    static crow::json::wvalue convertDecimal(duckdb_vector vector, duckdb_logical_type type, idx_t row_idx);
    static crow::json::wvalue convertTimestamp(duckdb_vector vector, duckdb_type type_id, idx_t row_idx);
    static crow::json::wvalue convertDate(duckdb_vector vector, idx_t row_idx);
    static crow::json::wvalue convertTime(duckdb_vector vector, idx_t row_idx);
    static crow::json::wvalue convertInterval(duckdb_vector vector, idx_t row_idx);
    static crow::json::wvalue convertUuid(duckdb_vector vector, idx_t row_idx);
    static crow::json::wvalue convertEnum(duckdb_vector vector, duckdb_logical_type type, idx_t row_idx);
    static crow::json::wvalue convertList(duckdb_vector vector, duckdb_logical_type type, idx_t row_idx);
    static crow::json::wvalue convertStruct(duckdb_vector vector, duckdb_logical_type type, idx_t row_idx);

    template<typename T>
    static crow::json::wvalue convertPrimitive(duckdb_vector vector, idx_t row_idx) {
        auto data = static_cast<T*>(duckdb_vector_get_data(vector));
        return crow::json::wvalue(data[row_idx]);
    }
};

/**
 * Runs statements on one dedicated connection and keeps the latest result.
 * Statements of one transaction must go through the same executor.
 */
class QueryExecutor {
public:
    explicit QueryExecutor(duckdb_database db);

    /**
     * Executes a single statement.
     * @param context Short description used in the error message, e.g. "row count guard"
     * @throws DatabaseError when DuckDB reports an error
     */
    void execute(const std::string& sql, const std::string& context = "");

    /**
     * Prepares and executes a statement binding every parameter as VARCHAR.
     * @throws DatabaseError on preparation or execution failure
     */
    void executePrepared(const std::string& sql, const std::vector<std::string>& params,
                         const std::string& context = "");

    idx_t rowCount() const;
    idx_t columnCount() const;
    idx_t rowsChanged() const;
    std::vector<std::string> columnNames() const;

    // Value of the first column in the first row.
    std::int64_t scalarInt64() const;

    // Empty string for NULL.
    std::string valueString(idx_t col, idx_t row) const;
    bool isNull(idx_t col, idx_t row) const;

    crow::json::wvalue toJson() const;

private:
    void requireResult() const;

    DuckDBConnection conn_;
    mutable DuckDBResult result_;
};

} // namespace sqlscript
