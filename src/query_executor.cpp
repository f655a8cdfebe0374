#include "query_executor.hpp"
#include "error.hpp"

#include <crow/logging.h>
#include <fmt/core.h>

namespace sqlscript {

DuckDBConnection::DuckDBConnection(duckdb_database db) : conn_(nullptr) {
    if (db == nullptr || duckdb_connect(db, &conn_) == DuckDBError) {
        conn_ = nullptr;
        throw DatabaseError("Failed to create database connection", true);
    }
}

QueryExecutor::QueryExecutor(duckdb_database db) : conn_(db) {}

void QueryExecutor::execute(const std::string& sql, const std::string& context) {
    result_.reset();

    auto state = duckdb_query(conn_.get(), sql.c_str(), result_.get());
    result_.set_initialized();
    if (state == DuckDBError) {
        const char* error = duckdb_result_error(result_.get());
        std::string error_message = error ? error : "Unknown error";
        std::string context_msg = context.empty() ? "" : " during " + context;
        result_.reset();
        throw DatabaseError("Query execution failed" + context_msg + ": " + error_message);
    }
}

void QueryExecutor::executePrepared(const std::string& sql, const std::vector<std::string>& params,
                                    const std::string& context) {
    result_.reset();
    std::string context_msg = context.empty() ? "" : " during " + context;

    DuckDBPrepared stmt;
    if (duckdb_prepare(conn_.get(), sql.c_str(), stmt.out()) == DuckDBError) {
        const char* error = duckdb_prepare_error(stmt.get());
        throw DatabaseError("Statement preparation failed" + context_msg + ": " + (error ? error : "Unknown error"));
    }

    for (idx_t i = 0; i < params.size(); i++) {
        if (duckdb_bind_varchar(stmt.get(), i + 1, params[i].c_str()) == DuckDBError) {
            throw DatabaseError(fmt::format("Failed to bind parameter {}{}", i + 1, context_msg));
        }
    }

    auto state = duckdb_execute_prepared(stmt.get(), result_.get());
    result_.set_initialized();
    if (state == DuckDBError) {
        const char* error = duckdb_result_error(result_.get());
        std::string error_message = error ? error : "Unknown error";
        result_.reset();
        throw DatabaseError("Prepared statement execution failed" + context_msg + ": " + error_message);
    }
}

void QueryExecutor::requireResult() const {
    if (!result_.has_result()) {
        throw std::runtime_error("No result available - execute query first");
    }
}

idx_t QueryExecutor::rowCount() const {
    return result_.has_result() ? duckdb_row_count(result_.get()) : 0;
}

idx_t QueryExecutor::columnCount() const {
    return result_.has_result() ? duckdb_column_count(result_.get()) : 0;
}

idx_t QueryExecutor::rowsChanged() const {
    return result_.has_result() ? duckdb_rows_changed(result_.get()) : 0;
}

std::vector<std::string> QueryExecutor::columnNames() const {
    requireResult();
    return QueryResult::columnNames(*result_.get());
}

std::int64_t QueryExecutor::scalarInt64() const {
    requireResult();
    if (rowCount() == 0 || columnCount() == 0) {
        throw DatabaseError("Expected a single value but the result is empty");
    }
    return duckdb_value_int64(result_.get(), 0, 0);
}

std::string QueryExecutor::valueString(idx_t col, idx_t row) const {
    requireResult();
    DuckDBString value(duckdb_value_varchar(result_.get(), col, row));
    return value.to_string();
}

bool QueryExecutor::isNull(idx_t col, idx_t row) const {
    requireResult();
    return duckdb_value_is_null(result_.get(), col, row);
}

crow::json::wvalue QueryExecutor::toJson() const {
    requireResult();
    auto names = QueryResult::columnNames(*result_.get());
    return QueryResult::convertResultToJson(*result_.get(), names);
}

// ------------------------------------------------------------------------------------------------

std::vector<std::string> QueryResult::columnNames(duckdb_result& result) {
    std::vector<std::string> names;
    for (idx_t i = 0; i < duckdb_column_count(&result); i++) {
        const char* name = duckdb_column_name(&result, i);
        if (name && *name) {
            names.emplace_back(name);
        } else {
            names.push_back("_" + std::to_string(i));
        }
    }
    return names;
}

crow::json::wvalue QueryResult::convertResultToJson(duckdb_result& result, const std::vector<std::string>& names) {
    std::vector<crow::json::wvalue> rows;

    duckdb_data_chunk chunk;
    while ((chunk = duckdb_fetch_chunk(result)) != nullptr) {
        idx_t row_count = duckdb_data_chunk_get_size(chunk);
        for (idx_t row_idx = 0; row_idx < row_count; row_idx++) {
            crow::json::wvalue row;
            for (idx_t col_idx = 0; col_idx < names.size(); col_idx++) {
                auto vector = duckdb_data_chunk_get_vector(chunk, col_idx);
                auto type = duckdb_vector_get_column_type(vector);
                row[names[col_idx]] = convertValueToJson(vector, type, row_idx);
                duckdb_destroy_logical_type(&type);
            }
            rows.push_back(std::move(row));
        }
        duckdb_destroy_data_chunk(&chunk);
    }

    return crow::json::wvalue(rows);
}

crow::json::wvalue QueryResult::convertValueToJson(duckdb_vector vector, duckdb_logical_type type, idx_t row_idx) {
    auto validity = duckdb_vector_get_validity(vector);
    if (!duckdb_validity_row_is_valid(validity, row_idx)) {
        return crow::json::wvalue(nullptr);
    }

    auto type_id = duckdb_get_type_id(type);
    switch (type_id) {
        case DUCKDB_TYPE_SQLNULL:
            return crow::json::wvalue(nullptr);
        case DUCKDB_TYPE_BOOLEAN:
            return convertPrimitive<bool>(vector, row_idx);
        case DUCKDB_TYPE_TINYINT:
            return convertPrimitive<std::int8_t>(vector, row_idx);
        case DUCKDB_TYPE_SMALLINT:
            return convertPrimitive<std::int16_t>(vector, row_idx);
        case DUCKDB_TYPE_INTEGER:
            return convertPrimitive<std::int32_t>(vector, row_idx);
        case DUCKDB_TYPE_BIGINT:
            return convertPrimitive<std::int64_t>(vector, row_idx);
        case DUCKDB_TYPE_UTINYINT:
            return convertPrimitive<std::uint8_t>(vector, row_idx);
        case DUCKDB_TYPE_USMALLINT:
            return convertPrimitive<std::uint16_t>(vector, row_idx);
        case DUCKDB_TYPE_UINTEGER:
            return convertPrimitive<std::uint32_t>(vector, row_idx);
        case DUCKDB_TYPE_UBIGINT:
            return convertPrimitive<std::uint64_t>(vector, row_idx);
        case DUCKDB_TYPE_HUGEINT: {
            auto data = static_cast<duckdb_hugeint*>(duckdb_vector_get_data(vector));
            return crow::json::wvalue(duckdb_hugeint_to_double(data[row_idx]));
        }
        case DUCKDB_TYPE_FLOAT:
            return convertPrimitive<float>(vector, row_idx);
        case DUCKDB_TYPE_DOUBLE:
            return convertPrimitive<double>(vector, row_idx);
        case DUCKDB_TYPE_VARCHAR:
        case DUCKDB_TYPE_BLOB:
        case DUCKDB_TYPE_BIT:
            return convertVarchar(vector, row_idx);
        case DUCKDB_TYPE_DECIMAL:
            return convertDecimal(vector, type, row_idx);
        case DUCKDB_TYPE_TIMESTAMP:
        case DUCKDB_TYPE_TIMESTAMP_TZ:
        case DUCKDB_TYPE_TIMESTAMP_S:
        case DUCKDB_TYPE_TIMESTAMP_MS:
        case DUCKDB_TYPE_TIMESTAMP_NS:
            return convertTimestamp(vector, type_id, row_idx);
        case DUCKDB_TYPE_DATE:
            return convertDate(vector, row_idx);
        case DUCKDB_TYPE_TIME:
            return convertTime(vector, row_idx);
        case DUCKDB_TYPE_INTERVAL:
            return convertInterval(vector, row_idx);
        case DUCKDB_TYPE_UUID:
            return convertUuid(vector, row_idx);
        case DUCKDB_TYPE_ENUM:
            return convertEnum(vector, type, row_idx);
        case DUCKDB_TYPE_LIST:
            return convertList(vector, type, row_idx);
        case DUCKDB_TYPE_STRUCT:
            return convertStruct(vector, type, row_idx);
        default:
            CROW_LOG_WARNING << "Unsupported result type: " << type_id;
            return crow::json::wvalue(nullptr);
    }
}

crow::json::wvalue QueryResult::convertVarchar(duckdb_vector vector, idx_t row_idx) {
    auto data = static_cast<duckdb_string_t*>(duckdb_vector_get_data(vector));
    auto& entry = data[row_idx];
    std::string str = duckdb_string_is_inlined(entry)
        ? std::string(entry.value.inlined.inlined, entry.value.inlined.length)
        : std::string(entry.value.pointer.ptr, entry.value.pointer.length);
    return crow::json::wvalue(str);
}

crow::json::wvalue QueryResult::convertDecimal(duckdb_vector vector, duckdb_logical_type type, idx_t row_idx) {
    void* data = duckdb_vector_get_data(vector);
    duckdb_hugeint value{0, 0};

    auto widen = [](std::int64_t input) {
        duckdb_hugeint result;
        result.lower = static_cast<std::uint64_t>(input);
        result.upper = input < 0 ? -1 : 0;
        return result;
    };

    switch (duckdb_decimal_internal_type(type)) {
        case DUCKDB_TYPE_SMALLINT:
            value = widen(static_cast<std::int16_t*>(data)[row_idx]);
            break;
        case DUCKDB_TYPE_INTEGER:
            value = widen(static_cast<std::int32_t*>(data)[row_idx]);
            break;
        case DUCKDB_TYPE_BIGINT:
            value = widen(static_cast<std::int64_t*>(data)[row_idx]);
            break;
        case DUCKDB_TYPE_HUGEINT:
            value = static_cast<duckdb_hugeint*>(data)[row_idx];
            break;
        default:
            CROW_LOG_WARNING << "Unknown internal type for decimal";
            return crow::json::wvalue(nullptr);
    }

    duckdb_decimal decimal{duckdb_decimal_width(type), duckdb_decimal_scale(type), value};
    return crow::json::wvalue(duckdb_decimal_to_double(decimal));
}

crow::json::wvalue QueryResult::convertTimestamp(duckdb_vector vector, duckdb_type type_id, idx_t row_idx) {
    std::int64_t raw = static_cast<std::int64_t*>(duckdb_vector_get_data(vector))[row_idx];
    std::int64_t micros = raw;
    if (type_id == DUCKDB_TYPE_TIMESTAMP_S) {
        micros = raw * 1000000;
    } else if (type_id == DUCKDB_TYPE_TIMESTAMP_MS) {
        micros = raw * 1000;
    } else if (type_id == DUCKDB_TYPE_TIMESTAMP_NS) {
        micros = raw / 1000;
    }

    auto ts = duckdb_from_timestamp(duckdb_timestamp{micros});
    return crow::json::wvalue(fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                                          ts.date.year, ts.date.month, ts.date.day,
                                          ts.time.hour, ts.time.min, ts.time.sec, ts.time.micros / 1000));
}

crow::json::wvalue QueryResult::convertDate(duckdb_vector vector, idx_t row_idx) {
    auto data = static_cast<duckdb_date*>(duckdb_vector_get_data(vector));
    auto date = duckdb_from_date(data[row_idx]);
    return crow::json::wvalue(fmt::format("{:04d}-{:02d}-{:02d}", date.year, date.month, date.day));
}

crow::json::wvalue QueryResult::convertTime(duckdb_vector vector, idx_t row_idx) {
    auto data = static_cast<duckdb_time*>(duckdb_vector_get_data(vector));
    auto time = duckdb_from_time(data[row_idx]);
    return crow::json::wvalue(fmt::format("{:02d}:{:02d}:{:02d}.{:03d}", time.hour, time.min, time.sec, time.micros / 1000));
}

crow::json::wvalue QueryResult::convertInterval(duckdb_vector vector, idx_t row_idx) {
    auto interval = static_cast<duckdb_interval*>(duckdb_vector_get_data(vector))[row_idx];
    crow::json::wvalue result;
    result["months"] = interval.months;
    result["days"] = interval.days;
    result["micros"] = interval.micros;
    return result;
}

crow::json::wvalue QueryResult::convertUuid(duckdb_vector vector, idx_t row_idx) {
    auto value = static_cast<duckdb_hugeint*>(duckdb_vector_get_data(vector))[row_idx];
    // DuckDB flips the top bit so that UUIDs sort as signed 128-bit integers.
    std::uint64_t upper = static_cast<std::uint64_t>(value.upper) ^ (std::uint64_t(1) << 63);
    std::uint64_t lower = value.lower;
    return crow::json::wvalue(fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                                          upper >> 32, (upper >> 16) & 0xffff, upper & 0xffff,
                                          lower >> 48, lower & 0xffffffffffffULL));
}

crow::json::wvalue QueryResult::convertEnum(duckdb_vector vector, duckdb_logical_type type, idx_t row_idx) {
    void* data = duckdb_vector_get_data(vector);
    idx_t index = 0;
    switch (duckdb_enum_internal_type(type)) {
        case DUCKDB_TYPE_UTINYINT:
            index = static_cast<std::uint8_t*>(data)[row_idx];
            break;
        case DUCKDB_TYPE_USMALLINT:
            index = static_cast<std::uint16_t*>(data)[row_idx];
            break;
        case DUCKDB_TYPE_UINTEGER:
            index = static_cast<std::uint32_t*>(data)[row_idx];
            break;
        default:
            return crow::json::wvalue(nullptr);
    }

    DuckDBString value(duckdb_enum_dictionary_value(type, index));
    return crow::json::wvalue(value.to_string());
}

crow::json::wvalue QueryResult::convertList(duckdb_vector vector, duckdb_logical_type type, idx_t row_idx) {
    auto entries = static_cast<duckdb_list_entry*>(duckdb_vector_get_data(vector));
    auto entry = entries[row_idx];
    auto child_vector = duckdb_list_vector_get_child(vector);
    auto child_type = duckdb_list_type_child_type(type);

    std::vector<crow::json::wvalue> items;
    for (idx_t i = 0; i < entry.length; i++) {
        items.push_back(convertValueToJson(child_vector, child_type, entry.offset + i));
    }

    duckdb_destroy_logical_type(&child_type);
    return crow::json::wvalue(items);
}

crow::json::wvalue QueryResult::convertStruct(duckdb_vector vector, duckdb_logical_type type, idx_t row_idx) {
    crow::json::wvalue result;
    idx_t child_count = duckdb_struct_type_child_count(type);

    for (idx_t i = 0; i < child_count; i++) {
        DuckDBString child_name(duckdb_struct_type_child_name(type, i));
        auto child_type = duckdb_struct_type_child_type(type, i);
        auto child_vector = duckdb_struct_vector_get_child(vector, i);
        result[child_name.to_string()] = convertValueToJson(child_vector, child_type, row_idx);
        duckdb_destroy_logical_type(&child_type);
    }

    return result;
}

} // namespace sqlscript
