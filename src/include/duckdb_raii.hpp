#pragma once

#include <duckdb.h>
#include <string>
#include <utility>

namespace sqlscript {

/**
 * Owns a string allocated by DuckDB (duckdb_value_varchar and friends) and
 * releases it with duckdb_free(). Move-only.
 */
class DuckDBString {
public:
    explicit DuckDBString(char* ptr) noexcept : ptr_(ptr) {}

    ~DuckDBString() {
        if (ptr_) {
            duckdb_free(ptr_);
        }
    }

    DuckDBString(const DuckDBString&) = delete;
    DuckDBString& operator=(const DuckDBString&) = delete;

    DuckDBString(DuckDBString&& other) noexcept : ptr_(std::exchange(other.ptr_, nullptr)) {}

    DuckDBString& operator=(DuckDBString&& other) noexcept {
        if (this != &other) {
            if (ptr_) {
                duckdb_free(ptr_);
            }
            ptr_ = std::exchange(other.ptr_, nullptr);
        }
        return *this;
    }

    const char* get() const noexcept { return ptr_; }

    // Empty string for a null pointer (SQL NULL).
    std::string to_string() const {
        return ptr_ ? std::string(ptr_) : "";
    }

    bool is_null() const noexcept { return ptr_ == nullptr; }

private:
    char* ptr_;
};

/**
 * Owns a duckdb_result. DuckDB requires destroying a result even when the
 * query failed, so set_initialized() is called as soon as duckdb_query has
 * written to it.
 */
class DuckDBResult {
public:
    DuckDBResult() noexcept : has_result_(false) {}

    ~DuckDBResult() {
        reset();
    }

    DuckDBResult(const DuckDBResult&) = delete;
    DuckDBResult& operator=(const DuckDBResult&) = delete;

    DuckDBResult(DuckDBResult&& other) noexcept
        : has_result_(other.has_result_) {
        if (other.has_result_) {
            result_ = other.result_;
            other.has_result_ = false;
        }
    }

    DuckDBResult& operator=(DuckDBResult&& other) noexcept {
        if (this != &other) {
            reset();
            has_result_ = other.has_result_;
            if (other.has_result_) {
                result_ = other.result_;
                other.has_result_ = false;
            }
        }
        return *this;
    }

    duckdb_result* get() noexcept { return &result_; }
    const duckdb_result* get() const noexcept { return &result_; }

    void set_initialized() noexcept { has_result_ = true; }
    bool has_result() const noexcept { return has_result_; }

    void reset() noexcept {
        if (has_result_) {
            duckdb_destroy_result(&result_);
            has_result_ = false;
        }
    }

private:
    duckdb_result result_;
    bool has_result_;
};

/**
 * Owns a duckdb_connection to an open database. Move-only.
 */
class DuckDBConnection {
public:
    DuckDBConnection() noexcept : conn_(nullptr) {}

    // Throws std::runtime_error when DuckDB refuses the connection.
    explicit DuckDBConnection(duckdb_database db);

    ~DuckDBConnection() {
        if (conn_) {
            duckdb_disconnect(&conn_);
        }
    }

    DuckDBConnection(const DuckDBConnection&) = delete;
    DuckDBConnection& operator=(const DuckDBConnection&) = delete;

    DuckDBConnection(DuckDBConnection&& other) noexcept : conn_(std::exchange(other.conn_, nullptr)) {}

    DuckDBConnection& operator=(DuckDBConnection&& other) noexcept {
        if (this != &other) {
            if (conn_) {
                duckdb_disconnect(&conn_);
            }
            conn_ = std::exchange(other.conn_, nullptr);
        }
        return *this;
    }

    duckdb_connection get() const noexcept { return conn_; }
    bool is_open() const noexcept { return conn_ != nullptr; }

private:
    duckdb_connection conn_;
};

/**
 * Owns a duckdb_prepared_statement. Destroying is required even when
 * preparation failed.
 */
class DuckDBPrepared {
public:
    DuckDBPrepared() noexcept : stmt_(nullptr) {}

    ~DuckDBPrepared() {
        if (stmt_) {
            duckdb_destroy_prepare(&stmt_);
        }
    }

    DuckDBPrepared(const DuckDBPrepared&) = delete;
    DuckDBPrepared& operator=(const DuckDBPrepared&) = delete;

    DuckDBPrepared(DuckDBPrepared&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

    duckdb_prepared_statement* out() noexcept { return &stmt_; }
    duckdb_prepared_statement get() const noexcept { return stmt_; }

private:
    duckdb_prepared_statement stmt_;
};

} // namespace sqlscript
