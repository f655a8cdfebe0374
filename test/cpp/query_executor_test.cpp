#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_all.hpp>
#include "error.hpp"
#include "query_executor.hpp"

using namespace std;

namespace sqlscript {
namespace test {

TEST_CASE("QueryExecutor basic functionality", "[query_executor]") {
    duckdb_database database;
    REQUIRE(duckdb_open(NULL, &database) == DuckDBSuccess);

    SECTION("Simple integer query") {
        QueryExecutor executor(database);
        executor.execute("SELECT 42 as answer");
        auto doc = crow::json::load(executor.toJson().dump());

        REQUIRE(doc.size() == 1);
        REQUIRE(doc[0]["answer"].i() == 42);
        REQUIRE(executor.rowCount() == 1);
        REQUIRE(executor.columnCount() == 1);
        REQUIRE(executor.columnNames() == std::vector<std::string>{"answer"});
    }

    SECTION("NULL handling") {
        QueryExecutor executor(database);
        executor.execute("SELECT NULL as null_value, NULL::INTEGER as typed_null");
        auto doc = crow::json::load(executor.toJson().dump());
        REQUIRE(doc.size() == 1);
        REQUIRE(doc[0]["null_value"].t() == crow::json::type::Null);
        REQUIRE(doc[0]["typed_null"].t() == crow::json::type::Null);
    }

    SECTION("String handling") {
        QueryExecutor executor(database);
        executor.execute("SELECT 'hello world' as greeting, repeat('x', 40) as long_text");
        auto doc = crow::json::load(executor.toJson().dump());
        REQUIRE(doc.size() == 1);
        REQUIRE(doc[0]["greeting"].s() == "hello world");
        REQUIRE(doc[0]["long_text"].s() == std::string(40, 'x'));
    }

    SECTION("Rows spanning several chunks") {
        QueryExecutor executor(database);
        executor.execute("SELECT range AS n FROM range(5000)");
        auto doc = crow::json::load(executor.toJson().dump());
        REQUIRE(doc.size() == 5000);
        REQUIRE(doc[4999]["n"].i() == 4999);
    }

    SECTION("Value accessors") {
        QueryExecutor executor(database);
        executor.execute("SELECT 'abc' AS s, NULL AS n");
        REQUIRE(executor.valueString(0, 0) == "abc");
        REQUIRE_FALSE(executor.isNull(0, 0));
        REQUIRE(executor.isNull(1, 0));
        REQUIRE(executor.valueString(1, 0).empty());
    }

    duckdb_close(&database);
}

TEST_CASE("QueryExecutor statements and counts", "[query_executor]") {
    duckdb_database database;
    REQUIRE(duckdb_open(NULL, &database) == DuckDBSuccess);

    QueryExecutor executor(database);
    executor.execute("CREATE TABLE items (id INTEGER, name VARCHAR)");

    SECTION("Rows changed by DML") {
        executor.execute("INSERT INTO items VALUES (1, 'a'), (2, 'b'), (3, 'c')");
        REQUIRE(executor.rowsChanged() == 3);

        executor.execute("UPDATE items SET name = 'z' WHERE id > 1");
        REQUIRE(executor.rowsChanged() == 2);

        executor.execute("DELETE FROM items");
        REQUIRE(executor.rowsChanged() == 3);
    }

    SECTION("Scalar value") {
        executor.execute("INSERT INTO items VALUES (1, 'a'), (2, 'b')");
        executor.execute("SELECT COUNT(*) FROM items");
        REQUIRE(executor.scalarInt64() == 2);
    }

    SECTION("Scalar of an empty result throws") {
        executor.execute("SELECT id FROM items");
        REQUIRE_THROWS_AS(executor.scalarInt64(), DatabaseError);
    }

    SECTION("Prepared statement with parameters") {
        executor.execute("INSERT INTO items VALUES (1, 'apple'), (2, 'banana')");
        executor.executePrepared("SELECT id FROM items WHERE name = ?", {"banana"});
        REQUIRE(executor.rowCount() == 1);
        REQUIRE(executor.scalarInt64() == 2);
    }

    SECTION("Binding too many parameters throws") {
        REQUIRE_THROWS_WITH((executor.executePrepared("SELECT ?", {"a", "b"}, "lookup")),
                            Catch::Matchers::ContainsSubstring("Failed to bind parameter 2 during lookup"));
    }

    SECTION("Preparation failure throws") {
        REQUIRE_THROWS_AS(executor.executePrepared("SELEC ?", {"a"}), DatabaseError);
    }

    duckdb_close(&database);
}

TEST_CASE("QueryExecutor error handling", "[query_executor]") {
    duckdb_database database;
    REQUIRE(duckdb_open(NULL, &database) == DuckDBSuccess);

    SECTION("Invalid query throws") {
        QueryExecutor executor(database);
        REQUIRE_THROWS_AS(executor.execute("INVALID SQL"), DatabaseError);
    }

    SECTION("Error message names the context") {
        QueryExecutor executor(database);
        REQUIRE_THROWS_WITH(executor.execute("SELECT * FROM missing_table", "row count guard"),
                            Catch::Matchers::StartsWith("Query execution failed during row count guard: "));
    }

    SECTION("Valid after invalid query") {
        QueryExecutor executor(database);
        REQUIRE_THROWS(executor.execute("INVALID SQL"));
        REQUIRE(executor.rowCount() == 0);
        REQUIRE_NOTHROW(executor.execute("SELECT 1"));
        REQUIRE(executor.rowCount() == 1);
    }

    SECTION("Reading before executing") {
        QueryExecutor executor(database);
        REQUIRE(executor.rowCount() == 0);
        REQUIRE(executor.rowsChanged() == 0);
        REQUIRE_THROWS_AS(executor.columnNames(), std::runtime_error);
        REQUIRE_THROWS_AS(executor.toJson(), std::runtime_error);
    }

    SECTION("Closed database cannot be connected") {
        REQUIRE_THROWS_AS(QueryExecutor(nullptr), DatabaseError);
    }

    duckdb_close(&database);
}

TEST_CASE("QueryExecutor type coverage", "[query_executor]") {
    duckdb_database database;
    REQUIRE(duckdb_open(NULL, &database) == DuckDBSuccess);

    QueryExecutor executor(database);
    executor.execute(R"(
        SELECT
            1::TINYINT as tiny,
            2::SMALLINT as small,
            3::INTEGER as integer,
            4::BIGINT as big,
            200::UTINYINT as utiny,
            12345::HUGEINT as huge,
            5.5::FLOAT as float,
            6.6::DOUBLE as double,
            '2023-01-01'::DATE as date,
            '12:34:56'::TIME as time,
            '2023-01-01 12:34:56'::TIMESTAMP as timestamp,
            '2023-01-01 12:34:56'::TIMESTAMP_S as timestamp_s,
            '2023-01-01 12:34:56.789'::TIMESTAMP_MS as timestamp_ms,
            '2023-01-01 12:34:56'::TIMESTAMP_NS as timestamp_ns,
            {'key': 'value'} as struct,
            [1,2,3] as list,
            TRUE as boolean,
            INTERVAL 1 MONTH as interval,
            'hello'::VARCHAR as varchar,
            '123.456'::DECIMAL(6, 3) as decimal,
            '-98765.4321'::DECIMAL(18, 4) as wide_decimal,
            'a0eebc99-9c0b-4ef8-bb6d-6bb9bd380a11'::UUID as uuid
    )");

    auto rows = crow::json::load(executor.toJson().dump());
    REQUIRE(rows.size() == 1);
    const auto& doc = rows[0];

    REQUIRE(doc["tiny"].i() == 1);
    REQUIRE(doc["small"].i() == 2);
    REQUIRE(doc["integer"].i() == 3);
    REQUIRE(doc["big"].i() == 4);
    REQUIRE(doc["utiny"].i() == 200);
    REQUIRE(doc["huge"].d() == Catch::Approx(12345.0));
    REQUIRE(doc["float"].d() == Catch::Approx(5.5));
    REQUIRE(doc["double"].d() == Catch::Approx(6.6));
    REQUIRE(doc["date"].s() == "2023-01-01");
    REQUIRE(doc["time"].s() == "12:34:56.000");
    REQUIRE(doc["timestamp"].s() == "2023-01-01T12:34:56.000Z");
    REQUIRE(doc["timestamp_s"].s() == "2023-01-01T12:34:56.000Z");
    REQUIRE(doc["timestamp_ms"].s() == "2023-01-01T12:34:56.789Z");
    REQUIRE(doc["timestamp_ns"].s() == "2023-01-01T12:34:56.000Z");
    REQUIRE(doc["struct"]["key"].s() == "value");
    REQUIRE(doc["list"].size() == 3);
    REQUIRE(doc["boolean"].b() == true);
    REQUIRE(doc["interval"]["months"].i() == 1);
    REQUIRE(doc["interval"]["days"].i() == 0);
    REQUIRE(doc["interval"]["micros"].i() == 0);
    REQUIRE(doc["varchar"].s() == "hello");
    REQUIRE(doc["decimal"].d() == Catch::Approx(123.456));
    REQUIRE(doc["wide_decimal"].d() == Catch::Approx(-98765.4321));
    REQUIRE(doc["uuid"].s() == "a0eebc99-9c0b-4ef8-bb6d-6bb9bd380a11");

    duckdb_close(&database);
}

TEST_CASE("QueryExecutor nested values", "[query_executor]") {
    duckdb_database database;
    REQUIRE(duckdb_open(NULL, &database) == DuckDBSuccess);

    QueryExecutor executor(database);

    SECTION("Structs and lists") {
        executor.execute(R"SQL(
            select {'a': 42::int} as a,
                   {'b': 'hello', 'c': [1, 2, 3]} as b,
                   {'d': {'e': 42}} as c,
                   ['2025-01-01 12:00:00'::timestamp, '2025-01-02 12:00:00'::timestamp] as d,
                   3::int as e
        )SQL");

        auto doc = crow::json::load(executor.toJson().dump());
        REQUIRE(doc.size() == 1);
        REQUIRE(doc[0]["a"]["a"].i() == 42);
        REQUIRE(doc[0]["b"]["b"].s() == "hello");
        REQUIRE(doc[0]["b"]["c"].size() == 3);
        REQUIRE(doc[0]["c"]["d"]["e"].i() == 42);
        REQUIRE(doc[0]["d"].size() == 2);
        REQUIRE(doc[0]["d"][1].s() == "2025-01-02T12:00:00.000Z");
        REQUIRE(doc[0]["e"].i() == 3);
    }

    SECTION("List offsets per row") {
        executor.execute("SELECT [i, i + 1] AS l, {'v': i * 10} AS s FROM range(3) t(i) ORDER BY i");
        auto doc = crow::json::load(executor.toJson().dump());
        REQUIRE(doc.size() == 3);
        REQUIRE(doc[2]["l"][0].i() == 2);
        REQUIRE(doc[2]["l"][1].i() == 3);
        REQUIRE(doc[2]["s"]["v"].i() == 20);
    }

    SECTION("NULL list elements") {
        executor.execute("SELECT [1, NULL, 3] AS l");
        auto doc = crow::json::load(executor.toJson().dump());
        REQUIRE(doc[0]["l"][1].t() == crow::json::type::Null);
        REQUIRE(doc[0]["l"][2].i() == 3);
    }

    SECTION("Enum values") {
        executor.execute("CREATE TYPE mood AS ENUM ('sad', 'happy')");
        executor.execute("SELECT 'happy'::mood AS m");
        auto doc = crow::json::load(executor.toJson().dump());
        REQUIRE(doc[0]["m"].s() == "happy");
    }

    duckdb_close(&database);
}

}
}
