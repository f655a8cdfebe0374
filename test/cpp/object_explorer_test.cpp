#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <cstdint>
#include "object_explorer.hpp"

using namespace sqlscript;

namespace {

std::vector<std::string> labels(const std::vector<ExplorerItem>& items) {
    std::vector<std::string> result;
    for (const auto& item : items) {
        result.push_back(item.label);
    }
    return result;
}

bool containsLabel(const std::vector<ExplorerItem>& items, const std::string& label) {
    return std::any_of(items.begin(), items.end(), [&](const ExplorerItem& item) { return item.label == label; });
}

} // namespace

class ExplorerFixture {
protected:
    std::shared_ptr<DatabaseManager> database;
    std::unique_ptr<ObjectExplorer> explorer;

    ExplorerFixture() {
        ConnectionConfig config;
        config.name = "warehouse";
        config.init = R"(
CREATE SCHEMA sales;
CREATE TABLE sales.orders (id INTEGER NOT NULL, amount DECIMAL(18,3), status INTEGER DEFAULT 1);
CREATE VIEW sales.big_orders AS SELECT id, amount FROM sales.orders WHERE amount > 100;
CREATE TABLE main.customers (id INTEGER, order_id INTEGER);
)";
        database = std::make_shared<DatabaseManager>(config);
        explorer = std::make_unique<ObjectExplorer>(database);
    }

    ExplorerItem schemaItem(const std::string& name) {
        for (auto& schema : explorer->fetchSchemas()) {
            if (schema.label == name) {
                return schema;
            }
        }
        FAIL("schema not found: " << name);
        return {};
    }
};

TEST_CASE_METHOD(ExplorerFixture, "ObjectExplorer schemas", "[object_explorer]") {
    auto schemas = explorer->fetchSchemas();

    REQUIRE(containsLabel(schemas, "main"));
    REQUIRE(containsLabel(schemas, "sales"));
    REQUIRE_FALSE(containsLabel(schemas, "information_schema"));
    REQUIRE_FALSE(containsLabel(schemas, "pg_catalog"));

    for (const auto& schema : schemas) {
        REQUIRE(schema.type == ItemType::Schema);
        REQUIRE(schema.database == "warehouse");
        REQUIRE(schema.schema == schema.label);
    }
}

TEST_CASE_METHOD(ExplorerFixture, "ObjectExplorer browsing", "[object_explorer]") {
    SECTION("Connection node") {
        auto connection = explorer->connectionItem();
        REQUIRE(connection.label == "warehouse");
        REQUIRE(connection.type == ItemType::Connection);
        REQUIRE(labels(explorer->getChildren(connection)) == labels(explorer->fetchSchemas()));
    }

    SECTION("Schema node has table and view groups") {
        auto groups = explorer->getChildren(schemaItem("sales"));
        REQUIRE(groups.size() == 2);
        REQUIRE(groups[0].label == "Tables");
        REQUIRE(groups[0].child_type == ItemType::Table);
        REQUIRE(groups[1].label == "Views");
        REQUIRE(groups[1].child_type == ItemType::View);
        for (const auto& group : groups) {
            REQUIRE(group.type == ItemType::ResourceGroup);
            REQUIRE(group.schema == "sales");
            REQUIRE(group.icon_id == "folder");
        }
    }

    SECTION("Groups list tables and views separately") {
        auto groups = explorer->getChildren(schemaItem("sales"));

        auto tables = explorer->getChildren(groups[0]);
        REQUIRE(labels(tables) == std::vector<std::string>{"orders"});
        REQUIRE(tables[0].type == ItemType::Table);

        auto views = explorer->getChildren(groups[1]);
        REQUIRE(labels(views) == std::vector<std::string>{"big_orders"});
        REQUIRE(views[0].type == ItemType::View);
    }

    SECTION("Table columns in declaration order") {
        auto columns = explorer->fetchColumns("sales", "orders");
        REQUIRE(labels(columns) == std::vector<std::string>{"id", "amount", "status"});

        REQUIRE(columns[0].type == ItemType::Column);
        REQUIRE(columns[0].table == "orders");
        REQUIRE(columns[0].schema == "sales");
        REQUIRE(columns[0].data_type == "INTEGER");
        REQUIRE_FALSE(columns[0].is_nullable);
        REQUIRE_FALSE(columns[0].default_value.has_value());

        REQUIRE(columns[1].is_nullable);
        REQUIRE(columns[1].size == std::optional<std::int64_t>(18));

        REQUIRE(columns[2].default_value.has_value());
    }

    SECTION("View columns") {
        ExplorerItem view;
        view.label = "big_orders";
        view.type = ItemType::View;
        view.schema = "sales";
        REQUIRE(labels(explorer->getChildren(view)) == std::vector<std::string>{"id", "amount"});
    }

    SECTION("Columns have no children") {
        auto columns = explorer->fetchColumns("sales", "orders");
        REQUIRE(explorer->getChildren(columns[0]).empty());
    }

    SECTION("Unknown table has no columns") {
        REQUIRE(explorer->fetchColumns("sales", "nope").empty());
    }
}

TEST_CASE_METHOD(ExplorerFixture, "ObjectExplorer search", "[object_explorer]") {
    SECTION("Tables and views by name, case-insensitive") {
        auto found = explorer->searchTables("ORD");
        REQUIRE(labels(found) == std::vector<std::string>{"big_orders", "orders"});
        REQUIRE(found[0].type == ItemType::View);
        REQUIRE(found[1].type == ItemType::Table);
        REQUIRE(found[1].schema == "sales");
    }

    SECTION("Columns by name") {
        auto found = explorer->searchColumns("id");
        REQUIRE(found.size() == 4);
        REQUIRE(found[0].table == "big_orders");
        REQUIRE(found[2].label == "order_id");
    }

    SECTION("Columns limited to tables") {
        auto found = explorer->searchColumns("ID", {"orders", "customers"});
        REQUIRE(found.size() == 3);
        for (const auto& column : found) {
            REQUIRE(column.table != "big_orders");
        }
    }

    SECTION("Search terms are bound, not spliced") {
        REQUIRE(explorer->searchTables("'; DROP TABLE sales.orders; --").empty());
        REQUIRE(explorer->fetchColumns("sales", "orders").size() == 3);
    }

    SECTION("Results are capped") {
        database->open();
        auto executor = database->createQueryExecutor();
        for (int i = 0; i < 120; ++i) {
            executor.execute("CREATE TABLE capped_" + std::to_string(i) + " (a INTEGER)");
        }
        REQUIRE(explorer->searchTables("capped_").size() == ObjectExplorer::MAX_SEARCH_RESULTS);
    }
}

TEST_CASE("ExplorerItem::toJson", "[object_explorer]") {
    SECTION("Column") {
        ExplorerItem column;
        column.label = "amount";
        column.type = ItemType::Column;
        column.database = "warehouse";
        column.schema = "sales";
        column.table = "orders";
        column.data_type = "DECIMAL(18,3)";
        column.size = 18;
        column.is_nullable = false;

        auto json = crow::json::load(column.toJson().dump());
        REQUIRE(json["type"].s() == "column");
        REQUIRE(json["table"].s() == "orders");
        REQUIRE(json["dataType"].s() == "DECIMAL(18,3)");
        REQUIRE(json["size"].i() == 18);
        REQUIRE(json["defaultValue"].t() == crow::json::type::Null);
        REQUIRE(json["isNullable"].b() == false);
    }

    SECTION("Resource group") {
        ExplorerItem group;
        group.label = "Views";
        group.type = ItemType::ResourceGroup;
        group.child_type = ItemType::View;
        group.icon_id = "folder";

        auto json = crow::json::load(group.toJson().dump());
        REQUIRE(json["type"].s() == "resourceGroup");
        REQUIRE(json["childType"].s() == "view");
        REQUIRE(json["iconId"].s() == "folder");
    }

    SECTION("View") {
        ExplorerItem view;
        view.label = "big_orders";
        view.type = ItemType::View;

        auto json = crow::json::load(view.toJson().dump());
        REQUIRE(json["isView"].b() == true);
        REQUIRE_FALSE(json.has("schema"));
    }
}

TEST_CASE("parseTypeSize", "[object_explorer]") {
    REQUIRE(parseTypeSize("VARCHAR(255)") == std::optional<std::int64_t>(255));
    REQUIRE(parseTypeSize("DECIMAL(18,3)") == std::optional<std::int64_t>(18));
    REQUIRE_FALSE(parseTypeSize("INTEGER").has_value());
    REQUIRE_FALSE(parseTypeSize("VARCHAR()").has_value());
    REQUIRE_FALSE(parseTypeSize("VARCHAR(-1)").has_value());
    REQUIRE_FALSE(parseTypeSize("VARCHAR(" + std::string(40, '9') + ")").has_value());
    REQUIRE(parseTypeSize("VARCHAR(9223372036854775807)") == std::optional<std::int64_t>(INT64_MAX));
}

TEST_CASE("itemTypeName", "[object_explorer]") {
    REQUIRE(itemTypeName(ItemType::Connection) == "connection");
    REQUIRE(itemTypeName(ItemType::Schema) == "schema");
    REQUIRE(itemTypeName(ItemType::ResourceGroup) == "resourceGroup");
    REQUIRE(itemTypeName(ItemType::Table) == "table");
    REQUIRE(itemTypeName(ItemType::View) == "view");
    REQUIRE(itemTypeName(ItemType::Column) == "column");
}
