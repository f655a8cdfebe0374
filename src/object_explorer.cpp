#include "object_explorer.hpp"

#include <crow/logging.h>
#include <charconv>
#include <stdexcept>

namespace sqlscript {

std::string itemTypeName(ItemType type) {
    switch (type) {
        case ItemType::Connection:
            return "connection";
        case ItemType::Schema:
            return "schema";
        case ItemType::ResourceGroup:
            return "resourceGroup";
        case ItemType::Table:
            return "table";
        case ItemType::View:
            return "view";
        case ItemType::Column:
            return "column";
        default:
            return "unknown";
    }
}

crow::json::wvalue ExplorerItem::toJson() const {
    crow::json::wvalue json;
    json["label"] = label;
    json["type"] = itemTypeName(type);
    json["database"] = database;
    if (!schema.empty()) {
        json["schema"] = schema;
    }
    if (!icon_id.empty()) {
        json["iconId"] = icon_id;
    }

    switch (type) {
        case ItemType::ResourceGroup:
            json["childType"] = itemTypeName(child_type);
            break;
        case ItemType::Table:
        case ItemType::View:
            json["isView"] = type == ItemType::View;
            break;
        case ItemType::Column:
            json["table"] = table;
            json["dataType"] = data_type;
            json["detail"] = data_type;
            json["isNullable"] = is_nullable;
            json["size"] = size ? crow::json::wvalue(*size) : crow::json::wvalue(nullptr);
            json["defaultValue"] = default_value ? crow::json::wvalue(*default_value) : crow::json::wvalue(nullptr);
            break;
        default:
            break;
    }
    return json;
}

std::optional<std::int64_t> parseTypeSize(const std::string& data_type) {
    auto open = data_type.find('(');
    if (open == std::string::npos) {
        return std::nullopt;
    }

    const char* first = data_type.data() + open + 1;
    const char* last = data_type.data() + data_type.size();
    std::int64_t size = 0;
    auto [end, ec] = std::from_chars(first, last, size);
    if (ec != std::errc() || end == first || size < 0) {
        return std::nullopt;
    }
    return size;
}

ObjectExplorer::ObjectExplorer(std::shared_ptr<DatabaseManager> database)
    : database_(std::move(database)) {
    if (!database_) {
        throw std::invalid_argument("ObjectExplorer requires a database");
    }
}

ExplorerItem ObjectExplorer::connectionItem() const {
    ExplorerItem item;
    item.label = database_->getConnectionConfig().name;
    item.type = ItemType::Connection;
    item.database = database_->getConnectionConfig().name;
    item.icon_id = "database";
    return item;
}

std::vector<ExplorerItem> ObjectExplorer::fetchSchemas() {
    database_->open();
    auto executor = database_->createQueryExecutor();
    executor.execute(R"(
SELECT schema_name
FROM information_schema.schemata
WHERE catalog_name = current_database()
  AND schema_name NOT IN ('information_schema', 'pg_catalog')
ORDER BY schema_name
)", "fetch schemas");

    std::vector<ExplorerItem> schemas;
    for (idx_t row = 0; row < executor.rowCount(); row++) {
        ExplorerItem item;
        item.label = executor.valueString(0, row);
        item.type = ItemType::Schema;
        item.database = database_->getConnectionConfig().name;
        item.schema = item.label;
        item.icon_id = "group-by-ref-type";
        schemas.push_back(std::move(item));
    }
    return schemas;
}

std::vector<ExplorerItem> ObjectExplorer::fetchTables(const std::string& schema) {
    return fetchRelations(schema, ItemType::Table);
}

std::vector<ExplorerItem> ObjectExplorer::fetchViews(const std::string& schema) {
    return fetchRelations(schema, ItemType::View);
}

std::vector<ExplorerItem> ObjectExplorer::fetchRelations(const std::string& schema, ItemType type) {
    database_->open();
    auto executor = database_->createQueryExecutor();
    executor.executePrepared(R"(
SELECT table_name
FROM information_schema.tables
WHERE table_catalog = current_database()
  AND table_schema = ?
  AND table_type = ?
ORDER BY table_name
)", {schema, type == ItemType::View ? "VIEW" : "BASE TABLE"}, "fetch tables");

    std::vector<ExplorerItem> relations;
    for (idx_t row = 0; row < executor.rowCount(); row++) {
        ExplorerItem item;
        item.label = executor.valueString(0, row);
        item.type = type;
        item.database = database_->getConnectionConfig().name;
        item.schema = schema;
        relations.push_back(std::move(item));
    }
    return relations;
}

std::vector<ExplorerItem> ObjectExplorer::fetchColumns(const std::string& schema, const std::string& table) {
    database_->open();
    auto executor = database_->createQueryExecutor();
    executor.executePrepared(R"(
SELECT column_name, table_name, table_schema, data_type, is_nullable, column_default, character_maximum_length
FROM information_schema.columns
WHERE table_catalog = current_database()
  AND table_schema = ?
  AND table_name = ?
ORDER BY ordinal_position ASC
)", {schema, table}, "fetch columns");
    return readColumns(executor);
}

std::vector<ExplorerItem> ObjectExplorer::readColumns(QueryExecutor& executor) {
    std::vector<ExplorerItem> columns;
    for (idx_t row = 0; row < executor.rowCount(); row++) {
        ExplorerItem item;
        item.label = executor.valueString(0, row);
        item.type = ItemType::Column;
        item.table = executor.valueString(1, row);
        item.schema = executor.valueString(2, row);
        item.database = database_->getConnectionConfig().name;
        item.data_type = executor.valueString(3, row);
        item.is_nullable = executor.valueString(4, row) == "YES";
        if (!executor.isNull(5, row)) {
            item.default_value = executor.valueString(5, row);
        }
        if (!executor.isNull(6, row)) {
            item.size = std::stoll(executor.valueString(6, row));
        } else {
            item.size = parseTypeSize(item.data_type);
        }
        columns.push_back(std::move(item));
    }
    return columns;
}

std::vector<ExplorerItem> ObjectExplorer::getChildren(const ExplorerItem& item) {
    switch (item.type) {
        case ItemType::Connection:
            return fetchSchemas();
        case ItemType::Schema: {
            ExplorerItem tables;
            tables.label = "Tables";
            tables.type = ItemType::ResourceGroup;
            tables.database = item.database;
            tables.schema = item.schema;
            tables.child_type = ItemType::Table;
            tables.icon_id = "folder";

            ExplorerItem views = tables;
            views.label = "Views";
            views.child_type = ItemType::View;
            return {tables, views};
        }
        case ItemType::ResourceGroup:
            return item.child_type == ItemType::View ? fetchViews(item.schema) : fetchTables(item.schema);
        case ItemType::Table:
        case ItemType::View:
            return fetchColumns(item.schema, item.label);
        case ItemType::Column:
        default:
            return {};
    }
}

std::vector<ExplorerItem> ObjectExplorer::searchTables(const std::string& term) {
    database_->open();
    auto executor = database_->createQueryExecutor();
    executor.executePrepared(R"(
SELECT table_schema, table_name, table_type
FROM information_schema.tables
WHERE table_catalog = current_database()
  AND table_schema NOT IN ('information_schema', 'pg_catalog')
  AND contains(lower(table_name), lower(?))
ORDER BY table_name
LIMIT )" + std::to_string(MAX_SEARCH_RESULTS), {term}, "search tables");

    std::vector<ExplorerItem> tables;
    for (idx_t row = 0; row < executor.rowCount(); row++) {
        ExplorerItem item;
        item.schema = executor.valueString(0, row);
        item.label = executor.valueString(1, row);
        item.type = executor.valueString(2, row) == "VIEW" ? ItemType::View : ItemType::Table;
        item.database = database_->getConnectionConfig().name;
        tables.push_back(std::move(item));
    }
    CROW_LOG_DEBUG << "Table search '" << term << "' matched " << tables.size() << " item(s)";
    return tables;
}

std::vector<ExplorerItem> ObjectExplorer::searchColumns(const std::string& term, const std::vector<std::string>& tables) {
    std::string sql = R"(
SELECT column_name, table_name, table_schema, data_type, is_nullable, column_default, character_maximum_length
FROM information_schema.columns
WHERE table_catalog = current_database()
  AND table_schema NOT IN ('information_schema', 'pg_catalog')
  AND contains(lower(column_name), lower(?)))";

    std::vector<std::string> params{term};
    if (!tables.empty()) {
        sql += "\n  AND table_name IN (";
        for (std::size_t i = 0; i < tables.size(); ++i) {
            sql += i == 0 ? "?" : ", ?";
            params.push_back(tables[i]);
        }
        sql += ")";
    }
    sql += "\nORDER BY table_name, ordinal_position\nLIMIT " + std::to_string(MAX_SEARCH_RESULTS);

    database_->open();
    auto executor = database_->createQueryExecutor();
    executor.executePrepared(sql, params, "search columns");
    return readColumns(executor);
}

} // namespace sqlscript
