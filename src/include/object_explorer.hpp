#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <crow/json.h>

#include "database_manager.hpp"

namespace sqlscript {

enum class ItemType {
    Connection,
    Schema,
    ResourceGroup,
    Table,
    View,
    Column
};

std::string itemTypeName(ItemType type);

// A node of the object browser tree.
struct ExplorerItem {
    std::string label;
    ItemType type = ItemType::Connection;
    std::string database;
    std::string schema;
    std::string table;                       // owning table of a column
    ItemType child_type = ItemType::Table;   // what a resource group contains
    std::string icon_id;

    // Column details
    std::string data_type;
    std::optional<std::int64_t> size;
    std::optional<std::string> default_value;
    bool is_nullable = true;

    crow::json::wvalue toJson() const;
};

// Size declared in a type name, e.g. 255 for VARCHAR(255) or 18 for DECIMAL(18,3).
std::optional<std::int64_t> parseTypeSize(const std::string& data_type);

/**
 * Browses and searches the schema of the connected database through
 * information_schema. Every lookup value is bound as a parameter.
 */
class ObjectExplorer {
public:
    static constexpr std::size_t MAX_SEARCH_RESULTS = 100;

    explicit ObjectExplorer(std::shared_ptr<DatabaseManager> database);

    std::vector<ExplorerItem> fetchSchemas();
    std::vector<ExplorerItem> fetchTables(const std::string& schema);
    std::vector<ExplorerItem> fetchViews(const std::string& schema);
    std::vector<ExplorerItem> fetchColumns(const std::string& schema, const std::string& table);

    /**
     * Children of a browser node:
     *   connection     -> schemas
     *   schema         -> the "Tables" and "Views" resource groups
     *   resource group -> tables or views of its schema
     *   table / view   -> columns
     */
    std::vector<ExplorerItem> getChildren(const ExplorerItem& item);

    // Case-insensitive substring search over table and view names.
    std::vector<ExplorerItem> searchTables(const std::string& term);

    // Case-insensitive substring search over column names, optionally limited to some tables.
    std::vector<ExplorerItem> searchColumns(const std::string& term, const std::vector<std::string>& tables = {});

    ExplorerItem connectionItem() const;

private:
    std::vector<ExplorerItem> fetchRelations(const std::string& schema, ItemType type);
    std::vector<ExplorerItem> readColumns(QueryExecutor& executor);

    std::shared_ptr<DatabaseManager> database_;
};

} // namespace sqlscript
