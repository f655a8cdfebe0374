#include "script_runner.hpp"

#include <crow/logging.h>

namespace sqlscript {

ScriptRunner::ScriptRunner(DriverConfig config)
    : config_(std::move(config)),
      database_(std::make_shared<DatabaseManager>(config_.connection)),
      driver_(database_, config_.execution),
      explorer_(database_)
{}

Error ScriptRunner::toError(const std::exception& e) {
    if (auto* config_error = dynamic_cast<const ConfigurationError*>(&e)) {
        return Error::Config(config_error->what());
    }
    if (auto* unsupported = dynamic_cast<const UnsupportedStatementError*>(&e)) {
        return Error::Unsupported(unsupported->what(), unsupported->statement());
    }
    if (auto* db_error = dynamic_cast<const DatabaseError*>(&e)) {
        return db_error->isConnectionFailure() ? Error::Connection(db_error->what())
                                               : Error::Database(db_error->what());
    }
    return Error::Internal(e.what());
}

template<typename F>
auto ScriptRunner::capture(F&& fn) -> Result<decltype(fn())> {
    try {
        return fn();
    } catch (const std::exception& e) {
        Error error = toError(e);
        CROW_LOG_ERROR << error.getCategoryName() << " error: " << error.message;
        return error;
    }
}

Result<std::vector<StatementResult>> ScriptRunner::run(std::string_view script, const QueryOptions& options) {
    return capture([&] { return driver_.query(script, options); });
}

Result<std::vector<ClassifiedStatement>> ScriptRunner::dryRun(std::string_view script) {
    return capture([&] { return ScriptDriver::prepareScript(script); });
}

Result<crow::json::wvalue> ScriptRunner::browse() {
    return capture([&] {
        auto connection = explorer_.connectionItem();
        auto tree = connection.toJson();

        std::vector<crow::json::wvalue> schema_nodes;
        for (const auto& schema : explorer_.getChildren(connection)) {
            auto schema_json = schema.toJson();
            std::vector<crow::json::wvalue> group_nodes;
            for (const auto& group : explorer_.getChildren(schema)) {
                auto group_json = group.toJson();
                std::vector<crow::json::wvalue> relation_nodes;
                for (const auto& relation : explorer_.getChildren(group)) {
                    auto relation_json = relation.toJson();
                    std::vector<crow::json::wvalue> column_nodes;
                    for (const auto& column : explorer_.getChildren(relation)) {
                        column_nodes.push_back(column.toJson());
                    }
                    relation_json["children"] = crow::json::wvalue(column_nodes);
                    relation_nodes.push_back(std::move(relation_json));
                }
                group_json["children"] = crow::json::wvalue(relation_nodes);
                group_nodes.push_back(std::move(group_json));
            }
            schema_json["children"] = crow::json::wvalue(group_nodes);
            schema_nodes.push_back(std::move(schema_json));
        }
        tree["children"] = crow::json::wvalue(schema_nodes);
        return tree;
    });
}

Result<std::vector<ExplorerItem>> ScriptRunner::searchTables(const std::string& term) {
    return capture([&] { return explorer_.searchTables(term); });
}

Result<std::vector<ExplorerItem>> ScriptRunner::searchColumns(const std::string& term) {
    return capture([&] { return explorer_.searchColumns(term); });
}

Result<bool> ScriptRunner::testConnection() {
    return capture([&] {
        driver_.testConnection();
        return true;
    });
}

} // namespace sqlscript
