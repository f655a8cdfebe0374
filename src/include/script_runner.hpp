#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <crow/json.h>

#include "config_manager.hpp"
#include "database_manager.hpp"
#include "error.hpp"
#include "object_explorer.hpp"
#include "script_driver.hpp"

namespace sqlscript {

/**
 * Entry point used by the command line: wires configuration, database,
 * driver and explorer together and reports failures as Error values
 * instead of exceptions.
 */
class ScriptRunner {
public:
    explicit ScriptRunner(DriverConfig config);

    Result<std::vector<StatementResult>> run(std::string_view script, const QueryOptions& options = {});

    // Split and classify only; the database is not touched.
    Result<std::vector<ClassifiedStatement>> dryRun(std::string_view script);

    // Whole object tree: schemas, their tables and views, and their columns.
    Result<crow::json::wvalue> browse();

    Result<std::vector<ExplorerItem>> searchTables(const std::string& term);
    Result<std::vector<ExplorerItem>> searchColumns(const std::string& term);

    Result<bool> testConnection();

    static Error toError(const std::exception& e);

    const DriverConfig& getConfig() const { return config_; }

private:
    template<typename F>
    auto capture(F&& fn) -> Result<decltype(fn())>;

    DriverConfig config_;
    std::shared_ptr<DatabaseManager> database_;
    ScriptDriver driver_;
    ObjectExplorer explorer_;
};

} // namespace sqlscript
