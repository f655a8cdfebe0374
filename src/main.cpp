#include <argparse/argparse.hpp>
#include <crow/json.h>
#include <crow/logging.h>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include "completion_catalog.hpp"
#include "config_manager.hpp"
#include "error.hpp"
#include "script_runner.hpp"

using namespace sqlscript;

void set_log_level(const std::string& log_level) {
    if (log_level == "debug") {
        crow::logger::setLogLevel(crow::LogLevel::Debug);
    } else if (log_level == "info") {
        crow::logger::setLogLevel(crow::LogLevel::Info);
    } else if (log_level == "warning") {
        crow::logger::setLogLevel(crow::LogLevel::Warning);
    } else if (log_level == "error") {
        crow::logger::setLogLevel(crow::LogLevel::Error);
    } else {
        std::cerr << "Invalid log level: " << log_level << ". Using default (info)." << std::endl;
        crow::logger::setLogLevel(crow::LogLevel::Info);
    }
}

void terminateHandler() {
    CROW_LOG_ERROR << "Unhandled exception caught! sqlscript is giving up :-(";

    if (auto ex = std::current_exception()) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            CROW_LOG_ERROR << "exception caught: " << e.what();
        }
    }
    std::abort();
}

DriverConfig loadDriverConfig(const std::string& config_file, const std::string& database, const std::string& log_level) {
    DriverConfig config = DriverConfig::defaults();
    if (!config_file.empty()) {
        ConfigManager config_manager{std::filesystem::path(config_file)};
        config_manager.loadConfig();
        if (!database.empty()) {
            config_manager.setDatabase(database);
        }
        if (!log_level.empty()) {
            config_manager.setLogLevel(log_level);
        }
        return config_manager.getConfig();
    }

    if (!database.empty()) {
        config.connection.database = database;
    }
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
    return config;
}

std::string readScript(const std::string& script_file, const std::string& inline_sql) {
    if (!inline_sql.empty()) {
        return inline_sql;
    }

    if (script_file.empty() || script_file == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    std::ifstream file(script_file);
    if (!file) {
        throw std::runtime_error("Cannot read script file: " + script_file);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

int printError(const Error& error) {
    std::cout << error.toJson().dump() << std::endl;
    return error.exit_code;
}

template<typename T>
int printItems(const Result<std::vector<T>>& result) {
    if (!result) {
        return printError(result.error());
    }
    std::vector<crow::json::wvalue> items;
    for (const auto& item : result.value()) {
        items.push_back(item.toJson());
    }
    std::cout << crow::json::wvalue(items).dump() << std::endl;
    return 0;
}

int main(int argc, char* argv[])
{
    std::set_terminate(terminateHandler);

    argparse::ArgumentParser program("sqlscript");

    program.add_argument("-c", "--config")
        .help("Path to the sqlscript.yaml configuration file")
        .default_value(std::string(""));

    program.add_argument("-d", "--database")
        .help("DuckDB database file, overrides connection.database")
        .default_value(std::string(""));

    program.add_argument("-f", "--file")
        .help("SQL script to execute, '-' reads standard input")
        .default_value(std::string(""));

    program.add_argument("-e", "--execute")
        .help("SQL text to execute instead of a script file")
        .default_value(std::string(""));

    program.add_argument("--request-id")
        .help("Request id echoed in every result")
        .default_value(std::string(""));

    program.add_argument("--dry-run")
        .help("Split and classify the script without executing it")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--browse")
        .help("Print the schemas, tables, views and columns of the database")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--search-tables")
        .help("Search tables and views by name")
        .default_value(std::string(""));

    program.add_argument("--search-columns")
        .help("Search columns by name")
        .default_value(std::string(""));

    program.add_argument("--completions")
        .help("Print the static keyword and function completions")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--test-connection")
        .help("Open the database and run SELECT 1")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--log-level")
        .help("Set the log level (debug, info, warning, error)")
        .default_value(std::string(""));

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    std::string cli_log_level = program.get<std::string>("--log-level");
    set_log_level(cli_log_level.empty() ? "info" : cli_log_level);

    DriverConfig config;
    try {
        config = loadDriverConfig(program.get<std::string>("--config"),
                                  program.get<std::string>("--database"),
                                  cli_log_level);
    } catch (const std::exception& e) {
        return printError(ScriptRunner::toError(e));
    }
    set_log_level(config.logging.level);

    if (program.get<bool>("--completions")) {
        std::cout << CompletionCatalog::toJson().dump() << std::endl;
        return 0;
    }

    ScriptRunner runner(config);

    if (program.get<bool>("--test-connection")) {
        auto result = runner.testConnection();
        if (!result) {
            return printError(result.error());
        }
        CROW_LOG_INFO << "Connection to " << config.connection.name << " is working";
        return 0;
    }

    if (program.get<bool>("--browse")) {
        auto result = runner.browse();
        if (!result) {
            return printError(result.error());
        }
        std::cout << result.value().dump() << std::endl;
        return 0;
    }

    if (auto term = program.get<std::string>("--search-tables"); !term.empty()) {
        return printItems(runner.searchTables(term));
    }

    if (auto term = program.get<std::string>("--search-columns"); !term.empty()) {
        return printItems(runner.searchColumns(term));
    }

    std::string script;
    try {
        script = readScript(program.get<std::string>("--file"), program.get<std::string>("--execute"));
    } catch (const std::exception& e) {
        return printError(Error::Config(e.what()));
    }

    if (program.get<bool>("--dry-run")) {
        auto result = runner.dryRun(script);
        if (!result) {
            return printError(result.error());
        }
        std::vector<crow::json::wvalue> statements;
        for (const auto& statement : result.value()) {
            crow::json::wvalue entry;
            entry["kind"] = statementKindName(statement.kind);
            entry["statement"] = statement.text;
            statements.push_back(std::move(entry));
        }
        std::cout << crow::json::wvalue(statements).dump() << std::endl;
        return 0;
    }

    QueryOptions options;
    options.request_id = program.get<std::string>("--request-id");
    return printItems(runner.run(script, options));
}
