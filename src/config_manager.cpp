#include "config_manager.hpp"

#include <crow/logging.h>

namespace sqlscript {

bool isValidLogLevel(const std::string& level) {
    return level == "debug" || level == "info" || level == "warning" || level == "error";
}

ConfigManager::ConfigManager(const std::filesystem::path& config_file)
    : config_file_(std::filesystem::absolute(config_file)), config_(DriverConfig::defaults())
{}

void ConfigManager::loadConfig() {
    CROW_LOG_INFO << "Loading configuration file: " << config_file_.string();

    if (!std::filesystem::exists(config_file_)) {
        throw ConfigurationError("Configuration file not found: " + config_file_.string());
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_file_.string());
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to parse YAML file '" + config_file_.string() + "': " + e.what());
    }

    config_ = parseConfig(root, config_file_.parent_path());
    CROW_LOG_INFO << "Configuration loaded successfully";
}

DriverConfig ConfigManager::parseConfig(const YAML::Node& root, const std::filesystem::path& base_path) {
    if (!root || !root.IsMap()) {
        throw ConfigurationError("Configuration root must be a mapping");
    }

    DriverConfig config;
    config.connection = parseConnection(root["connection"], base_path);
    config.execution = parseExecution(root["execution"]);
    config.logging = parseLogging(root["logging"]);
    return config;
}

ConnectionConfig ConfigManager::parseConnection(const YAML::Node& node, const std::filesystem::path& base_path) {
    if (!node) {
        throw ConfigurationError("Missing required section", "connection");
    }

    ConnectionConfig connection;
    connection.name = safeGet<std::string>(node, "name", "connection.name");
    connection.database = safeGet<std::string>(node, "database", "connection.database", std::string(":memory:"));
    connection.create_if_missing = safeGet<bool>(node, "create-if-missing", "connection.create-if-missing", true);
    connection.read_only = safeGet<bool>(node, "read-only", "connection.read-only", false);
    connection.init = safeGet<std::string>(node, "init", "connection.init", std::string());

    if (!connection.isInMemory()) {
        std::filesystem::path db_path(connection.database);
        if (db_path.is_relative()) {
            connection.database = (base_path / db_path).lexically_normal().string();
        }
    }

    if (connection.read_only && connection.isInMemory()) {
        throw ConfigurationError("An in-memory database cannot be opened read-only", "connection.read-only");
    }

    if (node["settings"]) {
        if (!node["settings"].IsMap()) {
            throw ConfigurationError("Expected a mapping of DuckDB options", "connection.settings");
        }
        for (const auto& setting : node["settings"]) {
            std::string key = setting.first.as<std::string>();
            std::string value = setting.second.as<std::string>();
            connection.settings[key] = value;
            CROW_LOG_DEBUG << "\tDuckDB Setting: " << key << " = " << value;
        }
    }

    CROW_LOG_DEBUG << "Connection: " << connection.name << " -> " << connection.database;
    return connection;
}

ExecutionConfig ConfigManager::parseExecution(const YAML::Node& node) {
    ExecutionConfig execution;
    if (!node) {
        return execution;
    }

    execution.max_query_results = safeGet<std::int64_t>(node, "max-query-results", "execution.max-query-results",
                                                        DEFAULT_MAX_QUERY_RESULTS);
    if (execution.max_query_results <= 0) {
        throw ConfigurationError("Must be a positive number", "execution.max-query-results");
    }
    execution.log_queries = safeGet<bool>(node, "log-queries", "execution.log-queries", false);
    return execution;
}

LoggingConfig ConfigManager::parseLogging(const YAML::Node& node) {
    LoggingConfig logging;
    if (!node) {
        return logging;
    }

    logging.level = safeGet<std::string>(node, "level", "logging.level", std::string("info"));
    if (!isValidLogLevel(logging.level)) {
        throw ConfigurationError("Invalid log level: " + logging.level, "logging.level");
    }
    return logging;
}

void ConfigManager::setDatabase(const std::string& database) {
    config_.connection.database = database;
}

void ConfigManager::setLogLevel(const std::string& level) {
    if (!isValidLogLevel(level)) {
        throw ConfigurationError("Invalid log level: " + level, "logging.level");
    }
    config_.logging.level = level;
}

template<typename T>
T ConfigManager::safeGet(const YAML::Node& node, const std::string& key, const std::string& path, const T& defaultValue) {
    if (!node[key]) {
        return defaultValue;
    }
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid value for key: " + key + ", Error: " + e.what(), path);
    }
}

template<typename T>
T ConfigManager::safeGet(const YAML::Node& node, const std::string& key, const std::string& path) {
    if (!node[key]) {
        throw ConfigurationError("Missing required key: " + key, path);
    }
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid value for key: " + key + ", Error: " + e.what(), path);
    }
}

} // namespace sqlscript
