#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace sqlscript {

constexpr std::int64_t DEFAULT_MAX_QUERY_RESULTS = 100000;

struct ConnectionConfig {
    std::string name = "default";
    std::string database = ":memory:";
    bool create_if_missing = true;
    bool read_only = false;
    std::string init;
    std::map<std::string, std::string> settings;

    bool isInMemory() const { return database.empty() || database == ":memory:"; }
};

struct ExecutionConfig {
    // Queries counting more rows than this are refused instead of materialized.
    std::int64_t max_query_results = DEFAULT_MAX_QUERY_RESULTS;
    bool log_queries = false;
};

struct LoggingConfig {
    std::string level = "info";
};

struct DriverConfig {
    ConnectionConfig connection;
    ExecutionConfig execution;
    LoggingConfig logging;

    static DriverConfig defaults() { return DriverConfig{}; }
};

class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(const std::string& message, const std::string& yamlPath = "")
        : std::runtime_error(formatMessage(message, yamlPath)) {}

private:
    static std::string formatMessage(const std::string& message, const std::string& yamlPath) {
        std::ostringstream oss;
        oss << "Configuration error";
        if (!yamlPath.empty()) {
            oss << " at " << yamlPath;
        }
        oss << ": " << message;
        return oss.str();
    }
};

/**
 * Loads the driver configuration (sqlscript.yaml).
 *
 * Relative database paths are resolved against the directory that contains
 * the configuration file.
 */
class ConfigManager {
public:
    explicit ConfigManager(const std::filesystem::path& config_file);

    /**
     * Load and validate the configuration file.
     * @throws ConfigurationError if the file is missing, malformed or invalid
     */
    void loadConfig();

    /**
     * Parse configuration from an in-memory YAML document.
     * @param base_path Directory used to resolve relative paths
     */
    static DriverConfig parseConfig(const YAML::Node& root, const std::filesystem::path& base_path);

    const DriverConfig& getConfig() const { return config_; }
    const std::filesystem::path& getConfigFile() const { return config_file_; }

    void setDatabase(const std::string& database);
    void setLogLevel(const std::string& level);

private:
    static ConnectionConfig parseConnection(const YAML::Node& node, const std::filesystem::path& base_path);
    static ExecutionConfig parseExecution(const YAML::Node& node);
    static LoggingConfig parseLogging(const YAML::Node& node);

    template<typename T>
    static T safeGet(const YAML::Node& node, const std::string& key, const std::string& path, const T& defaultValue);

    template<typename T>
    static T safeGet(const YAML::Node& node, const std::string& key, const std::string& path);

    std::filesystem::path config_file_;
    DriverConfig config_;
};

bool isValidLogLevel(const std::string& level);

} // namespace sqlscript
