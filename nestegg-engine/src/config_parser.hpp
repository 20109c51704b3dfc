#ifndef NESTEGG_CONFIG_PARSER_HPP
#define NESTEGG_CONFIG_PARSER_HPP

#include "comparison.hpp"
#include "logger.hpp"
#include <stdexcept>
#include <string>

namespace nestegg {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Output destination for comparison results
 */
struct OutputConfig {
    std::string path;               ///< Empty: write JSON to stdout
    std::string format;             ///< "json" or "parquet"
    bool pretty;                    ///< Indented JSON

    OutputConfig() : format("json"), pretty(true) {}
};

/**
 * @brief Engine run configuration
 *
 * Example:
 *   @code
 *   {
 *     "plan": "plans/smith.json",
 *     "logging": { "level": "DEBUG", "file": "${LOG_DIR}/nestegg.log", "json": true },
 *     "output": { "path": "out/smith.parquet", "format": "parquet" },
 *     "comparison": { "parallel": true, "stop_on_error": false, "detailed": true }
 *   }
 *   @endcode
 */
struct EngineConfig {
    std::string plan_path;
    LoggerConfig logging;
    OutputConfig output;
    ComparisonConfig comparison;
};

/**
 * @brief Parses an engine configuration from a JSON file
 *
 * Relative plan, output and log paths are resolved against the directory
 * containing the configuration file.
 *
 * @throws ConfigParseError if file cannot be read, JSON is invalid or a value is out of range
 */
EngineConfig parse_engine_config_from_file(const std::string& file_path);

/**
 * @brief Parses an engine configuration from a JSON string
 *
 * @throws ConfigParseError if JSON is invalid or a value is out of range
 */
EngineConfig parse_engine_config_from_string(const std::string& json_string);

/**
 * @brief Checks output format and paths
 *
 * @throws ConfigParseError on an unknown output format
 */
void validate_engine_config(const EngineConfig& config);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace nestegg

#endif // NESTEGG_CONFIG_PARSER_HPP
