#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace nestegg {

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++; // Skip '}'
        }

        // A lone '$' is kept as is
        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    fs::path resolved = config_dir / p;
    return resolved.string();
}

void validate_engine_config(const EngineConfig& config) {
    if (config.output.format != "json" && config.output.format != "parquet") {
        throw ConfigParseError("Invalid output.format: '" + config.output.format +
                               "' (expected json or parquet)");
    }
    if (config.logging.enable_file && config.logging.log_file_path.empty()) {
        throw ConfigParseError("logging.file must not be empty");
    }
}

EngineConfig parse_engine_config_from_string(const std::string& json_string) {
    EngineConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Engine config must be a JSON object");
        }

        if (j.contains("plan")) {
            config.plan_path = expand_environment_variables(j["plan"].get<std::string>());
        }

        // Parse logging (optional)
        if (j.contains("logging")) {
            const json& logging = j["logging"];
            if (logging.contains("level")) {
                try {
                    config.logging.min_level = string_to_level(logging["level"].get<std::string>());
                } catch (const std::invalid_argument& e) {
                    throw ConfigParseError(std::string("Invalid logging.level: ") + e.what());
                }
            }
            if (logging.contains("file")) {
                config.logging.enable_file = true;
                config.logging.log_file_path = expand_environment_variables(
                    logging["file"].get<std::string>()
                );
            }
            if (logging.contains("json")) {
                config.logging.enable_json = logging["json"].get<bool>();
            }
            if (logging.contains("console")) {
                config.logging.enable_console = logging["console"].get<bool>();
            }
        }

        // Parse output (optional)
        if (j.contains("output")) {
            const json& output = j["output"];
            if (output.contains("path")) {
                config.output.path = expand_environment_variables(output["path"].get<std::string>());
            }
            if (output.contains("format")) {
                config.output.format = output["format"].get<std::string>();
            }
            if (output.contains("pretty")) {
                config.output.pretty = output["pretty"].get<bool>();
            }
        }

        // Parse comparison (optional)
        if (j.contains("comparison")) {
            const json& comparison = j["comparison"];
            if (comparison.contains("parallel")) {
                config.comparison.parallel = comparison["parallel"].get<bool>();
            }
            if (comparison.contains("stop_on_error")) {
                config.comparison.stop_on_error = comparison["stop_on_error"].get<bool>();
            }
            if (comparison.contains("detailed")) {
                config.comparison.detailed = comparison["detailed"].get<bool>();
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    validate_engine_config(config);

    return config;
}

EngineConfig parse_engine_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    EngineConfig config = parse_engine_config_from_string(buffer.str());

    // Resolve relative paths
    if (!config.plan_path.empty()) {
        config.plan_path = resolve_relative_path(config.plan_path, file_path);
    }
    if (!config.output.path.empty()) {
        config.output.path = resolve_relative_path(config.output.path, file_path);
    }
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace nestegg
