#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ecagent {

namespace {

std::string get_expanded_string(const json& j, const std::string& key) {
    return expand_environment_variables(j.at(key).get<std::string>());
}

void parse_logging_section(const json& j, LoggingSettings& logging) {
    if (!j.is_object()) {
        throw ConfigParseError("Field 'logging' must be an object");
    }
    if (j.contains("level")) {
        logging.level = get_expanded_string(j, "level");
    }
    if (j.contains("file")) {
        logging.file = get_expanded_string(j, "file");
    }
    if (j.contains("json")) {
        logging.json = j["json"].get<bool>();
    }
}

void parse_llm_section(const json& j, LlmSettings& llm) {
    if (!j.is_object()) {
        throw ConfigParseError("Field 'llm' must be an object");
    }
    if (j.contains("enabled")) {
        llm.enabled = j["enabled"].get<bool>();
    }
    if (j.contains("model")) {
        llm.model = get_expanded_string(j, "model");
    }
    if (j.contains("endpoint")) {
        llm.endpoint = get_expanded_string(j, "endpoint");
    }
    if (j.contains("api_key")) {
        llm.api_key = get_expanded_string(j, "api_key");
    }
    if (j.contains("timeout_ms")) {
        long timeout = j["timeout_ms"].get<long>();
        if (timeout <= 0) {
            throw ConfigParseError("Field 'llm.timeout_ms' must be positive");
        }
        llm.timeout_ms = timeout;
    }
}

} // anonymous namespace

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

        // Extract variable name
        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (var_name.empty()) {
            // Lone '$' is literal
            pos = start + 1;
            continue;
        }

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                pos = start + 1;
                continue;
            }
            pos++; // Skip '}'
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

    if (path.empty() || p.is_absolute()) {
        return path;
    }

    // Resolve relative to config directory
    fs::path config_dir = fs::path(config_file_path).parent_path();
    fs::path resolved = config_dir / p;
    return resolved.string();
}

AgentConfig parse_agent_config_from_string(const std::string& json_string) {
    AgentConfig config;

    try {
        json j = json::parse(json_string);

        if (!j.is_object()) {
            throw ConfigParseError("Agent config must be a JSON object");
        }

        if (j.contains("rules_file")) {
            config.rules_file = get_expanded_string(j, "rules_file");
        }
        if (j.contains("output")) {
            config.output = get_expanded_string(j, "output");
        }
        if (j.contains("logging")) {
            parse_logging_section(j["logging"], config.logging);
        }
        if (j.contains("llm")) {
            parse_llm_section(j["llm"], config.llm);
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON range error: ") + e.what());
    }

    return config;
}

AgentConfig parse_agent_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    AgentConfig config = parse_agent_config_from_string(buffer.str());

    // Resolve relative paths
    config.rules_file = resolve_relative_path(config.rules_file, file_path);
    config.output = resolve_relative_path(config.output, file_path);
    config.logging.file = resolve_relative_path(config.logging.file, file_path);

    return config;
}

} // namespace ecagent
