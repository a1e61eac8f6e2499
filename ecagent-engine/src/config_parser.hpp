#ifndef ECAGENT_CONFIG_PARSER_HPP
#define ECAGENT_CONFIG_PARSER_HPP

#include "errors.hpp"
#include <optional>
#include <string>

namespace ecagent {

/**
 * @brief Logging section of the agent configuration
 */
struct LoggingSettings {
    std::string level;                   ///< DEBUG, INFO, WARN, ERROR (empty = default)
    std::string file;                    ///< Append-mode log file (empty = stderr only)
    std::optional<bool> json;            ///< JSON lines instead of plain text
};

/**
 * @brief LLM section of the agent configuration
 */
struct LlmSettings {
    std::optional<bool> enabled;         ///< Request LLM insights
    std::string model;                   ///< Chat model name
    std::string endpoint;                ///< Chat-completions URL
    std::string api_key;                 ///< Usually "${OPENAI_API_KEY}"
    std::optional<long> timeout_ms;      ///< Per-request timeout
};

/**
 * @brief Agent configuration file contents
 *
 * Every field is optional; command-line flags take precedence over the file.
 */
struct AgentConfig {
    std::string rules_file;              ///< Custom rule file (resolved against the config dir)
    std::string output;                  ///< Default output path (resolved against the config dir)
    LoggingSettings logging;
    LlmSettings llm;
};

/**
 * @brief Parses an agent configuration from a JSON file
 *
 * Relative rules_file, output and logging.file paths are resolved against the
 * directory containing the config file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed configuration
 * @throws ConfigParseError if the file cannot be read or the JSON is invalid
 */
AgentConfig parse_agent_config_from_file(const std::string& file_path);

/**
 * @brief Parses an agent configuration from a JSON string
 *
 * @throws ConfigParseError if the JSON is invalid or a field has the wrong type
 */
AgentConfig parse_agent_config_from_string(const std::string& json_string);

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

} // namespace ecagent

#endif // ECAGENT_CONFIG_PARSER_HPP
