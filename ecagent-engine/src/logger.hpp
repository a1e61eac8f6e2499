/**
 * @file logger.hpp
 * @brief Structured logging for the EC agent front end
 *
 * The Logger emits one line per event with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON or plain-text output to stderr and/or an append-mode file
 * - Run context (command, input file) on every event
 * - Masking of API keys before they reach any sink
 *
 * The rules engine itself never logs; the CLI and the LLM enhancers do.
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef ECAGENT_LOGGER_HPP
#define ECAGENT_LOGGER_HPP

#include "project.hpp"
#include "recommendation.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <string>

namespace ecagent {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-rule and per-request detail
    INFO,    ///< Rule set loaded, project processed, output written
    WARN,    ///< Non-fatal issues (LLM unavailable, fallback to mock)
    ERROR    ///< Failures that abort the command
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (case-insensitive), INFO when unrecognized
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Context attached to every event of one CLI run
 */
struct RunContext {
    std::string command;             ///< CLI command (process, validate, rules)
    std::string input_path;          ///< Project file being handled, if any

    RunContext() = default;

    RunContext(const std::string& cmd, const std::string& input)
        : command(cmd), input_path(input) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("ecagent.log"),
          enable_json(false) {}
};

/**
 * @brief Structured logger
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_json = true;
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   RunContext ctx("process", "project.json");
 *   logger.log_rules_loaded(ctx, repository.size(), repository.custom_rule_count(), "2024.1");
 *   logger.log_process_complete(ctx, output, elapsed_ms);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Reopens the log file when file output is enabled.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a custom rule file read from disk
     */
    void log_rule_file_loaded(const RunContext& ctx, const std::string& path, size_t rule_count);

    /**
     * @brief Log the merged, validated rule set
     *
     * @param total_rules Rules in the repository after merging
     * @param custom_rules Custom rules supplied by the user
     * @param catalogue_version Built-in catalogue version
     */
    void log_rules_loaded(
        const RunContext& ctx,
        size_t total_rules,
        size_t custom_rules,
        const std::string& catalogue_version
    );

    /**
     * @brief Log a project input that passed validation
     */
    void log_project_loaded(const RunContext& ctx, const ProjectInput& project);

    /**
     * @brief Log a finished engine run
     *
     * @param output Result of the run
     * @param elapsed_ms Wall-clock time spent in RulesEngine::process
     */
    void log_process_complete(const RunContext& ctx, const ProjectOutput& output, double elapsed_ms);

    /**
     * @brief Log the enhancer selected for this run
     *
     * @param provider Enhancer name (none, mock, openai)
     * @param model Model name, empty when not applicable
     * @param api_key API key (masked before output)
     */
    void log_llm_configured(
        const RunContext& ctx,
        const std::string& provider,
        const std::string& model,
        const std::string& api_key
    );

    /**
     * @brief Log the outcome of an enhancement attempt
     */
    void log_enhancement(
        const RunContext& ctx,
        const std::string& provider,
        bool available,
        double elapsed_ms
    );

    /**
     * @brief Log an output file written by the CLI
     */
    void log_output_written(const RunContext& ctx, const std::string& path, const std::string& format);

    /**
     * @brief Log error with context
     *
     * @param rule_id Offending rule, empty when the error is not rule-specific
     */
    void log_error(
        const RunContext& ctx,
        const std::string& error_message,
        const std::string& rule_id = ""
    );

    /**
     * @brief Log warning message
     */
    void log_warning(const RunContext& ctx, const std::string& warning_message);

    /**
     * @brief Log debug message with free-form fields
     */
    void log_debug(
        const RunContext& ctx,
        const std::string& message,
        const std::map<std::string, std::string>& fields = {}
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }

    LogLevel get_min_level() const { return config_.min_level; }

    /**
     * @brief Mask a secret for display: first 4 + "..." + last 4, "***" when short
     */
    static std::string mask_token(const std::string& token);

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::map<std::string, std::string> context_fields(const RunContext& ctx, const std::string& event) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace ecagent

#endif // ECAGENT_LOGGER_HPP
