/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ecagent {

namespace {

std::string format_number(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

} // anonymous namespace

LogLevel string_to_level(const std::string& level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Default configuration
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;
    file_stream_.reset();

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

std::map<std::string, std::string> Logger::context_fields(
    const RunContext& ctx,
    const std::string& event
) const {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    if (!ctx.command.empty()) {
        fields["command"] = ctx.command;
    }
    if (!ctx.input_path.empty()) {
        fields["input"] = ctx.input_path;
    }
    return fields;
}

void Logger::log_rule_file_loaded(const RunContext& ctx, const std::string& path, size_t rule_count) {
    auto fields = context_fields(ctx, "rule_file_loaded");
    fields["rules_file"] = path;
    fields["rule_count"] = std::to_string(rule_count);

    log(LogLevel::INFO, "Loaded custom rule file", fields);
}

void Logger::log_rules_loaded(
    const RunContext& ctx,
    size_t total_rules,
    size_t custom_rules,
    const std::string& catalogue_version
) {
    auto fields = context_fields(ctx, "rules_loaded");
    fields["rule_count"] = std::to_string(total_rules);
    fields["custom_rule_count"] = std::to_string(custom_rules);
    fields["catalogue_version"] = catalogue_version;

    log(LogLevel::INFO, "Rule set ready", fields);
}

void Logger::log_project_loaded(const RunContext& ctx, const ProjectInput& project) {
    auto fields = context_fields(ctx, "project_loaded");
    fields["project_name"] = project.project_name;
    fields["jurisdiction"] = project.jurisdiction;
    fields["total_disturbed_acres"] = format_number(project.total_disturbed_acres, 2);
    fields["predominant_soil"] = to_string(project.predominant_soil);
    fields["predominant_slope"] = to_string(project.predominant_slope);
    fields["drainage_feature_count"] = std::to_string(project.drainage_feature_count());
    fields["phase_count"] = std::to_string(project.phase_count());

    log(LogLevel::INFO, "Project loaded", fields);
}

void Logger::log_process_complete(const RunContext& ctx, const ProjectOutput& output, double elapsed_ms) {
    auto fields = context_fields(ctx, "process_complete");
    fields["project_name"] = output.project_name;
    fields["temporary_practices"] = std::to_string(output.summary.total_temporary_practices);
    fields["permanent_practices"] = std::to_string(output.summary.total_permanent_practices);
    fields["pay_items"] = std::to_string(output.summary.total_pay_items);
    fields["total_estimated_cost"] = format_number(output.summary.total_estimated_cost, 2);
    fields["elapsed_ms"] = format_number(elapsed_ms, 3);

    log(LogLevel::INFO, "Project processed", fields);
}

void Logger::log_llm_configured(
    const RunContext& ctx,
    const std::string& provider,
    const std::string& model,
    const std::string& api_key
) {
    auto fields = context_fields(ctx, "llm_configured");
    fields["provider"] = provider;
    if (!model.empty()) {
        fields["model"] = model;
    }
    fields["api_key"] = api_key.empty() ? "none" : mask_token(api_key);

    log(LogLevel::DEBUG, "LLM enhancer configured", fields);
}

void Logger::log_enhancement(
    const RunContext& ctx,
    const std::string& provider,
    bool available,
    double elapsed_ms
) {
    auto fields = context_fields(ctx, "enhancement");
    fields["provider"] = provider;
    fields["available"] = available ? "true" : "false";
    fields["elapsed_ms"] = format_number(elapsed_ms, 3);

    log(available ? LogLevel::INFO : LogLevel::WARN,
        available ? "LLM insights added" : "LLM insights unavailable", fields);
}

void Logger::log_output_written(const RunContext& ctx, const std::string& path, const std::string& format) {
    auto fields = context_fields(ctx, "output_written");
    fields["output"] = path;
    fields["format"] = format;

    log(LogLevel::INFO, "Output written", fields);
}

void Logger::log_error(
    const RunContext& ctx,
    const std::string& error_message,
    const std::string& rule_id
) {
    auto fields = context_fields(ctx, "error");
    fields["error_message"] = error_message;

    if (!rule_id.empty()) {
        fields["rule_id"] = rule_id;
    }

    log(LogLevel::ERROR, "Command failed", fields);
}

void Logger::log_warning(const RunContext& ctx, const std::string& warning_message) {
    auto fields = context_fields(ctx, "warning");
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_debug(
    const RunContext& ctx,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    auto all_fields = context_fields(ctx, "debug");
    for (const auto& [key, value] : fields) {
        all_fields[key] = value;
    }

    log(LogLevel::DEBUG, message, all_fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::mask_token(const std::string& token) {
    if (token.size() <= 8) {
        return "***";
    }
    // Show first 4 and last 4 characters
    return token.substr(0, 4) + "..." + token.substr(token.size() - 4);
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace ecagent
