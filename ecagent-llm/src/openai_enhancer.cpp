#include "openai_enhancer.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace ecagent {
namespace llm {

namespace {

std::string format_number(double value) {
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

void append_practices(std::ostringstream& oss, const std::vector<ECPractice>& practices) {
    for (const auto& practice : practices) {
        oss << "- " << to_string(practice.practice_type) << ": " << format_number(practice.quantity)
            << " " << practice.unit << " (" << practice.justification << ")\n";
    }
}

} // anonymous namespace

OpenAIEnhancer::OpenAIEnhancer(const OpenAIConfig& config)
    : config_(config)
{
    auto client = std::make_shared<HttpClient>(config.endpoint, config.timeout_ms, config.max_attempts);
    client->set_debug(Logger::get_instance().get_min_level() == LogLevel::DEBUG);
    transport_ = std::move(client);
}

OpenAIEnhancer::OpenAIEnhancer(const OpenAIConfig& config, std::shared_ptr<HttpTransport> transport)
    : config_(config), transport_(std::move(transport))
{
    if (!transport_) {
        throw std::invalid_argument("OpenAIEnhancer requires an HTTP transport");
    }
}

std::string OpenAIEnhancer::system_prompt() {
    return "You are an expert civil engineer specializing in erosion control "
           "and sediment management for roadway construction projects.";
}

std::string OpenAIEnhancer::explanation_system_prompt() {
    return "You are an expert civil engineer specializing in erosion control.";
}

std::string OpenAIEnhancer::build_prompt(const ProjectInput& project, const ProjectOutput& output) {
    std::ostringstream oss;
    oss << "Review these erosion control recommendations for a roadway project:\n\n";
    oss << "Project: " << project.project_name << "\n";
    oss << "Jurisdiction: " << project.jurisdiction << "\n";
    oss << "Total Disturbed Acres: " << format_number(project.total_disturbed_acres) << "\n";
    oss << "Predominant Soil: " << to_string(project.predominant_soil) << "\n";
    oss << "Predominant Slope: " << to_string(project.predominant_slope) << "\n";
    oss << "Average Slope: " << format_number(project.average_slope_percent) << "%\n\n";

    oss << "Recommended Practices:\n";
    append_practices(oss, output.temporary_practices);
    append_practices(oss, output.permanent_practices);

    oss << "\nPlease provide:\n";
    oss << "1. Overall assessment of the recommended practices\n";
    oss << "2. Any additional practices or considerations that should be evaluated\n";
    oss << "3. Potential risks or challenges specific to this project\n";
    oss << "4. Recommendations for sequencing or phasing of practices\n\n";
    oss << "Keep your response concise and actionable (under 300 words).\n";
    return oss.str();
}

std::string OpenAIEnhancer::build_request_body(const OpenAIConfig& config,
                                               const ProjectInput& project,
                                               const ProjectOutput& output) {
    json request;
    request["model"] = config.model;
    request["messages"] = json::array({
        {{"role", "system"}, {"content", system_prompt()}},
        {{"role", "user"}, {"content", build_prompt(project, output)}}
    });
    request["temperature"] = config.temperature;
    return request.dump();
}

std::string OpenAIEnhancer::build_explanation_prompt(PracticeType practice_type,
                                                     const PracticeContext& context) {
    std::ostringstream oss;
    oss << "Explain the following erosion control practice in detail:\n";
    oss << "Practice: " << to_string(practice_type) << "\n";
    oss << "Project Context:";
    if (context.empty()) {
        oss << " none";
    }
    for (const auto& [key, value] : context) {
        oss << "\n- " << key << ": " << value;
    }
    oss << "\n\nProvide:\n";
    oss << "1. Purpose and function of this practice\n";
    oss << "2. Installation requirements\n";
    oss << "3. Maintenance considerations\n";
    oss << "4. Expected effectiveness\n";
    return oss.str();
}

std::string OpenAIEnhancer::build_explanation_request_body(const OpenAIConfig& config,
                                                           PracticeType practice_type,
                                                           const PracticeContext& context) {
    json request;
    request["model"] = config.model;
    request["messages"] = json::array({
        {{"role", "system"}, {"content", explanation_system_prompt()}},
        {{"role", "user"}, {"content", build_explanation_prompt(practice_type, context)}}
    });
    request["temperature"] = config.temperature;
    return request.dump();
}

std::optional<std::string> OpenAIEnhancer::parse_response(const std::string& body) {
    json response = json::parse(body);

    if (!response.contains("choices") || !response["choices"].is_array() ||
        response["choices"].empty()) {
        return std::nullopt;
    }

    const json& message = response["choices"][0].value("message", json::object());
    if (!message.contains("content") || !message["content"].is_string()) {
        return std::nullopt;
    }

    std::string content = message["content"].get<std::string>();
    if (content.empty()) {
        return std::nullopt;
    }
    return content;
}

std::optional<std::string> OpenAIEnhancer::enhance(const ProjectInput& project,
                                                   const ProjectOutput& output) {
    return complete(build_request_body(config_, project, output), "enhancement");
}

std::optional<std::string> OpenAIEnhancer::explain_practice(PracticeType practice_type,
                                                            const PracticeContext& context) {
    return complete(build_explanation_request_body(config_, practice_type, context), "explanation");
}

std::optional<std::string> OpenAIEnhancer::complete(const std::string& request_body,
                                                    const std::string& purpose) {
    Logger& logger = Logger::get_instance();

    if (config_.api_key.empty()) {
        logger.log_warning(RunContext(), "OpenAI " + purpose + " skipped: no API key configured");
        return std::nullopt;
    }

    try {
        std::map<std::string, std::string> headers;
        headers["Authorization"] = "Bearer " + config_.api_key;

        HttpResponse response = transport_->post("", request_body, headers);

        std::optional<std::string> content = parse_response(response.body);
        if (!content) {
            logger.log_warning(RunContext(), "OpenAI response contained no message content");
        }
        return content;

    } catch (const HttpClientError& e) {
        logger.log_warning(RunContext(), std::string("OpenAI request failed: ") + e.what());
    } catch (const json::exception& e) {
        logger.log_warning(RunContext(), std::string("OpenAI response was not valid JSON: ") + e.what());
    } catch (const std::exception& e) {
        logger.log_warning(RunContext(), "OpenAI " + purpose + " failed: " + e.what());
    }
    return std::nullopt;
}

} // namespace llm
} // namespace ecagent
