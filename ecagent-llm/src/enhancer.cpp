#include "enhancer.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace ecagent {
namespace llm {

PracticeContext practice_context(const ProjectInput& project) {
    auto format_number = [](double value) {
        std::ostringstream oss;
        oss << std::setprecision(15) << value;
        return oss.str();
    };

    PracticeContext context;
    context["project_name"] = project.project_name;
    context["jurisdiction"] = project.jurisdiction;
    context["total_disturbed_acres"] = format_number(project.total_disturbed_acres);
    context["predominant_soil"] = to_string(project.predominant_soil);
    context["predominant_slope"] = to_string(project.predominant_slope);
    context["average_slope_percent"] = format_number(project.average_slope_percent);
    context["drainage_feature_count"] = std::to_string(project.drainage_feature_count());
    return context;
}

std::optional<std::string> NoOpEnhancer::enhance(const ProjectInput& /* project */,
                                                 const ProjectOutput& /* output */) {
    return std::nullopt;
}

std::optional<std::string> NoOpEnhancer::explain_practice(PracticeType /* practice_type */,
                                                          const PracticeContext& /* context */) {
    return std::nullopt;
}

std::optional<std::string> MockEnhancer::enhance(const ProjectInput& project,
                                                 const ProjectOutput& /* output */) {
    std::ostringstream oss;
    oss << "Mock LLM Insights: The recommended practices appear appropriate for a "
        << std::setprecision(15) << project.total_disturbed_acres << "-acre project with "
        << to_string(project.predominant_slope) << " slopes. "
        << "Consider implementing practices in phases to minimize cost and maximize effectiveness.";
    return oss.str();
}

std::optional<std::string> MockEnhancer::explain_practice(PracticeType practice_type,
                                                          const PracticeContext& /* context */) {
    return "Mock explanation for " + to_string(practice_type) +
           ": This is a standard erosion control practice.";
}

EnhancedOutput enhance_output(Enhancer& enhancer, const ProjectInput& project,
                              const ProjectOutput& output, const RunContext& ctx) {
    auto start = std::chrono::steady_clock::now();

    EnhancedOutput result;
    result.output = output;
    result.provider = enhancer.name();
    result.insights = enhancer.enhance(project, result.output);

    auto end = std::chrono::steady_clock::now();
    double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

    if (result.provider != "none") {
        Logger::get_instance().log_enhancement(ctx, result.provider,
                                               result.insights.has_value(), elapsed_ms);
    }
    return result;
}

} // namespace llm
} // namespace ecagent
