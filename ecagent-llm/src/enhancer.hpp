/**
 * @file enhancer.hpp
 * @brief Optional LLM enhancement of a finished engine result
 *
 * An Enhancer receives the project and the deterministic ProjectOutput and may
 * return supplementary insight text. It never changes the base result, and a
 * failure is reported as "unavailable" (std::nullopt), never as an exception.
 */

#ifndef ECAGENT_ENHANCER_HPP
#define ECAGENT_ENHANCER_HPP

#include "logger.hpp"
#include "project.hpp"
#include "recommendation.hpp"
#include <map>
#include <optional>
#include <string>

namespace ecagent {
namespace llm {

// Project facts handed to explain_practice, keyed by field name
using PracticeContext = std::map<std::string, std::string>;

/**
 * @brief Key facts of a project as explanation context
 */
PracticeContext practice_context(const ProjectInput& project);

/**
 * @brief Interface for insight providers
 */
class Enhancer {
public:
    virtual ~Enhancer() = default;

    /**
     * @brief Produce insight text for a processed project
     * @return Insight text, or std::nullopt when unavailable
     */
    virtual std::optional<std::string> enhance(const ProjectInput& project,
                                               const ProjectOutput& output) = 0;

    /**
     * @brief Describe one practice: purpose, installation, maintenance, effectiveness
     * @return Explanation text, or std::nullopt when unavailable
     */
    virtual std::optional<std::string> explain_practice(PracticeType practice_type,
                                                        const PracticeContext& context) = 0;

    /**
     * @brief Provider name used in logs ("none", "mock", "openai")
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Default binding: insights are always unavailable
 */
class NoOpEnhancer : public Enhancer {
public:
    std::optional<std::string> enhance(const ProjectInput& project,
                                       const ProjectOutput& output) override;

    std::optional<std::string> explain_practice(PracticeType practice_type,
                                                const PracticeContext& context) override;

    std::string name() const override { return "none"; }
};

/**
 * @brief Deterministic canned insights, used when no API key is configured
 */
class MockEnhancer : public Enhancer {
public:
    std::optional<std::string> enhance(const ProjectInput& project,
                                       const ProjectOutput& output) override;

    std::optional<std::string> explain_practice(PracticeType practice_type,
                                                const PracticeContext& context) override;

    std::string name() const override { return "mock"; }
};

/**
 * @brief Base result plus optional insights
 */
struct EnhancedOutput {
    ProjectOutput output;                ///< Unchanged copy of the engine result
    std::optional<std::string> insights; ///< Present when the enhancer produced text
    std::string provider;                ///< Enhancer that was asked
};

/**
 * @brief Ask an enhancer for insights and log the outcome
 *
 * The base output is copied as-is regardless of what the enhancer does.
 */
EnhancedOutput enhance_output(Enhancer& enhancer, const ProjectInput& project,
                              const ProjectOutput& output, const RunContext& ctx = RunContext());

} // namespace llm
} // namespace ecagent

#endif // ECAGENT_ENHANCER_HPP
