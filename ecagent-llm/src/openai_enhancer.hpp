#ifndef ECAGENT_OPENAI_ENHANCER_HPP
#define ECAGENT_OPENAI_ENHANCER_HPP

#include "api/http_client.hpp"
#include "enhancer.hpp"
#include <memory>
#include <optional>
#include <string>

namespace ecagent {
namespace llm {

/**
 * @brief Settings for the OpenAI-compatible chat-completions endpoint
 */
struct OpenAIConfig {
    std::string endpoint;        ///< Full chat-completions URL
    std::string model;           ///< Chat model name
    std::string api_key;         ///< Bearer token; empty means unavailable
    long timeout_ms;             ///< Caller-imposed request timeout
    double temperature;          ///< Low for repeatable answers
    int max_attempts;            ///< HTTP attempts, retries only on 408/429/5xx

    OpenAIConfig()
        : endpoint("https://api.openai.com/v1/chat/completions"),
          model("gpt-4"),
          timeout_ms(30000),
          temperature(0.3),
          max_attempts(1) {}
};

/**
 * @brief Enhancer backed by an OpenAI-compatible chat-completions API
 *
 * Network errors, non-2xx responses, a missing API key and malformed response
 * JSON are all logged as warnings and reported as unavailable, for both
 * project insights and practice explanations.
 */
class OpenAIEnhancer : public Enhancer {
public:
    // Uses a libcurl HttpClient pointed at config.endpoint, with request
    // logging on when the logger is at DEBUG
    explicit OpenAIEnhancer(const OpenAIConfig& config);

    // Injected transport, posted to with an empty path
    OpenAIEnhancer(const OpenAIConfig& config, std::shared_ptr<HttpTransport> transport);

    std::optional<std::string> enhance(const ProjectInput& project,
                                       const ProjectOutput& output) override;

    std::optional<std::string> explain_practice(PracticeType practice_type,
                                                const PracticeContext& context) override;

    std::string name() const override { return "openai"; }

    const OpenAIConfig& config() const { return config_; }

    static std::string system_prompt();

    static std::string explanation_system_prompt();

    // Project facts and the recommended practices
    static std::string build_prompt(const ProjectInput& project, const ProjectOutput& output);

    // Purpose, installation, maintenance and effectiveness of one practice
    static std::string build_explanation_prompt(PracticeType practice_type,
                                                const PracticeContext& context);

    // Chat-completions request JSON
    static std::string build_request_body(const OpenAIConfig& config,
                                          const ProjectInput& project,
                                          const ProjectOutput& output);

    static std::string build_explanation_request_body(const OpenAIConfig& config,
                                                      PracticeType practice_type,
                                                      const PracticeContext& context);

    /**
     * @brief Extract choices[0].message.content
     * @return The content, or std::nullopt when absent or empty
     * @throws nlohmann::json::exception on malformed JSON
     */
    static std::optional<std::string> parse_response(const std::string& body);

private:
    OpenAIConfig config_;
    std::shared_ptr<HttpTransport> transport_;

    // Post a request body and extract the reply; every failure is logged and absorbed
    std::optional<std::string> complete(const std::string& request_body, const std::string& purpose);
};

} // namespace llm
} // namespace ecagent

#endif // ECAGENT_OPENAI_ENHANCER_HPP
