#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/openai_enhancer.hpp"
#include "logger.hpp"
#include "rules_engine.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace ecagent;
using namespace ecagent::llm;
using Catch::Matchers::ContainsSubstring;
using json = nlohmann::json;

namespace {

// Records the last request and answers with a canned body or error
class FakeTransport : public HttpTransport {
public:
    HttpResponse post(const std::string& path,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers) override {
        ++calls;
        last_path = path;
        last_body = body;
        last_headers = headers;
        if (fail_status >= 0) {
            throw HttpClientError("HTTP 503: upstream unavailable", fail_status);
        }
        HttpResponse response;
        response.status_code = 200;
        response.body = response_body;
        return response;
    }

    int calls = 0;
    int fail_status = -1;
    std::string response_body;
    std::string last_path;
    std::string last_body;
    std::map<std::string, std::string> last_headers;
};

ProjectInput sample_project() {
    ProjectInput project;
    project.project_name = "Riverside Drive Extension";
    project.jurisdiction = "Lane County";
    project.total_disturbed_acres = 5.2;
    project.predominant_soil = SoilType::Clay;
    project.predominant_slope = SlopeType::Moderate;
    project.average_slope_percent = 18.0;
    return project;
}

std::string chat_response(const std::string& content) {
    json response;
    response["id"] = "chatcmpl-1";
    response["choices"] = json::array({
        {{"index", 0}, {"message", {{"role", "assistant"}, {"content", content}}}}
    });
    return response.dump();
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

OpenAIConfig test_config() {
    OpenAIConfig config;
    config.api_key = "sk-test-key-1234567890";
    config.model = "gpt-4o-mini";
    return config;
}

} // anonymous namespace

TEST_CASE("OpenAI config defaults", "[openai]") {
    OpenAIConfig config;
    REQUIRE(config.endpoint == "https://api.openai.com/v1/chat/completions");
    REQUIRE(config.model == "gpt-4");
    REQUIRE(config.api_key.empty());
    REQUIRE(config.timeout_ms == 30000);
    REQUIRE(config.temperature == 0.3);
    REQUIRE(config.max_attempts == 1);
}

TEST_CASE("OpenAI prompt", "[openai]") {
    ProjectInput project = sample_project();
    ProjectOutput output = RulesEngine().process(project, "2024-03-15T10:30:00.000");

    std::string prompt = OpenAIEnhancer::build_prompt(project, output);

    REQUIRE_THAT(prompt, ContainsSubstring("Project: Riverside Drive Extension"));
    REQUIRE_THAT(prompt, ContainsSubstring("Total Disturbed Acres: 5.2"));
    REQUIRE_THAT(prompt, ContainsSubstring("Predominant Soil: clay"));
    REQUIRE_THAT(prompt, ContainsSubstring("Average Slope: 18%"));
    REQUIRE_THAT(prompt, ContainsSubstring("- silt_fence: 1040 LF"));
    REQUIRE_THAT(prompt, ContainsSubstring("- permanent_seeding: 5.2 AC"));
    REQUIRE_THAT(prompt, ContainsSubstring("under 300 words"));
}

TEST_CASE("OpenAI request body", "[openai]") {
    ProjectInput project = sample_project();
    ProjectOutput output = RulesEngine().process(project, "2024-03-15T10:30:00.000");

    json body = json::parse(OpenAIEnhancer::build_request_body(test_config(), project, output));

    REQUIRE(body["model"] == "gpt-4o-mini");
    REQUIRE(body["temperature"].get<double>() == 0.3);
    REQUIRE(body["messages"].size() == 2);
    REQUIRE(body["messages"][0]["role"] == "system");
    REQUIRE(body["messages"][0]["content"] == OpenAIEnhancer::system_prompt());
    REQUIRE(body["messages"][1]["role"] == "user");
    REQUIRE(body["messages"][1]["content"] == OpenAIEnhancer::build_prompt(project, output));
    REQUIRE(body.dump().find("sk-test-key") == std::string::npos);
}

TEST_CASE("OpenAI response parsing", "[openai]") {
    SECTION("Message content") {
        REQUIRE(OpenAIEnhancer::parse_response(chat_response("Looks reasonable.")).value() == "Looks reasonable.");
    }

    SECTION("Empty content") {
        REQUIRE_FALSE(OpenAIEnhancer::parse_response(chat_response("")).has_value());
    }

    SECTION("No choices") {
        REQUIRE_FALSE(OpenAIEnhancer::parse_response(R"({"choices": []})").has_value());
        REQUIRE_FALSE(OpenAIEnhancer::parse_response(R"({"error": {"message": "quota"}})").has_value());
    }

    SECTION("Content of the wrong type") {
        REQUIRE_FALSE(OpenAIEnhancer::parse_response(R"({"choices": [{"message": {"content": 7}}]})").has_value());
    }

    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(OpenAIEnhancer::parse_response("<html>502</html>"), json::exception);
    }
}

TEST_CASE("OpenAI enhancer requests", "[openai]") {
    ProjectInput project = sample_project();
    ProjectOutput output = RulesEngine().process(project, "2024-03-15T10:30:00.000");
    auto transport = std::make_shared<FakeTransport>();

    SECTION("Successful completion") {
        transport->response_body = chat_response("Install inlet protection before paving.");
        OpenAIEnhancer enhancer(test_config(), transport);

        auto insights = enhancer.enhance(project, output);

        REQUIRE(enhancer.name() == "openai");
        REQUIRE(insights.value() == "Install inlet protection before paving.");
        REQUIRE(transport->calls == 1);
        REQUIRE(transport->last_path.empty());
        REQUIRE(transport->last_headers.at("Authorization") == "Bearer sk-test-key-1234567890");
        REQUIRE(json::parse(transport->last_body)["model"] == "gpt-4o-mini");
    }

    SECTION("Missing key skips the request") {
        OpenAIConfig config = test_config();
        config.api_key.clear();
        OpenAIEnhancer enhancer(config, transport);

        REQUIRE_FALSE(enhancer.enhance(project, output).has_value());
        REQUIRE(transport->calls == 0);
    }

    SECTION("Transport failure is unavailable") {
        transport->fail_status = 503;
        OpenAIEnhancer enhancer(test_config(), transport);

        REQUIRE_FALSE(enhancer.enhance(project, output).has_value());
        REQUIRE(transport->calls == 1);
    }

    SECTION("Malformed response is unavailable") {
        transport->response_body = "not json";
        OpenAIEnhancer enhancer(test_config(), transport);

        REQUIRE_FALSE(enhancer.enhance(project, output).has_value());
    }

    SECTION("Null transport is rejected") {
        REQUIRE_THROWS_AS(OpenAIEnhancer(test_config(), nullptr), std::invalid_argument);
    }
}

TEST_CASE("OpenAI explanation prompt", "[openai]") {
    PracticeContext context = {{"predominant_soil", "silt"}, {"total_disturbed_acres", "12.5"}};

    std::string prompt = OpenAIEnhancer::build_explanation_prompt(PracticeType::InletProtection, context);

    REQUIRE_THAT(prompt, ContainsSubstring("Practice: inlet_protection"));
    REQUIRE_THAT(prompt, ContainsSubstring("- predominant_soil: silt"));
    REQUIRE_THAT(prompt, ContainsSubstring("- total_disturbed_acres: 12.5"));
    REQUIRE_THAT(prompt, ContainsSubstring("1. Purpose and function of this practice"));
    REQUIRE_THAT(prompt, ContainsSubstring("2. Installation requirements"));
    REQUIRE_THAT(prompt, ContainsSubstring("3. Maintenance considerations"));
    REQUIRE_THAT(prompt, ContainsSubstring("4. Expected effectiveness"));

    SECTION("Empty context") {
        REQUIRE_THAT(OpenAIEnhancer::build_explanation_prompt(PracticeType::Mulch, {}),
                     ContainsSubstring("Project Context: none"));
    }

    SECTION("Request body") {
        json body = json::parse(OpenAIEnhancer::build_explanation_request_body(
            test_config(), PracticeType::InletProtection, context));
        REQUIRE(body["model"] == "gpt-4o-mini");
        REQUIRE(body["temperature"].get<double>() == 0.3);
        REQUIRE(body["messages"][0]["content"] == OpenAIEnhancer::explanation_system_prompt());
        REQUIRE(body["messages"][1]["content"] == prompt);
    }
}

TEST_CASE("OpenAI practice explanation requests", "[openai]") {
    auto transport = std::make_shared<FakeTransport>();
    PracticeContext context = {{"predominant_slope", "steep"}};

    SECTION("Successful completion") {
        transport->response_body = chat_response("Silt fence intercepts sheet flow.");
        OpenAIEnhancer enhancer(test_config(), transport);

        auto explanation = enhancer.explain_practice(PracticeType::SiltFence, context);

        REQUIRE(explanation.value() == "Silt fence intercepts sheet flow.");
        REQUIRE(transport->calls == 1);
        REQUIRE(transport->last_headers.at("Authorization") == "Bearer sk-test-key-1234567890");
        json body = json::parse(transport->last_body);
        REQUIRE_THAT(body["messages"][1]["content"].get<std::string>(),
                     ContainsSubstring("Practice: silt_fence"));
    }

    SECTION("Missing key skips the request") {
        OpenAIConfig config = test_config();
        config.api_key.clear();
        OpenAIEnhancer enhancer(config, transport);

        REQUIRE_FALSE(enhancer.explain_practice(PracticeType::SiltFence, context).has_value());
        REQUIRE(transport->calls == 0);
    }

    SECTION("Transport failure is unavailable") {
        transport->fail_status = 429;
        OpenAIEnhancer enhancer(test_config(), transport);

        REQUIRE_FALSE(enhancer.explain_practice(PracticeType::SiltFence, context).has_value());
    }

    SECTION("Empty reply is unavailable") {
        transport->response_body = chat_response("");
        OpenAIEnhancer enhancer(test_config(), transport);

        REQUIRE_FALSE(enhancer.explain_practice(PracticeType::SiltFence, context).has_value());
    }

    SECTION("Malformed response is unavailable") {
        transport->response_body = "{\"choices\": [";
        OpenAIEnhancer enhancer(test_config(), transport);

        REQUIRE_FALSE(enhancer.explain_practice(PracticeType::SiltFence, context).has_value());
    }
}

TEST_CASE("OpenAI request logging follows the logger level", "[openai]") {
    const std::string path = "test_openai_debug.log";
    std::remove(path.c_str());

    LoggerConfig logging;
    logging.min_level = LogLevel::DEBUG;
    logging.enable_console = false;
    logging.enable_file = true;
    logging.log_file_path = path;
    Logger::get_instance().configure(logging);

    // Nothing listens on port 1, so the request fails after it is logged
    OpenAIConfig config = test_config();
    config.endpoint = "http://127.0.0.1:1/v1/chat/completions";
    config.timeout_ms = 2000;
    OpenAIEnhancer enhancer(config);

    ProjectInput project = sample_project();
    ProjectOutput output = RulesEngine().process(project, "2024-03-15T10:30:00.000");
    REQUIRE_FALSE(enhancer.enhance(project, output).has_value());

    Logger::get_instance().flush();
    std::string log = read_file(path);
    REQUIRE_THAT(log, ContainsSubstring("HTTP request"));
    REQUIRE_THAT(log, ContainsSubstring("header.Authorization=[REDACTED]"));
    REQUIRE_THAT(log, ContainsSubstring("OpenAI request failed"));
    REQUIRE(log.find("sk-test-key-1234567890") == std::string::npos);

    Logger::get_instance().configure(LoggerConfig());
    std::remove(path.c_str());
}
