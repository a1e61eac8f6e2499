#include <catch2/catch_test_macros.hpp>
#include "../src/config_parser.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace ecagent;
namespace fs = std::filesystem;

TEST_CASE("Config parser full document", "[config]") {
    setenv("ECAGENT_TEST_KEY", "sk-test-from-env", 1);

    const std::string json = R"({
        "rules_file": "rules/state.yaml",
        "output": "out/recommendations.md",
        "logging": {"level": "debug", "file": "logs/ecagent.log", "json": true},
        "llm": {
            "enabled": true,
            "model": "gpt-4o-mini",
            "endpoint": "http://localhost:8080/v1/chat/completions",
            "api_key": "${ECAGENT_TEST_KEY}",
            "timeout_ms": 5000
        }
    })";

    AgentConfig config = parse_agent_config_from_string(json);

    REQUIRE(config.rules_file == "rules/state.yaml");
    REQUIRE(config.output == "out/recommendations.md");
    REQUIRE(config.logging.level == "debug");
    REQUIRE(config.logging.file == "logs/ecagent.log");
    REQUIRE(config.logging.json.value() == true);
    REQUIRE(config.llm.enabled.value() == true);
    REQUIRE(config.llm.model == "gpt-4o-mini");
    REQUIRE(config.llm.endpoint == "http://localhost:8080/v1/chat/completions");
    REQUIRE(config.llm.api_key == "sk-test-from-env");
    REQUIRE(config.llm.timeout_ms.value() == 5000);

    unsetenv("ECAGENT_TEST_KEY");
}

TEST_CASE("Config parser empty document", "[config]") {
    AgentConfig config = parse_agent_config_from_string("{}");

    REQUIRE(config.rules_file.empty());
    REQUIRE(config.output.empty());
    REQUIRE(config.logging.level.empty());
    REQUIRE_FALSE(config.logging.json.has_value());
    REQUIRE_FALSE(config.llm.enabled.has_value());
    REQUIRE_FALSE(config.llm.timeout_ms.has_value());
}

TEST_CASE("Config parser errors", "[config]") {
    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(parse_agent_config_from_string("{\"rules_file\": "), ConfigParseError);
    }

    SECTION("Not an object") {
        REQUIRE_THROWS_AS(parse_agent_config_from_string("[1, 2]"), ConfigParseError);
    }

    SECTION("Wrong types") {
        REQUIRE_THROWS_AS(parse_agent_config_from_string(R"({"rules_file": 5})"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_agent_config_from_string(R"({"logging": "verbose"})"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_agent_config_from_string(R"({"llm": {"enabled": "yes"}})"), ConfigParseError);
    }

    SECTION("Non-positive timeout") {
        REQUIRE_THROWS_AS(parse_agent_config_from_string(R"({"llm": {"timeout_ms": 0}})"), ConfigParseError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(parse_agent_config_from_file("no_such_config.json"), ConfigParseError);
    }
}

TEST_CASE("Environment variable expansion", "[config]") {
    setenv("ECAGENT_TEST_DIR", "/data/projects", 1);
    unsetenv("ECAGENT_TEST_UNSET");

    REQUIRE(expand_environment_variables("${ECAGENT_TEST_DIR}/rules.yaml") == "/data/projects/rules.yaml");
    REQUIRE(expand_environment_variables("$ECAGENT_TEST_DIR/rules.yaml") == "/data/projects/rules.yaml");
    REQUIRE(expand_environment_variables("x${ECAGENT_TEST_UNSET}y") == "xy");
    REQUIRE(expand_environment_variables("cost in $") == "cost in $");
    REQUIRE(expand_environment_variables("${UNCLOSED") == "${UNCLOSED");
    REQUIRE(expand_environment_variables("no variables") == "no variables");

    unsetenv("ECAGENT_TEST_DIR");
}

TEST_CASE("Relative path resolution", "[config]") {
    REQUIRE(resolve_relative_path("rules.yaml", "/etc/ecagent/config.json") == "/etc/ecagent/rules.yaml");
    REQUIRE(resolve_relative_path("/abs/rules.yaml", "/etc/ecagent/config.json") == "/abs/rules.yaml");
    REQUIRE(resolve_relative_path("", "/etc/ecagent/config.json").empty());
}

TEST_CASE("Config file paths resolve against the config directory", "[config]") {
    fs::path dir = fs::temp_directory_path() / "ecagent_config_test";
    fs::create_directories(dir);
    fs::path config_path = dir / "agent.json";
    {
        std::ofstream out(config_path);
        out << R"({"rules_file": "state.yaml", "output": "/tmp/out.json", "logging": {"file": "run.log"}})";
    }

    AgentConfig config = parse_agent_config_from_file(config_path.string());

    REQUIRE(config.rules_file == (dir / "state.yaml").string());
    REQUIRE(config.output == "/tmp/out.json");
    REQUIRE(config.logging.file == (dir / "run.log").string());

    fs::remove_all(dir);
}
