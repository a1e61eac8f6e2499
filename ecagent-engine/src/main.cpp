#include "config_parser.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "rule_repository.hpp"
#include "rules_engine.hpp"
#include "io/output_writer.hpp"
#include "io/project_reader.hpp"
#include "io/rule_file.hpp"
#include "credential_manager.hpp"
#include "enhancer.hpp"
#include "openai_enhancer.hpp"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

constexpr const char* VERSION = "1.0.0";

struct CLIArgs {
    std::string command;
    std::string input_path;
    std::string output_path;
    std::string rules_path;
    std::string config_path;
    std::string project_path;
    bool llm = false;
    bool no_llm = false;
    std::string llm_api_key;
    std::string llm_model;
    std::string llm_endpoint;
    long llm_timeout_ms = 0;
    std::string log_level;
    std::string log_file;
    bool quiet = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "EC Agent v" << VERSION << " - Erosion Control Rules Engine\n\n";
    std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  process <input>         Generate erosion control recommendations\n";
    std::cerr << "  validate <input>        Check a project file and print its key facts\n";
    std::cerr << "  rules                   List the active rule set in evaluation order\n";
    std::cerr << "  explain <practice>      Ask the LLM to explain one practice type\n";
    std::cerr << "  version                 Print the version\n\n";
    std::cerr << "Process options:\n";
    std::cerr << "  --output, -o <path>     Output file (.json, .yaml, .yml or .md)\n";
    std::cerr << "  --rules, -r <path>      Custom rules file (JSON or YAML), also for 'rules'\n";
    std::cerr << "  --config <path>         Agent configuration file (JSON)\n";
    std::cerr << "  --llm                   Request LLM insights\n";
    std::cerr << "  --no-llm                Disable LLM insights even if configured\n";
    std::cerr << "  --llm-api-key <key>     OpenAI API key (default: OPENAI_API_KEY)\n";
    std::cerr << "  --llm-model <name>      Chat model (default: gpt-4)\n";
    std::cerr << "  --llm-endpoint <url>    Chat-completions URL\n";
    std::cerr << "  --llm-timeout-ms <n>    Request timeout in milliseconds (default: 30000)\n";
    std::cerr << "  --log-level <level>     DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>       Also append log lines to this file\n";
    std::cerr << "  --quiet, -q             Do not print the summary\n\n";
    std::cerr << "Explain options:\n";
    std::cerr << "  --project <path>        Project file whose key facts are given as context\n";
    std::cerr << "  (LLM options above apply; --no-llm disables the request)\n\n";
    std::cerr << "Other:\n";
    std::cerr << "  --help, -h              Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " process project.yaml -o recommendations.md --rules state_rules.yaml\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if ((arg == "--rules" || arg == "-r") && i + 1 < argc) {
            args.rules_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--project" && i + 1 < argc) {
            args.project_path = argv[++i];
        } else if (arg == "--llm") {
            args.llm = true;
        } else if (arg == "--no-llm") {
            args.no_llm = true;
        } else if (arg == "--llm-api-key" && i + 1 < argc) {
            args.llm_api_key = argv[++i];
        } else if (arg == "--llm-model" && i + 1 < argc) {
            args.llm_model = argv[++i];
        } else if (arg == "--llm-endpoint" && i + 1 < argc) {
            args.llm_endpoint = argv[++i];
        } else if (arg == "--llm-timeout-ms" && i + 1 < argc) {
            try {
                args.llm_timeout_ms = std::stol(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --llm-timeout-ms expects an integer, got: " << argv[i] << "\n\n";
                return false;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--quiet" || arg == "-q") {
            args.quiet = true;
        } else if (!arg.empty() && arg[0] != '-') {
            // Positional: command, then input file
            if (args.command.empty()) {
                args.command = arg;
            } else if (args.input_path.empty()) {
                args.input_path = arg;
            } else {
                std::cerr << "Error: Unexpected argument: " << arg << "\n\n";
                return false;
            }
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.command != "process" && args.command != "validate" && args.command != "rules" &&
        args.command != "explain" && args.command != "version") {
        std::cerr << "Error: Unknown command: " << args.command << "\n";
        return false;
    }

    if (args.command == "process" || args.command == "validate") {
        if (args.input_path.empty()) {
            std::cerr << "Error: " << args.command << " requires an input file\n";
            valid = false;
        } else if (!file_exists(args.input_path)) {
            std::cerr << "Error: Input file not found: " << args.input_path << "\n";
            valid = false;
        }
    }

    if (args.command == "explain") {
        if (args.input_path.empty()) {
            std::cerr << "Error: explain requires a practice type\n";
            valid = false;
        } else if (!ecagent::parse_practice_type(args.input_path)) {
            std::cerr << "Error: Unknown practice type: " << args.input_path << "\n";
            valid = false;
        }
        if (!args.project_path.empty() && !file_exists(args.project_path)) {
            std::cerr << "Error: Project file not found: " << args.project_path << "\n";
            valid = false;
        }
    }

    if (!args.rules_path.empty() && !file_exists(args.rules_path)) {
        std::cerr << "Error: Rules file not found: " << args.rules_path << "\n";
        valid = false;
    }

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (args.llm && args.no_llm) {
        std::cerr << "Error: --llm and --no-llm are mutually exclusive\n";
        valid = false;
    }

    if (args.llm_timeout_ms < 0) {
        std::cerr << "Error: --llm-timeout-ms must be positive\n";
        valid = false;
    }

    return valid;
}

// Settings after merging the config file under the command-line flags
struct RunSettings {
    std::string rules_path;
    std::string output_path;
    ecagent::LoggerConfig logger;
    bool llm_enabled = false;
    ecagent::llm::OpenAIConfig openai;
};

RunSettings resolve_settings(const CLIArgs& args) {
    RunSettings settings;
    ecagent::AgentConfig config;
    if (!args.config_path.empty()) {
        config = ecagent::parse_agent_config_from_file(args.config_path);
    }

    settings.rules_path = args.rules_path.empty() ? config.rules_file : args.rules_path;
    settings.output_path = args.output_path.empty() ? config.output : args.output_path;

    std::string level = args.log_level.empty() ? config.logging.level : args.log_level;
    if (!level.empty()) {
        settings.logger.min_level = ecagent::string_to_level(level);
    }
    std::string log_file = args.log_file.empty() ? config.logging.file : args.log_file;
    if (!log_file.empty()) {
        settings.logger.enable_file = true;
        settings.logger.log_file_path = log_file;
    }
    if (config.logging.json) {
        settings.logger.enable_json = *config.logging.json;
    }

    settings.llm_enabled = config.llm.enabled.value_or(false);
    if (args.llm) settings.llm_enabled = true;
    if (args.no_llm) settings.llm_enabled = false;

    if (!config.llm.model.empty()) settings.openai.model = config.llm.model;
    if (!config.llm.endpoint.empty()) settings.openai.endpoint = config.llm.endpoint;
    if (config.llm.timeout_ms) settings.openai.timeout_ms = *config.llm.timeout_ms;
    settings.openai.api_key = config.llm.api_key;

    if (!args.llm_model.empty()) settings.openai.model = args.llm_model;
    if (!args.llm_endpoint.empty()) settings.openai.endpoint = args.llm_endpoint;
    if (args.llm_timeout_ms > 0) settings.openai.timeout_ms = args.llm_timeout_ms;
    if (!args.llm_api_key.empty()) settings.openai.api_key = args.llm_api_key;

    return settings;
}

std::shared_ptr<const ecagent::RuleRepository> load_rules(const std::string& rules_path,
                                                          const ecagent::RunContext& ctx) {
    ecagent::Logger& logger = ecagent::Logger::get_instance();

    std::vector<ecagent::RuleSpec> custom;
    if (!rules_path.empty()) {
        custom = ecagent::io::read_rule_file(rules_path);
        logger.log_rule_file_loaded(ctx, rules_path, custom.size());
    }

    auto repository = std::make_shared<const ecagent::RuleRepository>(custom);
    logger.log_rules_loaded(ctx, repository->size(), repository->custom_rule_count(),
                            repository->catalogue_version());
    return repository;
}

std::unique_ptr<ecagent::llm::Enhancer> select_enhancer(const RunSettings& settings,
                                                        const ecagent::RunContext& ctx) {
    ecagent::Logger& logger = ecagent::Logger::get_instance();

    if (!settings.llm_enabled) {
        return std::make_unique<ecagent::llm::NoOpEnhancer>();
    }

    ecagent::llm::CredentialManager credentials(settings.openai.api_key);
    if (!credentials.has_api_key()) {
        logger.log_warning(ctx, "OpenAI API key not found. Using mock LLM adapter.");
        logger.log_llm_configured(ctx, "mock", "", "");
        return std::make_unique<ecagent::llm::MockEnhancer>();
    }

    ecagent::llm::OpenAIConfig openai = settings.openai;
    openai.api_key = credentials.get_api_key();
    logger.log_llm_configured(ctx, "openai", openai.model, openai.api_key);
    logger.log_debug(ctx, "API key discovered",
                     {{"credentials", credentials.to_string()}});
    return std::make_unique<ecagent::llm::OpenAIEnhancer>(openai);
}

void print_summary(const ecagent::ProjectOutput& output, const std::optional<std::string>& insights) {
    const ecagent::ProjectSummary& summary = output.summary;

    std::cerr << "\n=== Erosion Control Recommendations: " << output.project_name << " ===\n";
    std::cerr << "Temporary practices: " << summary.total_temporary_practices << "\n";
    std::cerr << "Permanent practices: " << summary.total_permanent_practices << "\n";
    std::cerr << "Pay items:           " << summary.total_pay_items << "\n";
    std::cerr << std::fixed << std::setprecision(2);
    std::cerr << "Estimated cost:      $" << summary.total_estimated_cost << "\n";

    if (!output.temporary_practices.empty() || !output.permanent_practices.empty()) {
        std::cerr << "\nPractices:\n";
        for (const auto* practices : {&output.temporary_practices, &output.permanent_practices}) {
            for (const auto& practice : *practices) {
                std::cerr << "  - " << ecagent::to_string(practice.practice_type)
                          << (practice.is_temporary ? " (temporary)" : " (permanent)")
                          << ": " << practice.quantity << " " << practice.unit
                          << " [" << practice.rule_id << "]\n";
            }
        }
    }

    if (!output.pay_items.empty()) {
        std::cerr << "\nPay items:\n";
        for (const auto& item : output.pay_items) {
            std::cerr << "  - " << item.item_number << " " << item.description << ": "
                      << item.quantity << " " << item.unit;
            if (item.estimated_unit_cost) {
                std::cerr << " (est. $" << item.extended_cost() << ")";
            }
            std::cerr << "\n";
        }
    }
    std::cerr.unsetf(std::ios::floatfield);
    std::cerr << std::setprecision(6);

    if (insights) {
        std::cerr << "\nLLM Insights:\n" << *insights << "\n";
    }
}

int run_process(const CLIArgs& args) {
    RunSettings settings = resolve_settings(args);

    ecagent::Logger& logger = ecagent::Logger::get_instance();
    logger.configure(settings.logger);
    ecagent::RunContext ctx("process", args.input_path);

    try {
        auto repository = load_rules(settings.rules_path, ctx);

        ecagent::ProjectInput project = ecagent::io::read_project_file(args.input_path);
        logger.log_project_loaded(ctx, project);

        ecagent::RulesEngine engine(repository);
        auto start = std::chrono::high_resolution_clock::now();
        ecagent::ProjectOutput output = engine.process(project);
        auto end = std::chrono::high_resolution_clock::now();
        double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
        logger.log_process_complete(ctx, output, elapsed_ms);

        std::unique_ptr<ecagent::llm::Enhancer> enhancer = select_enhancer(settings, ctx);
        ecagent::llm::EnhancedOutput enhanced =
            ecagent::llm::enhance_output(*enhancer, project, output, ctx);

        if (!settings.output_path.empty()) {
            ecagent::io::OutputFormat format = ecagent::io::write_project_output(
                settings.output_path, enhanced.output, enhanced.insights);
            logger.log_output_written(ctx, settings.output_path, ecagent::io::to_string(format));
        }

        if (!args.quiet) {
            print_summary(enhanced.output, enhanced.insights);
        }

        logger.flush();
        return 0;

    } catch (const ecagent::RuleEvaluationError& e) {
        logger.log_error(ctx, e.what(), e.rule_id());
        std::cerr << "Error: " << e.what() << "\n";
    } catch (const ecagent::RuleValidationError& e) {
        logger.log_error(ctx, e.what(), e.rule_id());
        std::cerr << "Error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        std::cerr << "Error: " << e.what() << "\n";
    }
    logger.flush();
    return 1;
}

int run_validate(const CLIArgs& args) {
    try {
        ecagent::ProjectInput project = ecagent::io::read_project_file(args.input_path);

        std::cout << "Project: " << project.project_name << "\n";
        std::cout << "Jurisdiction: " << project.jurisdiction << "\n";
        std::cout << "Total Disturbed Acres: " << project.total_disturbed_acres << "\n";
        std::cout << "Predominant Soil: " << ecagent::to_string(project.predominant_soil) << "\n";
        std::cout << "Predominant Slope: " << ecagent::to_string(project.predominant_slope) << "\n";
        std::cout << "Drainage Features: " << project.drainage_feature_count() << "\n";
        std::cout << "Project Phases: " << project.phase_count() << "\n";
        std::cout << "\nProject input is valid.\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Validation failed: " << e.what() << "\n";
        return 1;
    }
}

int run_rules(const CLIArgs& args) {
    try {
        RunSettings settings = resolve_settings(args);
        ecagent::Logger::get_instance().set_min_level(ecagent::LogLevel::WARN);
        auto repository = load_rules(settings.rules_path, ecagent::RunContext("rules", ""));

        std::cout << "Rule catalogue " << repository->catalogue_version() << ": "
                  << repository->size() << " rules (" << repository->custom_rule_count()
                  << " custom)\n\n";
        for (const auto& rule : repository->rules()) {
            std::cout << std::setw(5) << rule.priority << "  " << std::left << std::setw(24)
                      << rule.id << std::right << " "
                      << ecagent::to_string(rule.action.practice_type) << " -> "
                      << rule.action.pay_item_number << "  (" << rule.source << ")\n";
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int run_explain(const CLIArgs& args) {
    try {
        RunSettings settings = resolve_settings(args);
        // explain uses the enhancer unless --no-llm is given
        settings.llm_enabled = !args.no_llm;
        ecagent::Logger::get_instance().configure(settings.logger);

        ecagent::RunContext ctx("explain", args.project_path);
        ecagent::PracticeType practice_type = *ecagent::parse_practice_type(args.input_path);

        ecagent::llm::PracticeContext context;
        if (!args.project_path.empty()) {
            ecagent::ProjectInput project = ecagent::io::read_project_file(args.project_path);
            ecagent::Logger::get_instance().log_project_loaded(ctx, project);
            context = ecagent::llm::practice_context(project);
        }

        auto enhancer = select_enhancer(settings, ctx);
        std::optional<std::string> explanation = enhancer->explain_practice(practice_type, context);

        std::cout << "=== " << ecagent::to_string(practice_type) << " ===\n";
        std::cout << explanation.value_or("No explanation available.") << "\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    // Handle help, and show usage when no command is given
    if (args.help || argc == 1 || args.command.empty()) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    if (args.command == "version") {
        std::cout << "EC Agent version " << VERSION << "\n";
        return 0;
    }

    try {
        if (args.command == "validate") {
            return run_validate(args);
        }
        if (args.command == "rules") {
            return run_rules(args);
        }
        if (args.command == "explain") {
            return run_explain(args);
        }
        return run_process(args);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
