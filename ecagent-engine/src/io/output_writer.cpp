#include "output_writer.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using ordered_json = nlohmann::ordered_json;
namespace fs = std::filesystem;

namespace ecagent {
namespace io {

namespace {

ordered_json practice_to_json(const ECPractice& practice) {
    ordered_json j;
    j["practice_type"] = to_string(practice.practice_type);
    j["is_temporary"] = practice.is_temporary;
    j["quantity"] = practice.quantity;
    j["unit"] = practice.unit;
    j["location"] = practice.location;
    j["rule_id"] = practice.rule_id;
    j["rule_source"] = practice.rule_source;
    j["justification"] = practice.justification;
    j["notes"] = practice.notes;
    return j;
}

ordered_json pay_item_to_json(const PayItem& item) {
    ordered_json j;
    j["item_number"] = item.item_number;
    j["description"] = item.description;
    j["quantity"] = item.quantity;
    j["unit"] = item.unit;
    if (item.estimated_unit_cost) {
        j["estimated_unit_cost"] = *item.estimated_unit_cost;
    } else {
        j["estimated_unit_cost"] = nullptr;
    }
    j["ec_practice_ref"] = item.ec_practice_ref;
    j["rule_id"] = item.rule_id;
    j["rule_source"] = item.rule_source;
    return j;
}

YAML::Node yaml_from_json(const ordered_json& value) {
    if (value.is_object()) {
        YAML::Node node(YAML::NodeType::Map);
        for (auto it = value.begin(); it != value.end(); ++it) {
            node[it.key()] = yaml_from_json(it.value());
        }
        return node;
    }
    if (value.is_array()) {
        YAML::Node node(YAML::NodeType::Sequence);
        for (const auto& v : value) {
            node.push_back(yaml_from_json(v));
        }
        return node;
    }
    if (value.is_boolean()) return YAML::Node(value.get<bool>());
    if (value.is_number_float()) return YAML::Node(value.get<double>());
    if (value.is_number_integer()) return YAML::Node(value.get<int64_t>());
    if (value.is_string()) return YAML::Node(value.get<std::string>());
    return YAML::Node(YAML::NodeType::Null);
}

std::string format_fixed(double value, int precision = 2) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string format_cost(double value) {
    return "$" + format_fixed(round_to_cents(value));
}

// Pipes would break the table layout
std::string cell(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c == '|') {
            result += "\\|";
        } else if (c == '\n') {
            result += ' ';
        } else {
            result += c;
        }
    }
    return result;
}

void write_practice_table(std::ostream& os, const std::vector<ECPractice>& practices) {
    if (practices.empty()) {
        os << "None identified.\n\n";
        return;
    }

    os << "| Practice | Quantity | Unit | Location | Rule | Justification |\n";
    os << "|---|---:|---|---|---|---|\n";
    for (const auto& practice : practices) {
        os << "| " << to_string(practice.practice_type)
           << " | " << format_fixed(practice.quantity)
           << " | " << cell(practice.unit)
           << " | " << cell(practice.location)
           << " | " << cell(practice.rule_id)
           << " | " << cell(practice.justification) << " |\n";
    }
    os << "\n";
}

std::ofstream open_output_file(const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    return file;
}

} // anonymous namespace

OutputFormat output_format_from_path(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".json") return OutputFormat::Json;
    if (ext == ".yaml" || ext == ".yml") return OutputFormat::Yaml;
    if (ext == ".md") return OutputFormat::Markdown;
    throw std::runtime_error("Unsupported output format '" + ext + "' for " + path +
                             " (expected .json, .yaml, .yml or .md)");
}

std::string to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::Json: return "json";
        case OutputFormat::Yaml: return "yaml";
        case OutputFormat::Markdown: return "markdown";
    }
    return "unknown";
}

double round_to_cents(double value) {
    return std::round(value * 100.0) / 100.0;
}

ordered_json project_output_to_json(const ProjectOutput& output,
                                    const std::optional<std::string>& insights) {
    ordered_json j;
    j["project_name"] = output.project_name;
    j["timestamp"] = output.timestamp;

    j["temporary_practices"] = ordered_json::array();
    for (const auto& practice : output.temporary_practices) {
        j["temporary_practices"].push_back(practice_to_json(practice));
    }

    j["permanent_practices"] = ordered_json::array();
    for (const auto& practice : output.permanent_practices) {
        j["permanent_practices"].push_back(practice_to_json(practice));
    }

    j["pay_items"] = ordered_json::array();
    for (const auto& item : output.pay_items) {
        j["pay_items"].push_back(pay_item_to_json(item));
    }

    ordered_json summary;
    summary["total_temporary_practices"] = output.summary.total_temporary_practices;
    summary["total_permanent_practices"] = output.summary.total_permanent_practices;
    summary["total_pay_items"] = output.summary.total_pay_items;
    summary["total_estimated_cost"] = round_to_cents(output.summary.total_estimated_cost);
    if (insights) {
        summary["llm_insights"] = *insights;
    }
    j["summary"] = summary;

    return j;
}

void write_project_output_json(std::ostream& os, const ProjectOutput& output,
                               const std::optional<std::string>& insights, bool pretty_print) {
    os << project_output_to_json(output, insights).dump(pretty_print ? 2 : -1) << "\n";
}

void write_project_output_json(const std::string& filepath, const ProjectOutput& output,
                               const std::optional<std::string>& insights, bool pretty_print) {
    std::ofstream file = open_output_file(filepath);
    write_project_output_json(file, output, insights, pretty_print);
}

void write_project_output_yaml(std::ostream& os, const ProjectOutput& output,
                               const std::optional<std::string>& insights) {
    YAML::Emitter emitter;
    emitter << yaml_from_json(project_output_to_json(output, insights));
    if (!emitter.good()) {
        throw std::runtime_error("YAML emitter error: " + emitter.GetLastError());
    }
    os << emitter.c_str() << "\n";
}

void write_project_output_yaml(const std::string& filepath, const ProjectOutput& output,
                               const std::optional<std::string>& insights) {
    std::ofstream file = open_output_file(filepath);
    write_project_output_yaml(file, output, insights);
}

void write_project_report_markdown(std::ostream& os, const ProjectOutput& output,
                                   const std::optional<std::string>& insights) {
    const ProjectSummary& summary = output.summary;

    os << "# Erosion Control Recommendations: " << output.project_name << "\n\n";
    os << "Generated: " << output.timestamp << "\n\n";

    os << "## Summary\n\n";
    os << "| Metric | Value |\n";
    os << "|---|---:|\n";
    os << "| Temporary practices | " << summary.total_temporary_practices << " |\n";
    os << "| Permanent practices | " << summary.total_permanent_practices << " |\n";
    os << "| Pay items | " << summary.total_pay_items << " |\n";
    os << "| Total estimated cost | " << format_cost(summary.total_estimated_cost) << " |\n\n";

    os << "## Temporary Erosion Control Practices\n\n";
    write_practice_table(os, output.temporary_practices);

    os << "## Permanent Erosion Control Practices\n\n";
    write_practice_table(os, output.permanent_practices);

    os << "## Pay Items\n\n";
    if (output.pay_items.empty()) {
        os << "No pay items mapped.\n\n";
    } else {
        os << "| Item | Description | Quantity | Unit | Unit Cost | Extended Cost |\n";
        os << "|---|---|---:|---|---:|---:|\n";
        for (const auto& item : output.pay_items) {
            os << "| " << cell(item.item_number)
               << " | " << cell(item.description)
               << " | " << format_fixed(item.quantity)
               << " | " << cell(item.unit)
               << " | " << (item.estimated_unit_cost ? format_cost(*item.estimated_unit_cost) : "n/a")
               << " | " << format_cost(item.extended_cost()) << " |\n";
        }
        os << "\n";
    }

    os << "## Traceability Matrix\n\n";
    if (output.pay_items.empty()) {
        os << "No practices recommended.\n\n";
    } else {
        os << "| Practice | Pay Item | Rule | Source |\n";
        os << "|---|---|---|---|\n";
        for (const auto& item : output.pay_items) {
            os << "| " << cell(item.ec_practice_ref)
               << " | " << cell(item.item_number)
               << " | " << cell(item.rule_id)
               << " | " << cell(item.rule_source) << " |\n";
        }
        os << "\n";
    }

    if (insights) {
        os << "## LLM Insights\n\n";
        os << *insights << "\n";
    }
}

void write_project_report_markdown(const std::string& filepath, const ProjectOutput& output,
                                   const std::optional<std::string>& insights) {
    std::ofstream file = open_output_file(filepath);
    write_project_report_markdown(file, output, insights);
}

OutputFormat write_project_output(const std::string& filepath, const ProjectOutput& output,
                                  const std::optional<std::string>& insights) {
    OutputFormat format = output_format_from_path(filepath);
    switch (format) {
        case OutputFormat::Json:
            write_project_output_json(filepath, output, insights);
            break;
        case OutputFormat::Yaml:
            write_project_output_yaml(filepath, output, insights);
            break;
        case OutputFormat::Markdown:
            write_project_report_markdown(filepath, output, insights);
            break;
    }
    return format;
}

} // namespace io
} // namespace ecagent
