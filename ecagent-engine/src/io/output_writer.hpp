#ifndef ECAGENT_IO_OUTPUT_WRITER_HPP
#define ECAGENT_IO_OUTPUT_WRITER_HPP

#include "../recommendation.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>

namespace ecagent {
namespace io {

enum class OutputFormat {
    Json,
    Yaml,
    Markdown
};

// .json, .yaml/.yml, .md
// Throws: std::runtime_error for any other extension
OutputFormat output_format_from_path(const std::string& path);

std::string to_string(OutputFormat format);

// Cost rounded to cents, as written to output files
double round_to_cents(double value);

// Field-ordered JSON tree of a result; summary.llm_insights is present only when insights are
nlohmann::ordered_json project_output_to_json(const ProjectOutput& output,
                                              const std::optional<std::string>& insights = std::nullopt);

// Write ProjectOutput to JSON format
void write_project_output_json(std::ostream& os, const ProjectOutput& output,
                               const std::optional<std::string>& insights = std::nullopt,
                               bool pretty_print = true);

void write_project_output_json(const std::string& filepath, const ProjectOutput& output,
                               const std::optional<std::string>& insights = std::nullopt,
                               bool pretty_print = true);

// Write ProjectOutput to YAML, same structure as the JSON form
void write_project_output_yaml(std::ostream& os, const ProjectOutput& output,
                               const std::optional<std::string>& insights = std::nullopt);

void write_project_output_yaml(const std::string& filepath, const ProjectOutput& output,
                               const std::optional<std::string>& insights = std::nullopt);

// Human-readable report: summary, practice tables, pay items with extended
// cost, and a traceability matrix linking every practice to its rule
void write_project_report_markdown(std::ostream& os, const ProjectOutput& output,
                                   const std::optional<std::string>& insights = std::nullopt);

void write_project_report_markdown(const std::string& filepath, const ProjectOutput& output,
                                   const std::optional<std::string>& insights = std::nullopt);

// Dispatch on the file extension
// Throws: std::runtime_error for unsupported extensions or unwritable files
OutputFormat write_project_output(const std::string& filepath, const ProjectOutput& output,
                                  const std::optional<std::string>& insights = std::nullopt);

} // namespace io
} // namespace ecagent

#endif // ECAGENT_IO_OUTPUT_WRITER_HPP
