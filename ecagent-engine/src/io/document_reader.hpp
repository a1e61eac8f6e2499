#ifndef ECAGENT_IO_DOCUMENT_READER_HPP
#define ECAGENT_IO_DOCUMENT_READER_HPP

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace ecagent {
namespace io {

enum class DocumentFormat {
    Json,
    Yaml
};

// Chosen by extension: .json, .yaml, .yml (case-insensitive)
// Throws: DocumentError for any other extension
DocumentFormat format_from_path(const std::string& path);

// Parse a document held in memory; origin names it in error messages
// Throws: DocumentError on syntax errors
nlohmann::json parse_document(const std::string& text, DocumentFormat format,
                              const std::string& origin = "<string>");

// Read and parse a JSON or YAML file into a JSON tree
// Throws: DocumentError if the file cannot be opened or parsed
nlohmann::json read_document(const std::string& path);

// Convert a YAML tree node by node.
// Quoted scalars stay strings; plain scalars become bool, null, integer or
// double when they read as one, and strings otherwise.
nlohmann::json yaml_to_json(const YAML::Node& node);

} // namespace io
} // namespace ecagent

#endif // ECAGENT_IO_DOCUMENT_READER_HPP
