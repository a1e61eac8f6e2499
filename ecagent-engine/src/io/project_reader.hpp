#ifndef ECAGENT_IO_PROJECT_READER_HPP
#define ECAGENT_IO_PROJECT_READER_HPP

#include "../project.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ecagent {
namespace io {

// Convert a project document into a validated ProjectInput.
// Required: project_name, jurisdiction, total_disturbed_acres, predominant_soil,
// predominant_slope, average_slope_percent.
// Throws: ProjectInputError naming the offending field
ProjectInput parse_project(const nlohmann::json& document);

// Read a .json/.yaml/.yml project file
// Throws: ProjectInputError (including unreadable or unparsable files)
ProjectInput read_project_file(const std::string& path);

} // namespace io
} // namespace ecagent

#endif // ECAGENT_IO_PROJECT_READER_HPP
