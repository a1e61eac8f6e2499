#ifndef ECAGENT_IO_RULE_FILE_HPP
#define ECAGENT_IO_RULE_FILE_HPP

#include "../rule.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ecagent {
namespace io {

// Convert a rule document ({"rules": [...]}) into custom rules, in file order.
// Only structure is checked here; RuleRepository validates semantics.
// Throws: RuleFileError on missing keys or wrong types,
//         RuleValidationError on unknown operators or practice types
std::vector<RuleSpec> parse_rules(const nlohmann::json& document, const std::string& origin = "<string>");

// Read a .json/.yaml/.yml rule file
// Throws: RuleFileError (including unreadable or unparsable files), RuleValidationError
std::vector<RuleSpec> read_rule_file(const std::string& path);

// Single condition value: scalar, or list of scalars for "in"
// Throws: std::invalid_argument for objects, nulls or nested lists
ConditionValue parse_condition_value(const nlohmann::json& value);

} // namespace io
} // namespace ecagent

#endif // ECAGENT_IO_RULE_FILE_HPP
