#include "rule_file.hpp"
#include "document_reader.hpp"
#include "../errors.hpp"
#include <cmath>
#include <limits>

using json = nlohmann::json;

namespace ecagent {
namespace io {

namespace {

Scalar parse_scalar(const json& value) {
    if (value.is_boolean()) {
        return Scalar(value.get<bool>());
    }
    if (value.is_number()) {
        return Scalar(value.get<double>());
    }
    if (value.is_string()) {
        return Scalar(value.get<std::string>());
    }
    throw std::invalid_argument("expected a boolean, number or string, got " + std::string(value.type_name()));
}

const json& require(const json& object, const std::string& key, const std::string& where) {
    if (!object.contains(key)) {
        throw RuleFileError(where + ": missing required field '" + key + "'");
    }
    return object.at(key);
}

std::string require_string(const json& object, const std::string& key, const std::string& where) {
    const json& value = require(object, key, where);
    if (!value.is_string()) {
        throw RuleFileError(where + ": field '" + key + "' must be a string");
    }
    return value.get<std::string>();
}

Condition parse_condition(const json& j, const std::string& rule_id, const std::string& where) {
    if (!j.is_object()) {
        throw RuleFileError(where + ": condition must be an object");
    }

    Condition condition;
    condition.field = require_string(j, "field", where);

    std::string op = require_string(j, "operator", where);
    auto parsed = parse_operator(op);
    if (!parsed) {
        throw RuleValidationError(rule_id, "unknown operator '" + op + "' on field '" + condition.field + "'");
    }
    condition.op = *parsed;

    try {
        condition.value = parse_condition_value(require(j, "value", where));
    } catch (const std::invalid_argument& e) {
        throw RuleFileError(where + ": field 'value' " + e.what());
    }
    return condition;
}

RuleAction parse_action(const json& j, const std::string& rule_id, const std::string& where) {
    if (!j.is_object()) {
        throw RuleFileError(where + ": field 'action' must be an object");
    }

    RuleAction action;

    std::string practice = require_string(j, "practice_type", where);
    auto type = parse_practice_type(practice);
    if (!type) {
        throw RuleValidationError(rule_id, "unknown practice_type '" + practice + "'");
    }
    action.practice_type = *type;

    const json& temporary = require(j, "is_temporary", where);
    if (!temporary.is_boolean()) {
        throw RuleFileError(where + ": field 'is_temporary' must be a boolean");
    }
    action.is_temporary = temporary.get<bool>();

    action.quantity_formula = require_string(j, "quantity_formula", where);
    action.unit = require_string(j, "unit", where);
    action.location_template = require_string(j, "location_template", where);
    action.justification = require_string(j, "justification", where);
    action.pay_item_number = require_string(j, "pay_item_number", where);
    action.pay_item_description = require_string(j, "pay_item_description", where);

    if (j.contains("estimated_unit_cost") && !j["estimated_unit_cost"].is_null()) {
        const json& cost = j["estimated_unit_cost"];
        if (!cost.is_number()) {
            throw RuleFileError(where + ": field 'estimated_unit_cost' must be a number");
        }
        action.estimated_unit_cost = cost.get<double>();
    }
    return action;
}

RuleSpec parse_rule(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw RuleFileError(where + ": rule must be an object");
    }

    RuleSpec rule;
    rule.id = require_string(j, "id", where);
    const std::string rule_where = where + " ('" + rule.id + "')";

    rule.name = require_string(j, "name", rule_where);
    rule.source = require_string(j, "source", rule_where);

    if (j.contains("priority")) {
        const json& priority = j["priority"];
        if (!priority.is_number()) {
            throw RuleValidationError(rule.id, "priority must be an integer");
        }
        double value = priority.get<double>();
        if (std::floor(value) != value) {
            throw RuleValidationError(rule.id, "priority must be an integer");
        }
        if (value < static_cast<double>(std::numeric_limits<int>::min()) ||
            value > static_cast<double>(std::numeric_limits<int>::max())) {
            throw RuleValidationError(rule.id, "priority must be an integer between " +
                std::to_string(std::numeric_limits<int>::min()) + " and " +
                std::to_string(std::numeric_limits<int>::max()));
        }
        rule.priority = static_cast<int>(value);
    }

    const json& conditions = require(j, "conditions", rule_where);
    if (!conditions.is_array()) {
        throw RuleFileError(rule_where + ": field 'conditions' must be a list");
    }
    for (size_t i = 0; i < conditions.size(); ++i) {
        rule.conditions.push_back(parse_condition(
            conditions[i], rule.id, rule_where + " condition " + std::to_string(i)));
    }

    rule.action = parse_action(require(j, "action", rule_where), rule.id, rule_where);

    if (j.contains("notes") && !j["notes"].is_null()) {
        rule.notes = require_string(j, "notes", rule_where);
    }
    return rule;
}

} // anonymous namespace

ConditionValue parse_condition_value(const json& value) {
    if (value.is_array()) {
        std::vector<Scalar> items;
        for (const auto& item : value) {
            items.push_back(parse_scalar(item));
        }
        return ConditionValue::list(std::move(items));
    }
    return ConditionValue(parse_scalar(value));
}

std::vector<RuleSpec> parse_rules(const json& document, const std::string& origin) {
    if (!document.is_object() || !document.contains("rules")) {
        throw RuleFileError(origin + ": missing top-level 'rules' key");
    }

    const json& rules_json = document["rules"];
    if (!rules_json.is_array()) {
        throw RuleFileError(origin + ": 'rules' must be a list");
    }

    std::vector<RuleSpec> rules;
    rules.reserve(rules_json.size());
    for (size_t i = 0; i < rules_json.size(); ++i) {
        rules.push_back(parse_rule(rules_json[i], origin + " rule " + std::to_string(i)));
    }
    return rules;
}

std::vector<RuleSpec> read_rule_file(const std::string& path) {
    json document;
    try {
        document = read_document(path);
    } catch (const DocumentError& e) {
        throw RuleFileError(e.what());
    }
    return parse_rules(document, path);
}

} // namespace io
} // namespace ecagent
