#include "rule_repository.hpp"
#include "condition_evaluator.hpp"
#include "errors.hpp"
#include "formula.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace ecagent {

namespace {

RuleSpec make_rule(const std::string& id, const std::string& name, const std::string& source,
                   int priority, std::vector<Condition> conditions, RuleAction action) {
    RuleSpec rule;
    rule.id = id;
    rule.name = name;
    rule.source = source;
    rule.priority = priority;
    rule.conditions = std::move(conditions);
    rule.action = std::move(action);
    return rule;
}

RuleAction make_action(PracticeType type, bool is_temporary, const std::string& formula,
                       const std::string& unit, const std::string& location,
                       const std::string& justification, const std::string& pay_item_number,
                       const std::string& pay_item_description, double unit_cost) {
    RuleAction action;
    action.practice_type = type;
    action.is_temporary = is_temporary;
    action.quantity_formula = formula;
    action.unit = unit;
    action.location_template = location;
    action.justification = justification;
    action.pay_item_number = pay_item_number;
    action.pay_item_description = pay_item_description;
    action.estimated_unit_cost = unit_cost;
    return action;
}

} // anonymous namespace

RuleRepository::RuleRepository()
    : custom_rule_count_(0)
{
    build(default_rules(), {});
}

RuleRepository::RuleRepository(const std::vector<RuleSpec>& custom, bool include_defaults)
    : custom_rule_count_(0)
{
    // Repeated ids collapse into one rule during the merge
    std::set<std::string> custom_ids;
    for (const auto& rule : custom) {
        custom_ids.insert(rule.id);
    }
    custom_rule_count_ = custom_ids.size();

    build(include_defaults ? default_rules() : std::vector<RuleSpec>{}, custom);
}

void RuleRepository::build(const std::vector<RuleSpec>& base, const std::vector<RuleSpec>& custom) {
    std::vector<RuleSpec> merged = merge(base, custom);

    // Validate everything before exposing anything
    for (const auto& rule : merged) {
        validate_rule(rule);
    }

    std::stable_sort(merged.begin(), merged.end(), [](const RuleSpec& a, const RuleSpec& b) {
        return a.priority < b.priority;
    });

    rules_ = std::move(merged);
}

const RuleSpec* RuleRepository::find(const std::string& id) const {
    for (const auto& rule : rules_) {
        if (rule.id == id) {
            return &rule;
        }
    }
    return nullptr;
}

std::vector<RuleSpec> RuleRepository::merge(const std::vector<RuleSpec>& base,
                                            const std::vector<RuleSpec>& custom) {
    // Ordered map keyed by id: the vector keeps insertion order, the index maps id -> slot
    std::vector<RuleSpec> merged;
    std::map<std::string, size_t> slot_by_id;

    auto insert = [&merged, &slot_by_id](const RuleSpec& rule) {
        auto it = slot_by_id.find(rule.id);
        if (it != slot_by_id.end()) {
            merged[it->second] = rule;
        } else {
            slot_by_id[rule.id] = merged.size();
            merged.push_back(rule);
        }
    };

    for (const auto& rule : base) {
        insert(rule);
    }
    for (const auto& rule : custom) {
        insert(rule);
    }
    return merged;
}

void RuleRepository::validate_rule(const RuleSpec& rule) {
    if (rule.id.empty()) {
        throw RuleValidationError(rule.id, "id must not be empty");
    }
    if (rule.name.empty()) {
        throw RuleValidationError(rule.id, "name must not be empty");
    }

    for (size_t i = 0; i < rule.conditions.size(); ++i) {
        const Condition& condition = rule.conditions[i];
        const std::string where = "condition " + std::to_string(i) + " ";

        if (!ConditionEvaluator::is_known_field(condition.field)) {
            throw RuleValidationError(rule.id, where + "references unknown field '" + condition.field + "'");
        }

        if (condition.op == ConditionOperator::In) {
            if (!condition.value.is_list()) {
                throw RuleValidationError(rule.id, where + "operator 'in' requires a list value");
            }
            continue;
        }

        if (condition.value.is_list()) {
            throw RuleValidationError(rule.id, where + "operator '" + to_string(condition.op) +
                "' requires a scalar value");
        }
        if (is_ordering_operator(condition.op) && !is_numeric(condition.value.scalar())) {
            throw RuleValidationError(rule.id, where + "operator '" + to_string(condition.op) +
                "' requires a numeric value");
        }
    }

    const RuleAction& action = rule.action;

    try {
        FormulaEvaluator::parse(action.quantity_formula);
    } catch (const RuleEvaluationError& e) {
        throw RuleValidationError(rule.id, "quantity_formula '" + action.quantity_formula + "': " + e.detail());
    }

    if (action.unit.empty()) {
        throw RuleValidationError(rule.id, "unit must not be empty");
    }
    if (action.pay_item_number.empty()) {
        throw RuleValidationError(rule.id, "pay_item_number must not be empty");
    }
    if (action.estimated_unit_cost && *action.estimated_unit_cost < 0.0) {
        throw RuleValidationError(rule.id, "estimated_unit_cost must be >= 0");
    }
}

std::vector<RuleSpec> RuleRepository::default_rules() {
    std::vector<RuleSpec> rules;

    rules.push_back(make_rule(
        "SILT_FENCE_001", "Silt Fence for Perimeter", "EPA NPDES CGP", 10,
        {Condition("total_disturbed_acres", ConditionOperator::Gt, Scalar(0.0))},
        make_action(PracticeType::SiltFence, true, "total_disturbed_acres * 200", "LF",
                    "Perimeter of disturbed area",
                    "Perimeter sediment control per EPA NPDES requirements",
                    "EC-001", "Silt Fence, Type A", 3.50)));

    rules.push_back(make_rule(
        "INLET_PROT_001", "Inlet Protection", "Local Stormwater Ordinance", 20,
        {Condition("has_drainage_features", ConditionOperator::Eq, Scalar(true))},
        make_action(PracticeType::InletProtection, true, "drainage_feature_count", "EA",
                    "At each drainage inlet",
                    "Protect drainage inlets from sediment",
                    "EC-002", "Inlet Protection Device", 250.00)));

    rules.push_back(make_rule(
        "STEEP_SLOPE_001", "Erosion Control Blanket for Steep Slopes",
        "State DOT Standard Specifications", 30,
        {Condition("predominant_slope", ConditionOperator::In,
                   ConditionValue::list({Scalar(std::string("steep")), Scalar(std::string("very_steep"))}))},
        make_action(PracticeType::ErosionControlBlanket, false, "total_disturbed_acres * 43560 / 9", "SY",
                    "Steep slope areas",
                    "Erosion control blanket required for slopes > 25%",
                    "EC-005", "Erosion Control Blanket, Type C", 2.75)));

    rules.push_back(make_rule(
        "CONSTRUCTION_ENT_001", "Construction Entrance", "EPA NPDES CGP", 40,
        {Condition("total_disturbed_acres", ConditionOperator::Gte, Scalar(1.0))},
        make_action(PracticeType::ConstructionEntrance, true, "1", "EA",
                    "Primary site entrance",
                    "Stabilized construction entrance to prevent tracking",
                    "EC-003", "Stabilized Construction Entrance", 1500.00)));

    rules.push_back(make_rule(
        "PERM_SEED_001", "Permanent Seeding", "State DOT Standard Specifications", 50,
        {Condition("total_disturbed_acres", ConditionOperator::Gt, Scalar(0.0))},
        make_action(PracticeType::PermanentSeeding, false, "total_disturbed_acres", "AC",
                    "All disturbed areas",
                    "Permanent vegetation establishment for final stabilization",
                    "EC-010", "Permanent Seeding Mix", 500.00)));

    return rules;
}

} // namespace ecagent
