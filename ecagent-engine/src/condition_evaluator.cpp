#include "condition_evaluator.hpp"
#include "errors.hpp"
#include <algorithm>

namespace ecagent {

namespace {

bool compare_numeric(ConditionOperator op, double lhs, double rhs) {
    switch (op) {
        case ConditionOperator::Gt: return lhs > rhs;
        case ConditionOperator::Gte: return lhs >= rhs;
        case ConditionOperator::Lt: return lhs < rhs;
        case ConditionOperator::Lte: return lhs <= rhs;
        default: return false;
    }
}

} // anonymous namespace

const std::vector<std::string>& ConditionEvaluator::known_fields() {
    static const std::vector<std::string> fields = {
        "project_name",
        "jurisdiction",
        "total_disturbed_acres",
        "predominant_soil",
        "predominant_slope",
        "average_slope_percent",
        "has_drainage_features",
        "drainage_feature_count",
        "phase_count",
        "total_drainage_area_acres"
    };
    return fields;
}

bool ConditionEvaluator::is_known_field(const std::string& field) {
    const std::string prefix = METADATA_PREFIX;
    if (field.size() > prefix.size() && field.compare(0, prefix.size(), prefix) == 0) {
        return true;
    }
    const auto& fields = known_fields();
    return std::find(fields.begin(), fields.end(), field) != fields.end();
}

std::optional<Scalar> ConditionEvaluator::resolve_field(const std::string& field,
                                                        const ProjectInput& project) {
    if (field == "project_name") return Scalar(project.project_name);
    if (field == "jurisdiction") return Scalar(project.jurisdiction);
    if (field == "total_disturbed_acres") return Scalar(project.total_disturbed_acres);
    if (field == "predominant_soil") return Scalar(to_string(project.predominant_soil));
    if (field == "predominant_slope") return Scalar(to_string(project.predominant_slope));
    if (field == "average_slope_percent") return Scalar(project.average_slope_percent);
    if (field == "has_drainage_features") return Scalar(project.has_drainage_features());
    if (field == "drainage_feature_count") {
        return Scalar(static_cast<double>(project.drainage_feature_count()));
    }
    if (field == "phase_count") return Scalar(static_cast<double>(project.phase_count()));
    if (field == "total_drainage_area_acres") return Scalar(project.total_drainage_area_acres());

    const std::string prefix = METADATA_PREFIX;
    if (field.size() > prefix.size() && field.compare(0, prefix.size(), prefix) == 0) {
        auto it = project.metadata.find(field.substr(prefix.size()));
        if (it == project.metadata.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    throw ConditionFieldError(field);
}

bool ConditionEvaluator::evaluate(const Condition& condition, const ProjectInput& project) const {
    std::optional<Scalar> resolved = resolve_field(condition.field, project);
    if (!resolved) {
        // Missing metadata never satisfies a condition
        return false;
    }
    const Scalar& value = *resolved;

    if (condition.op == ConditionOperator::In) {
        if (!condition.value.is_list()) {
            throw RuleEvaluationError("Operator 'in' requires a list value (field '" +
                condition.field + "')");
        }
        const auto& items = condition.value.items();
        return std::any_of(items.begin(), items.end(), [&value](const Scalar& item) {
            return scalar_equals(value, item);
        });
    }

    if (condition.value.is_list()) {
        throw RuleEvaluationError("Operator '" + to_string(condition.op) +
            "' requires a scalar value (field '" + condition.field + "')");
    }
    const Scalar& target = condition.value.scalar();

    switch (condition.op) {
        case ConditionOperator::Eq:
            return scalar_equals(value, target);
        case ConditionOperator::Ne:
            return !scalar_equals(value, target);
        case ConditionOperator::Gt:
        case ConditionOperator::Gte:
        case ConditionOperator::Lt:
        case ConditionOperator::Lte:
            if (!is_numeric(value) || !is_numeric(target)) {
                throw ConditionTypeError(condition.field, to_string(condition.op));
            }
            return compare_numeric(condition.op, std::get<double>(value), std::get<double>(target));
        case ConditionOperator::Contains:
            return scalar_to_string(value).find(scalar_to_string(target)) != std::string::npos;
        case ConditionOperator::In:
            break;
    }
    return false;
}

bool ConditionEvaluator::matches(const std::vector<Condition>& conditions,
                                 const ProjectInput& project) const {
    for (const auto& condition : conditions) {
        if (!evaluate(condition, project)) {
            return false;
        }
    }
    return true;
}

} // namespace ecagent
