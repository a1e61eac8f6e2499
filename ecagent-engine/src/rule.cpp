#include "rule.hpp"

namespace ecagent {

std::string to_string(ConditionOperator op) {
    switch (op) {
        case ConditionOperator::Eq: return "eq";
        case ConditionOperator::Ne: return "ne";
        case ConditionOperator::Gt: return "gt";
        case ConditionOperator::Gte: return "gte";
        case ConditionOperator::Lt: return "lt";
        case ConditionOperator::Lte: return "lte";
        case ConditionOperator::In: return "in";
        case ConditionOperator::Contains: return "contains";
    }
    return "unknown";
}

std::optional<ConditionOperator> parse_operator(const std::string& value) {
    if (value == "eq") return ConditionOperator::Eq;
    if (value == "ne") return ConditionOperator::Ne;
    if (value == "gt") return ConditionOperator::Gt;
    if (value == "gte") return ConditionOperator::Gte;
    if (value == "lt") return ConditionOperator::Lt;
    if (value == "lte") return ConditionOperator::Lte;
    if (value == "in") return ConditionOperator::In;
    if (value == "contains") return ConditionOperator::Contains;
    return std::nullopt;
}

bool is_ordering_operator(ConditionOperator op) {
    return op == ConditionOperator::Gt || op == ConditionOperator::Gte ||
           op == ConditionOperator::Lt || op == ConditionOperator::Lte;
}

} // namespace ecagent
