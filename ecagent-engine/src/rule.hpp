#ifndef ECAGENT_RULE_HPP
#define ECAGENT_RULE_HPP

#include "recommendation.hpp"
#include "scalar.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ecagent {

enum class ConditionOperator : uint8_t {
    Eq = 0,
    Ne = 1,
    Gt = 2,
    Gte = 3,
    Lt = 4,
    Lte = 5,
    In = 6,
    Contains = 7
};

// Wire names ("eq", "gte", ...); parse returns nullopt for unrecognized operators
std::string to_string(ConditionOperator op);
std::optional<ConditionOperator> parse_operator(const std::string& value);

// True for gt, gte, lt, lte
bool is_ordering_operator(ConditionOperator op);

// Right-hand side of a condition: a single scalar or a list of scalars
class ConditionValue {
public:
    ConditionValue() : scalar_(false), is_list_(false) {}
    ConditionValue(Scalar value) : scalar_(std::move(value)), is_list_(false) {}

    static ConditionValue list(std::vector<Scalar> items) {
        ConditionValue value;
        value.items_ = std::move(items);
        value.is_list_ = true;
        return value;
    }

    bool is_list() const { return is_list_; }
    const Scalar& scalar() const { return scalar_; }
    const std::vector<Scalar>& items() const { return items_; }

    bool operator==(const ConditionValue& other) const {
        return is_list_ == other.is_list_ &&
               (is_list_ ? items_ == other.items_ : scalar_ == other.scalar_);
    }

private:
    Scalar scalar_;
    std::vector<Scalar> items_;
    bool is_list_;
};

struct Condition {
    std::string field;
    ConditionOperator op = ConditionOperator::Eq;
    ConditionValue value;

    Condition() = default;
    Condition(const std::string& field_, ConditionOperator op_, ConditionValue value_)
        : field(field_), op(op_), value(std::move(value_)) {}
};

// Template for the practice and pay item a matching rule produces
struct RuleAction {
    PracticeType practice_type = PracticeType::SiltFence;
    bool is_temporary = true;
    std::string quantity_formula;
    std::string unit;
    std::string location_template;
    std::string justification;
    std::string pay_item_number;
    std::string pay_item_description;
    std::optional<double> estimated_unit_cost;
};

struct RuleSpec {
    static constexpr int DEFAULT_PRIORITY = 100;

    std::string id;
    std::string name;
    std::string source;
    int priority = DEFAULT_PRIORITY;       // Lower is evaluated first
    std::vector<Condition> conditions;     // AND semantics
    RuleAction action;
    std::string notes;
};

} // namespace ecagent

#endif // ECAGENT_RULE_HPP
