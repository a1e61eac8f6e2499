#ifndef ECAGENT_CONDITION_EVALUATOR_HPP
#define ECAGENT_CONDITION_EVALUATOR_HPP

#include "project.hpp"
#include "rule.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ecagent {

/**
 * ConditionEvaluator decides whether a rule's condition list holds for a project.
 *
 * Resolvable fields are the direct ProjectInput attributes plus the derived
 * fields has_drainage_features, drainage_feature_count, phase_count and
 * total_drainage_area_acres, and "metadata.<key>" for project metadata.
 * Enum attributes resolve to their wire strings.
 *
 * The evaluator is stateless; all methods are pure.
 */
class ConditionEvaluator {
public:
    static constexpr const char* METADATA_PREFIX = "metadata.";

    /**
     * Names of the directly resolvable fields (metadata keys excluded)
     */
    static const std::vector<std::string>& known_fields();

    /**
     * Check whether a field name can be resolved, used at rule-load time
     */
    static bool is_known_field(const std::string& field);

    /**
     * Resolve a field against a project
     * @return The value, or nullopt for a metadata key the project does not carry
     * @throws ConditionFieldError if the field is not resolvable at all
     */
    static std::optional<Scalar> resolve_field(const std::string& field, const ProjectInput& project);

    /**
     * Evaluate a single condition
     * @throws ConditionFieldError for unknown fields
     * @throws ConditionTypeError when gt/gte/lt/lte meet a non-numeric operand
     */
    bool evaluate(const Condition& condition, const ProjectInput& project) const;

    /**
     * AND across the list; an empty list always matches
     */
    bool matches(const std::vector<Condition>& conditions, const ProjectInput& project) const;
};

} // namespace ecagent

#endif // ECAGENT_CONDITION_EVALUATOR_HPP
