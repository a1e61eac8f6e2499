#ifndef ECAGENT_RULES_ENGINE_HPP
#define ECAGENT_RULES_ENGINE_HPP

#include "condition_evaluator.hpp"
#include "project.hpp"
#include "recommendation.hpp"
#include "rule_repository.hpp"
#include <memory>
#include <string>

namespace ecagent {

/**
 * RulesEngine runs one project through the rule set.
 *
 * Rules are visited in repository order. Every rule whose conditions hold
 * contributes exactly one practice and one pay item; priority only orders.
 *
 * Evaluation is fail-fast: the first condition or formula error aborts the run
 * and is rethrown with the rule id (and formula text for formula errors)
 * attached. No partial output is returned.
 *
 * process() is const and touches no shared mutable state, so one engine may be
 * used from several threads at once.
 */
class RulesEngine {
public:
    // Engine over the built-in catalogue
    RulesEngine();

    explicit RulesEngine(std::shared_ptr<const RuleRepository> repository);

    /**
     * Evaluate all rules against a project
     * @throws RuleEvaluationError subclasses, with rule context attached
     */
    ProjectOutput process(const ProjectInput& project) const;

    // Same, with a caller-supplied timestamp
    ProjectOutput process(const ProjectInput& project, const std::string& timestamp) const;

    const RuleRepository& repository() const { return *repository_; }

private:
    std::shared_ptr<const RuleRepository> repository_;
    ConditionEvaluator conditions_;
};

} // namespace ecagent

#endif // ECAGENT_RULES_ENGINE_HPP
