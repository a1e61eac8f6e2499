#include "rules_engine.hpp"
#include "errors.hpp"
#include "formula.hpp"
#include "output_assembler.hpp"
#include <sstream>
#include <stdexcept>

namespace ecagent {

RulesEngine::RulesEngine()
    : repository_(std::make_shared<const RuleRepository>())
{
}

RulesEngine::RulesEngine(std::shared_ptr<const RuleRepository> repository)
    : repository_(std::move(repository))
{
    if (!repository_) {
        throw std::invalid_argument("RulesEngine requires a rule repository");
    }
}

ProjectOutput RulesEngine::process(const ProjectInput& project) const {
    return process(project, current_timestamp());
}

ProjectOutput RulesEngine::process(const ProjectInput& project, const std::string& timestamp) const {
    OutputAssembler assembler(project.project_name);

    for (const auto& rule : repository_->rules()) {
        bool matched = false;
        try {
            matched = conditions_.matches(rule.conditions, project);
        } catch (RuleEvaluationError& e) {
            e.attach_rule(rule.id);
            throw;
        }

        if (!matched) {
            continue;
        }

        double quantity = 0.0;
        try {
            quantity = FormulaEvaluator::evaluate(rule.action.quantity_formula, project);
            if (quantity < 0.0) {
                std::ostringstream oss;
                oss << "negative quantity " << quantity;
                throw FormulaEvaluationError(oss.str());
            }
        } catch (RuleEvaluationError& e) {
            e.attach_rule(rule.id, rule.action.quantity_formula);
            throw;
        }

        assembler.add(rule, quantity);
    }

    return assembler.finish(timestamp);
}

} // namespace ecagent
