#ifndef ECAGENT_FORMULA_HPP
#define ECAGENT_FORMULA_HPP

#include "project.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ecagent {

// Numeric bindings available to formulas, keyed by identifier
using FormulaBindings = std::map<std::string, double>;

/**
 * Node of a parsed quantity formula.
 *
 * Leaves are numeric literals or whitelisted field references; interior nodes
 * are unary negation or one of the four arithmetic operators. Evaluation is a
 * bottom-up tree walk with no side effects.
 */
class FormulaNode {
public:
    virtual ~FormulaNode() = default;

    // Throws: FormulaFieldError, FormulaEvaluationError
    virtual double evaluate(const FormulaBindings& bindings) const = 0;

    // Appends referenced identifiers in source order
    virtual void collect_fields(std::vector<std::string>& out) const = 0;
};

/**
 * Parsed quantity formula. Cheap to copy; the tree is shared and immutable.
 */
class Formula {
public:
    Formula(std::string text, std::shared_ptr<const FormulaNode> root);

    const std::string& text() const { return text_; }

    double evaluate(const FormulaBindings& bindings) const;
    double evaluate(const ProjectInput& project) const;

    std::vector<std::string> referenced_fields() const;

private:
    std::string text_;
    std::shared_ptr<const FormulaNode> root_;
};

/**
 * FormulaEvaluator parses and evaluates the restricted arithmetic language used
 * by rule quantity formulas:
 *
 *   expression := term (('+' | '-') term)*
 *   term       := unary (('*' | '/') unary)*
 *   unary      := ('+' | '-') unary | primary
 *   primary    := NUMBER | IDENTIFIER | '(' expression ')'
 *
 * Identifiers must be one of known_fields(). There are no function calls,
 * comparisons, assignments or control flow, so every formula terminates.
 */
class FormulaEvaluator {
public:
    static const std::vector<std::string>& known_fields();

    static bool is_known_field(const std::string& identifier);

    // Numeric project fields exposed to formulas
    static FormulaBindings bind(const ProjectInput& project);

    /**
     * Parse without evaluating
     * @throws FormulaSyntaxError on malformed input
     * @throws FormulaFieldError on identifiers outside the whitelist
     */
    static Formula parse(const std::string& formula);

    /**
     * Parse and evaluate against a project
     * @throws FormulaSyntaxError, FormulaFieldError, FormulaEvaluationError
     */
    static double evaluate(const std::string& formula, const ProjectInput& project);
};

} // namespace ecagent

#endif // ECAGENT_FORMULA_HPP
