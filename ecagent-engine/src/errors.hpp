/**
 * @file errors.hpp
 * @brief Exception hierarchy for the EC rules engine
 *
 * Load-time errors (rule files, rule validation, project input, config) are fatal
 * to the setup step that raised them. Evaluation errors derive from
 * RuleEvaluationError and are fatal to the current process() call; the engine
 * attaches the offending rule id (and formula text) before rethrowing so the
 * message identifies the rule without further digging.
 */

#ifndef ECAGENT_ERRORS_HPP
#define ECAGENT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ecagent {

/**
 * @brief Base exception for all EC agent errors
 */
class EcAgentError : public std::runtime_error {
public:
    explicit EcAgentError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when a rule fails validation while the rule set is built
 */
class RuleValidationError : public EcAgentError {
public:
    RuleValidationError(const std::string& rule_id, const std::string& defect)
        : EcAgentError("Invalid rule '" + rule_id + "': " + defect),
          rule_id_(rule_id), defect_(defect) {}

    const std::string& rule_id() const { return rule_id_; }
    const std::string& defect() const { return defect_; }

private:
    std::string rule_id_;
    std::string defect_;
};

/**
 * @brief Raised when a rule file cannot be read or is structurally malformed
 */
class RuleFileError : public EcAgentError {
public:
    explicit RuleFileError(const std::string& message)
        : EcAgentError("Rule file error: " + message) {}
};

/**
 * @brief Raised when a project input document is malformed or out of range
 */
class ProjectInputError : public EcAgentError {
public:
    explicit ProjectInputError(const std::string& message)
        : EcAgentError("Invalid project input: " + message) {}
};

/**
 * @brief Raised when a JSON/YAML document cannot be read or parsed
 */
class DocumentError : public EcAgentError {
public:
    explicit DocumentError(const std::string& message)
        : EcAgentError(message) {}
};

/**
 * @brief Raised when the agent configuration file is invalid
 */
class ConfigParseError : public EcAgentError {
public:
    explicit ConfigParseError(const std::string& message)
        : EcAgentError(message) {}
};

/**
 * @brief Base for errors raised while evaluating a rule against a project
 *
 * what() is rebuilt whenever rule context is attached, so callers that catch
 * by reference and rethrow keep the original dynamic type.
 */
class RuleEvaluationError : public EcAgentError {
public:
    explicit RuleEvaluationError(const std::string& detail)
        : EcAgentError(detail), detail_(detail), message_(detail) {}

    const char* what() const noexcept override { return message_.c_str(); }

    const std::string& detail() const { return detail_; }
    const std::string& rule_id() const { return rule_id_; }
    const std::string& formula() const { return formula_; }

    void attach_rule(const std::string& rule_id, const std::string& formula = "") {
        rule_id_ = rule_id;
        if (!formula.empty()) {
            formula_ = formula;
        }
        message_ = "Rule '" + rule_id_ + "': " + detail_;
        if (!formula_.empty()) {
            message_ += " (formula: '" + formula_ + "')";
        }
    }

private:
    std::string detail_;
    std::string rule_id_;
    std::string formula_;
    std::string message_;
};

/**
 * @brief Raised when a condition references a field the evaluator cannot resolve
 */
class ConditionFieldError : public RuleEvaluationError {
public:
    explicit ConditionFieldError(const std::string& field)
        : RuleEvaluationError("Unknown condition field: '" + field + "'"), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/**
 * @brief Raised when an ordering operator meets a non-numeric operand
 */
class ConditionTypeError : public RuleEvaluationError {
public:
    ConditionTypeError(const std::string& field, const std::string& op)
        : RuleEvaluationError("Operator '" + op + "' requires numeric operands (field '" + field + "')"),
          field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/**
 * @brief Raised when a quantity formula is not well formed
 */
class FormulaSyntaxError : public RuleEvaluationError {
public:
    FormulaSyntaxError(const std::string& message, size_t position)
        : RuleEvaluationError("Formula syntax error at offset " + std::to_string(position) + ": " + message),
          position_(position) {}

    size_t position() const { return position_; }

private:
    size_t position_;
};

/**
 * @brief Raised when a formula references an identifier outside the whitelist
 */
class FormulaFieldError : public RuleEvaluationError {
public:
    explicit FormulaFieldError(const std::string& identifier)
        : RuleEvaluationError("Unknown formula identifier: '" + identifier + "'"),
          identifier_(identifier) {}

    const std::string& identifier() const { return identifier_; }

private:
    std::string identifier_;
};

/**
 * @brief Raised when a well-formed formula cannot produce a usable quantity
 */
class FormulaEvaluationError : public RuleEvaluationError {
public:
    explicit FormulaEvaluationError(const std::string& message)
        : RuleEvaluationError("Formula evaluation failed: " + message) {}
};

} // namespace ecagent

#endif // ECAGENT_ERRORS_HPP
