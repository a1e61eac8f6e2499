#ifndef ECAGENT_RULE_REPOSITORY_HPP
#define ECAGENT_RULE_REPOSITORY_HPP

#include "rule.hpp"
#include <string>
#include <vector>

namespace ecagent {

/**
 * RuleRepository owns the validated, priority-ordered rule set.
 *
 * The set is the built-in catalogue merged with optional custom rules. A custom
 * rule whose id matches an existing rule replaces it in place; other custom rules
 * are appended. After the merge every rule is validated and the list is
 * stable-sorted by ascending priority, so equal priorities keep insertion order.
 *
 * The repository is immutable after construction and safe to share between
 * threads.
 */
class RuleRepository {
public:
    static constexpr const char* CATALOGUE_VERSION = "2024.1";

    // Built-in catalogue only
    RuleRepository();

    /**
     * Merge custom rules over the catalogue
     * @param custom Custom rules in file order
     * @param include_defaults When false the catalogue is skipped and only custom rules are used
     * @throws RuleValidationError on the first invalid rule
     */
    explicit RuleRepository(const std::vector<RuleSpec>& custom, bool include_defaults = true);

    const std::vector<RuleSpec>& rules() const { return rules_; }

    // nullptr when no rule has this id
    const RuleSpec* find(const std::string& id) const;

    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }
    size_t custom_rule_count() const { return custom_rule_count_; }
    std::string catalogue_version() const { return CATALOGUE_VERSION; }

    // The built-in catalogue in catalogue order
    static std::vector<RuleSpec> default_rules();

    // Ordered-map merge by id; no validation, no sorting
    static std::vector<RuleSpec> merge(const std::vector<RuleSpec>& base,
                                       const std::vector<RuleSpec>& custom);

    /**
     * Check one rule for structural and semantic defects
     * @throws RuleValidationError naming the rule and the defect
     */
    static void validate_rule(const RuleSpec& rule);

private:
    std::vector<RuleSpec> rules_;
    size_t custom_rule_count_;

    void build(const std::vector<RuleSpec>& base, const std::vector<RuleSpec>& custom);
};

} // namespace ecagent

#endif // ECAGENT_RULE_REPOSITORY_HPP
