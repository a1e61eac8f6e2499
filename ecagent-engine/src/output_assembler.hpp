#ifndef ECAGENT_OUTPUT_ASSEMBLER_HPP
#define ECAGENT_OUTPUT_ASSEMBLER_HPP

#include "recommendation.hpp"
#include "rule.hpp"
#include <string>

namespace ecagent {

// Accumulates practices and pay items for one engine run.
// Each add() produces one ECPractice and the PayItem linked to it.
class OutputAssembler {
public:
    explicit OutputAssembler(std::string project_name);

    // Append the practice (to the temporary or permanent list) and its pay item
    void add(const RuleSpec& rule, double quantity);

    // Compute the summary and hand over the result; the assembler is empty afterwards
    ProjectOutput finish(const std::string& timestamp);

    size_t practice_count() const {
        return output_.temporary_practices.size() + output_.permanent_practices.size();
    }

    // Counts and total_estimated_cost = sum(quantity * unit cost) over pay items
    static ProjectSummary summarize(const ProjectOutput& output);

    static ECPractice build_practice(const RuleSpec& rule, double quantity);
    static PayItem build_pay_item(const RuleSpec& rule, const ECPractice& practice);

private:
    ProjectOutput output_;
};

} // namespace ecagent

#endif // ECAGENT_OUTPUT_ASSEMBLER_HPP
