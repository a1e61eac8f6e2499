#include "output_assembler.hpp"
#include <utility>

namespace ecagent {

OutputAssembler::OutputAssembler(std::string project_name) {
    output_.project_name = std::move(project_name);
}

void OutputAssembler::add(const RuleSpec& rule, double quantity) {
    ECPractice practice = build_practice(rule, quantity);
    output_.pay_items.push_back(build_pay_item(rule, practice));

    if (practice.is_temporary) {
        output_.temporary_practices.push_back(std::move(practice));
    } else {
        output_.permanent_practices.push_back(std::move(practice));
    }
}

ProjectOutput OutputAssembler::finish(const std::string& timestamp) {
    ProjectOutput result = std::move(output_);
    result.timestamp = timestamp;
    result.summary = summarize(result);

    output_ = ProjectOutput();
    output_.project_name = result.project_name;
    return result;
}

ProjectSummary OutputAssembler::summarize(const ProjectOutput& output) {
    ProjectSummary summary;
    summary.total_temporary_practices = output.temporary_practices.size();
    summary.total_permanent_practices = output.permanent_practices.size();
    summary.total_pay_items = output.pay_items.size();

    for (const auto& item : output.pay_items) {
        summary.total_estimated_cost += item.extended_cost();
    }
    return summary;
}

ECPractice OutputAssembler::build_practice(const RuleSpec& rule, double quantity) {
    const RuleAction& action = rule.action;

    ECPractice practice;
    practice.practice_type = action.practice_type;
    practice.is_temporary = action.is_temporary;
    practice.quantity = quantity;
    practice.unit = action.unit;
    // Copied verbatim, the engine does no template interpolation
    practice.location = action.location_template;
    practice.rule_id = rule.id;
    practice.rule_source = rule.source;
    practice.justification = action.justification;
    practice.notes = rule.notes;
    return practice;
}

PayItem OutputAssembler::build_pay_item(const RuleSpec& rule, const ECPractice& practice) {
    const RuleAction& action = rule.action;

    PayItem item;
    item.item_number = action.pay_item_number;
    item.description = action.pay_item_description;
    item.quantity = practice.quantity;
    item.unit = practice.unit;
    item.estimated_unit_cost = action.estimated_unit_cost;
    item.ec_practice_ref = practice.reference();
    item.rule_id = rule.id;
    item.rule_source = rule.source;
    return item;
}

} // namespace ecagent
