#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/errors.hpp"
#include "../src/rules_engine.hpp"
#include <thread>
#include <vector>

using namespace ecagent;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

ProjectInput clay_moderate_project() {
    ProjectInput project;
    project.project_name = "County Road 12 Realignment";
    project.jurisdiction = "Sonoma County";
    project.total_disturbed_acres = 5.2;
    project.predominant_soil = SoilType::Clay;
    project.predominant_slope = SlopeType::Moderate;
    project.average_slope_percent = 18.5;
    return project;
}

RuleSpec custom_rule(const std::string& id, int priority, const std::string& formula) {
    RuleSpec rule;
    rule.id = id;
    rule.name = "Custom " + id;
    rule.source = "Project Special Provisions";
    rule.priority = priority;
    rule.action.practice_type = PracticeType::SedimentTrap;
    rule.action.is_temporary = true;
    rule.action.quantity_formula = formula;
    rule.action.unit = "EA";
    rule.action.location_template = "Low point";
    rule.action.justification = "Capture sediment";
    rule.action.pay_item_number = "EC-020";
    rule.action.pay_item_description = "Sediment Trap";
    rule.action.estimated_unit_cost = 800.0;
    return rule;
}

std::shared_ptr<const RuleRepository> repository_with(const std::vector<RuleSpec>& custom,
                                                      bool include_defaults = true) {
    return std::make_shared<const RuleRepository>(custom, include_defaults);
}

} // anonymous namespace

TEST_CASE("RulesEngine default catalogue on a clay, moderate-slope site", "[engine]") {
    RulesEngine engine;
    ProjectInput project = clay_moderate_project();

    ProjectOutput output = engine.process(project, "2024-01-01T00:00:00.000");

    REQUIRE(output.project_name == "County Road 12 Realignment");
    REQUIRE(output.timestamp == "2024-01-01T00:00:00.000");

    // Silt fence and construction entrance; no drainage features, not steep
    REQUIRE(output.temporary_practices.size() == 2);
    REQUIRE(output.permanent_practices.size() == 1);
    REQUIRE(output.pay_items.size() == 3);

    SECTION("Silt fence quantity and pay item") {
        const ECPractice& silt = output.temporary_practices[0];
        REQUIRE(silt.practice_type == PracticeType::SiltFence);
        REQUIRE_THAT(silt.quantity, WithinRel(1040.0, 1e-9));
        REQUIRE(silt.unit == "LF");
        REQUIRE(silt.rule_id == "SILT_FENCE_001");
        REQUIRE(silt.rule_source == "EPA NPDES CGP");
        REQUIRE(silt.location == "Perimeter of disturbed area");

        const PayItem& item = output.pay_items[0];
        REQUIRE(item.item_number == "EC-001");
        REQUIRE(item.ec_practice_ref == "silt_fence_SILT_FENCE_001");
        REQUIRE_THAT(item.extended_cost(), WithinRel(3640.0, 1e-9));
    }

    SECTION("Construction entrance and permanent seeding") {
        REQUIRE(output.temporary_practices[1].practice_type == PracticeType::ConstructionEntrance);
        REQUIRE(output.temporary_practices[1].quantity == 1.0);

        const ECPractice& seeding = output.permanent_practices[0];
        REQUIRE(seeding.practice_type == PracticeType::PermanentSeeding);
        REQUIRE_FALSE(seeding.is_temporary);
        REQUIRE_THAT(seeding.quantity, WithinRel(5.2, 1e-12));
    }

    SECTION("Summary totals") {
        REQUIRE(output.summary.total_temporary_practices == 2);
        REQUIRE(output.summary.total_permanent_practices == 1);
        REQUIRE(output.summary.total_pay_items == 3);
        // 1040 * 3.50 + 1 * 1500 + 5.2 * 500
        REQUIRE_THAT(output.summary.total_estimated_cost, WithinAbs(7740.0, 1e-6));
    }
}

TEST_CASE("RulesEngine drainage and steep slope rules", "[engine]") {
    RulesEngine engine;
    ProjectInput project = clay_moderate_project();
    project.predominant_slope = SlopeType::VerySteep;
    project.average_slope_percent = 55.0;
    project.drainage_features.push_back({"INL-1", "inlet", "STA 1+00", 0.8, {}});
    project.drainage_features.push_back({"INL-2", "inlet", "STA 3+00", 1.1, {}});
    project.drainage_features.push_back({"CUL-1", "culvert", "STA 5+00", 4.0, {}});

    ProjectOutput output = engine.process(project);

    REQUIRE(output.pay_items.size() == 5);
    REQUIRE(output.temporary_practices.size() == 3);
    REQUIRE(output.permanent_practices.size() == 2);

    const ECPractice& inlet = output.temporary_practices[1];
    REQUIRE(inlet.practice_type == PracticeType::InletProtection);
    REQUIRE(inlet.quantity == 3.0);
    REQUIRE(inlet.unit == "EA");

    const ECPractice& blanket = output.permanent_practices[0];
    REQUIRE(blanket.practice_type == PracticeType::ErosionControlBlanket);
    REQUIRE_THAT(blanket.quantity, WithinRel(5.2 * 43560.0 / 9.0, 1e-12));
    REQUIRE(blanket.unit == "SY");

    SECTION("Pay items follow rule priority order") {
        std::vector<std::string> numbers;
        for (const auto& item : output.pay_items) {
            numbers.push_back(item.item_number);
        }
        std::vector<std::string> expected = {"EC-001", "EC-002", "EC-005", "EC-003", "EC-010"};
        REQUIRE(numbers == expected);
    }
}

TEST_CASE("RulesEngine small site skips the construction entrance", "[engine]") {
    RulesEngine engine;
    ProjectInput project = clay_moderate_project();
    project.total_disturbed_acres = 0.5;

    ProjectOutput output = engine.process(project);

    REQUIRE(output.temporary_practices.size() == 1);
    REQUIRE(output.temporary_practices[0].practice_type == PracticeType::SiltFence);
    REQUIRE_THAT(output.temporary_practices[0].quantity, WithinRel(100.0, 1e-12));
}

TEST_CASE("RulesEngine traceability", "[engine]") {
    RulesEngine engine;
    ProjectInput project = clay_moderate_project();
    project.drainage_features.push_back({"INL-1", "inlet", "STA 1+00", 0.8, {}});

    ProjectOutput output = engine.process(project);

    std::vector<ECPractice> practices = output.temporary_practices;
    practices.insert(practices.end(), output.permanent_practices.begin(), output.permanent_practices.end());
    REQUIRE(practices.size() == output.pay_items.size());

    for (const auto& practice : practices) {
        const RuleSpec* rule = engine.repository().find(practice.rule_id);
        REQUIRE(rule != nullptr);
        REQUIRE(practice.rule_source == rule->source);

        int refs = 0;
        for (const auto& item : output.pay_items) {
            if (item.ec_practice_ref == practice.reference()) {
                ++refs;
                REQUIRE(item.rule_id == practice.rule_id);
                REQUIRE(item.quantity == practice.quantity);
                REQUIRE(item.unit == practice.unit);
            }
        }
        REQUIRE(refs == 1);
    }
}

TEST_CASE("RulesEngine with custom rules", "[engine]") {
    ProjectInput project = clay_moderate_project();

    SECTION("Override replaces the built-in silt fence rule") {
        RuleSpec silt = RuleRepository::default_rules()[0];
        silt.action.quantity_formula = "total_disturbed_acres * 300";
        silt.source = "State Stormwater Manual";

        RulesEngine engine(repository_with({silt}));
        ProjectOutput output = engine.process(project);

        REQUIRE(output.pay_items.size() == 3);
        REQUIRE_THAT(output.temporary_practices[0].quantity, WithinRel(1560.0, 1e-9));
        REQUIRE(output.temporary_practices[0].rule_source == "State Stormwater Manual");
    }

    SECTION("Conditions on metadata") {
        RuleSpec rule = custom_rule("NIGHT_WORK_001", 5, "2");
        rule.conditions.push_back(Condition("metadata.night_work", ConditionOperator::Eq, Scalar(true)));
        RulesEngine engine(repository_with({rule}));

        REQUIRE(engine.process(project).pay_items.size() == 3);

        project.metadata["night_work"] = Scalar(true);
        ProjectOutput output = engine.process(project);
        REQUIRE(output.pay_items.size() == 4);
        REQUIRE(output.pay_items[0].rule_id == "NIGHT_WORK_001");
    }

    SECTION("Zero quantity is kept") {
        RulesEngine engine(repository_with({custom_rule("ZERO_001", 60, "phase_count")}, false));
        ProjectOutput output = engine.process(project);
        REQUIRE(output.temporary_practices.size() == 1);
        REQUIRE(output.temporary_practices[0].quantity == 0.0);
        REQUIRE(output.summary.total_estimated_cost == 0.0);
    }

    SECTION("Missing unit cost contributes nothing to the total") {
        RuleSpec rule = custom_rule("NO_COST_001", 60, "4");
        rule.action.estimated_unit_cost.reset();
        RulesEngine engine(repository_with({rule}, false));
        ProjectOutput output = engine.process(project);
        REQUIRE_FALSE(output.pay_items[0].estimated_unit_cost.has_value());
        REQUIRE(output.summary.total_estimated_cost == 0.0);
    }

    SECTION("Empty rule set gives an empty result") {
        RulesEngine engine(repository_with({}, false));
        ProjectOutput output = engine.process(project);
        REQUIRE(output.temporary_practices.empty());
        REQUIRE(output.permanent_practices.empty());
        REQUIRE(output.pay_items.empty());
        REQUIRE(output.summary.total_pay_items == 0);
        REQUIRE(output.summary.total_estimated_cost == 0.0);
    }
}

TEST_CASE("RulesEngine fails fast with rule context", "[engine]") {
    ProjectInput project = clay_moderate_project();

    SECTION("Division by zero names the rule and formula") {
        RulesEngine engine(repository_with({custom_rule("DIV_ZERO_001", 60, "total_disturbed_acres / phase_count")}));
        try {
            engine.process(project);
            FAIL("expected FormulaEvaluationError");
        } catch (const FormulaEvaluationError& e) {
            REQUIRE(e.rule_id() == "DIV_ZERO_001");
            REQUIRE(e.formula() == "total_disturbed_acres / phase_count");
            REQUIRE_THAT(std::string(e.what()), ContainsSubstring("DIV_ZERO_001") &&
                                                ContainsSubstring("division by zero"));
        }
    }

    SECTION("Negative quantity") {
        RulesEngine engine(repository_with({custom_rule("NEGATIVE_001", 60, "phase_count - 1")}, false));
        REQUIRE_THROWS_AS(engine.process(project), FormulaEvaluationError);
        REQUIRE_THROWS_WITH(engine.process(project), ContainsSubstring("NEGATIVE_001") &&
                                                     ContainsSubstring("negative quantity"));
    }

    SECTION("Type mismatch in a metadata condition") {
        RuleSpec rule = custom_rule("LANES_001", 60, "1");
        rule.conditions.push_back(Condition("metadata.lanes", ConditionOperator::Gt, Scalar(2.0)));
        project.metadata["lanes"] = Scalar(std::string("four"));

        RulesEngine engine(repository_with({rule}, false));
        try {
            engine.process(project);
            FAIL("expected ConditionTypeError");
        } catch (const ConditionTypeError& e) {
            REQUIRE(e.rule_id() == "LANES_001");
            REQUIRE(e.field() == "metadata.lanes");
        }
    }

    SECTION("Unknown formula field is rejected before any project is seen") {
        REQUIRE_THROWS_AS(repository_with({custom_rule("BAD_001", 60, "unknown_field * 2")}),
                          RuleValidationError);
    }

    SECTION("Formula of a non-matching rule is never evaluated") {
        RuleSpec rule = custom_rule("GUARDED_001", 60, "1 / phase_count");
        rule.conditions.push_back(Condition("phase_count", ConditionOperator::Gt, Scalar(0.0)));
        RulesEngine engine(repository_with({rule}));
        REQUIRE_NOTHROW(engine.process(project));
    }
}

TEST_CASE("RulesEngine is deterministic", "[engine]") {
    RulesEngine engine;
    ProjectInput project = clay_moderate_project();
    project.drainage_features.push_back({"INL-1", "inlet", "STA 1+00", 0.8, {}});

    ProjectOutput first = engine.process(project, "t");
    ProjectOutput second = engine.process(project, "t");

    REQUIRE(first.pay_items.size() == second.pay_items.size());
    for (size_t i = 0; i < first.pay_items.size(); ++i) {
        REQUIRE(first.pay_items[i].ec_practice_ref == second.pay_items[i].ec_practice_ref);
        REQUIRE(first.pay_items[i].quantity == second.pay_items[i].quantity);
    }
    REQUIRE(first.summary.total_estimated_cost == second.summary.total_estimated_cost);

    SECTION("Concurrent runs on one engine") {
        std::vector<ProjectOutput> results(4);
        std::vector<std::thread> threads;
        for (size_t i = 0; i < results.size(); ++i) {
            threads.emplace_back([&engine, &project, &results, i]() {
                results[i] = engine.process(project, "t");
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        for (const auto& result : results) {
            REQUIRE(result.summary.total_estimated_cost == first.summary.total_estimated_cost);
            REQUIRE(result.pay_items.size() == first.pay_items.size());
        }
    }
}

TEST_CASE("RulesEngine rejects a null repository", "[engine]") {
    REQUIRE_THROWS_AS(RulesEngine(nullptr), std::invalid_argument);
}
