#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/errors.hpp"
#include "../src/rule_repository.hpp"

using namespace ecagent;
using Catch::Matchers::ContainsSubstring;

namespace {

RuleSpec make_custom_rule(const std::string& id, int priority, const std::string& formula = "1") {
    RuleSpec rule;
    rule.id = id;
    rule.name = "Custom " + id;
    rule.source = "Test Manual";
    rule.priority = priority;
    rule.conditions.push_back(Condition("total_disturbed_acres", ConditionOperator::Gt, Scalar(0.0)));
    rule.action.practice_type = PracticeType::Mulch;
    rule.action.is_temporary = true;
    rule.action.quantity_formula = formula;
    rule.action.unit = "AC";
    rule.action.location_template = "Exposed soil";
    rule.action.justification = "Cover exposed soil";
    rule.action.pay_item_number = "EC-099";
    rule.action.pay_item_description = "Mulch";
    rule.action.estimated_unit_cost = 100.0;
    return rule;
}

std::vector<std::string> ids_of(const RuleRepository& repository) {
    std::vector<std::string> ids;
    for (const auto& rule : repository.rules()) {
        ids.push_back(rule.id);
    }
    return ids;
}

} // anonymous namespace

TEST_CASE("RuleRepository built-in catalogue", "[repository]") {
    RuleRepository repository;

    REQUIRE(repository.size() == 5);
    REQUIRE(repository.custom_rule_count() == 0);
    REQUIRE(repository.catalogue_version() == "2024.1");

    std::vector<std::string> expected = {
        "SILT_FENCE_001", "INLET_PROT_001", "STEEP_SLOPE_001", "CONSTRUCTION_ENT_001", "PERM_SEED_001"
    };
    REQUIRE(ids_of(repository) == expected);

    SECTION("Silt fence rule") {
        const RuleSpec* rule = repository.find("SILT_FENCE_001");
        REQUIRE(rule != nullptr);
        REQUIRE(rule->priority == 10);
        REQUIRE(rule->source == "EPA NPDES CGP");
        REQUIRE(rule->action.practice_type == PracticeType::SiltFence);
        REQUIRE(rule->action.quantity_formula == "total_disturbed_acres * 200");
        REQUIRE(rule->action.unit == "LF");
        REQUIRE(rule->action.pay_item_number == "EC-001");
        REQUIRE(*rule->action.estimated_unit_cost == 3.50);
    }

    SECTION("Steep slope rule is permanent and uses a list condition") {
        const RuleSpec* rule = repository.find("STEEP_SLOPE_001");
        REQUIRE(rule != nullptr);
        REQUIRE_FALSE(rule->action.is_temporary);
        REQUIRE(rule->conditions.size() == 1);
        REQUIRE(rule->conditions[0].op == ConditionOperator::In);
        REQUIRE(rule->conditions[0].value.is_list());
        REQUIRE(rule->conditions[0].value.items().size() == 2);
    }

    SECTION("Missing id") {
        REQUIRE(repository.find("NOPE") == nullptr);
    }

    SECTION("Every default rule validates") {
        for (const auto& rule : RuleRepository::default_rules()) {
            REQUIRE_NOTHROW(RuleRepository::validate_rule(rule));
        }
    }
}

TEST_CASE("RuleRepository merges custom rules", "[repository]") {
    SECTION("New ids are appended and sorted by priority") {
        RuleRepository repository({make_custom_rule("MULCH_001", 35)});

        REQUIRE(repository.size() == 6);
        REQUIRE(repository.custom_rule_count() == 1);
        std::vector<std::string> expected = {
            "SILT_FENCE_001", "INLET_PROT_001", "STEEP_SLOPE_001", "MULCH_001",
            "CONSTRUCTION_ENT_001", "PERM_SEED_001"
        };
        REQUIRE(ids_of(repository) == expected);
    }

    SECTION("Matching id replaces the built-in rule") {
        RuleSpec override_rule = make_custom_rule("SILT_FENCE_001", 10, "total_disturbed_acres * 250");
        override_rule.action.practice_type = PracticeType::SiltFence;
        override_rule.action.unit = "LF";
        override_rule.action.pay_item_number = "EC-001";
        override_rule.action.estimated_unit_cost = 4.25;

        RuleRepository repository({override_rule});

        REQUIRE(repository.size() == 5);
        const RuleSpec* rule = repository.find("SILT_FENCE_001");
        REQUIRE(rule != nullptr);
        REQUIRE(rule->action.quantity_formula == "total_disturbed_acres * 250");
        REQUIRE(*rule->action.estimated_unit_cost == 4.25);
        REQUIRE(repository.rules().front().id == "SILT_FENCE_001");
    }

    SECTION("Override may move a rule by priority") {
        RuleRepository repository({make_custom_rule("SILT_FENCE_001", 90)});
        std::vector<std::string> ids = ids_of(repository);
        REQUIRE(ids.front() == "INLET_PROT_001");
        REQUIRE(ids[3] == "PERM_SEED_001");
        REQUIRE(ids.back() == "SILT_FENCE_001");
    }

    SECTION("Equal priorities keep insertion order") {
        RuleRepository repository({make_custom_rule("B_RULE", 10), make_custom_rule("A_RULE", 10)});
        std::vector<std::string> ids = ids_of(repository);
        REQUIRE(ids[0] == "SILT_FENCE_001");
        REQUIRE(ids[1] == "B_RULE");
        REQUIRE(ids[2] == "A_RULE");
    }

    SECTION("Later duplicate in the custom list wins") {
        RuleRepository repository({make_custom_rule("DUP", 60, "1"), make_custom_rule("DUP", 60, "2")});
        REQUIRE(repository.size() == 6);
        REQUIRE(repository.custom_rule_count() == 1);
        REQUIRE(repository.find("DUP")->action.quantity_formula == "2");
    }

    SECTION("Override of a built-in rule counts as custom") {
        RuleRepository repository({make_custom_rule("SILT_FENCE_001", 10), make_custom_rule("MULCH_001", 35),
                                   make_custom_rule("SILT_FENCE_001", 15)});
        REQUIRE(repository.size() == 6);
        REQUIRE(repository.custom_rule_count() == 2);
    }

    SECTION("Custom rules only") {
        RuleRepository repository({make_custom_rule("ONLY", 1)}, false);
        REQUIRE(repository.size() == 1);
        REQUIRE(repository.find("SILT_FENCE_001") == nullptr);
    }

    SECTION("Empty rule set") {
        RuleRepository repository({}, false);
        REQUIRE(repository.empty());
    }
}

TEST_CASE("RuleRepository merge keeps slot order", "[repository]") {
    std::vector<RuleSpec> base = {make_custom_rule("A", 1), make_custom_rule("B", 2)};
    std::vector<RuleSpec> custom = {make_custom_rule("C", 3), make_custom_rule("A", 9)};

    std::vector<RuleSpec> merged = RuleRepository::merge(base, custom);

    REQUIRE(merged.size() == 3);
    REQUIRE(merged[0].id == "A");
    REQUIRE(merged[0].priority == 9);
    REQUIRE(merged[1].id == "B");
    REQUIRE(merged[2].id == "C");
}

TEST_CASE("RuleRepository rejects invalid rules", "[repository]") {
    SECTION("Unknown formula identifier") {
        RuleSpec rule = make_custom_rule("BAD_FORMULA", 60, "unknown_field * 2");
        REQUIRE_THROWS_AS(RuleRepository({rule}), RuleValidationError);
        REQUIRE_THROWS_WITH(RuleRepository({rule}), ContainsSubstring("BAD_FORMULA") &&
                                                    ContainsSubstring("unknown_field"));
    }

    SECTION("Malformed formula") {
        RuleSpec rule = make_custom_rule("BAD_SYNTAX", 60, "2 * (");
        REQUIRE_THROWS_WITH(RuleRepository({rule}), ContainsSubstring("quantity_formula"));
    }

    SECTION("Unknown condition field") {
        RuleSpec rule = make_custom_rule("BAD_FIELD", 60);
        rule.conditions.push_back(Condition("soil_kind", ConditionOperator::Eq, Scalar(std::string("clay"))));
        REQUIRE_THROWS_WITH(RuleRepository({rule}), ContainsSubstring("unknown field 'soil_kind'"));
    }

    SECTION("in with a scalar value") {
        RuleSpec rule = make_custom_rule("BAD_IN", 60);
        rule.conditions.push_back(Condition("predominant_soil", ConditionOperator::In,
                                            Scalar(std::string("clay"))));
        REQUIRE_THROWS_WITH(RuleRepository({rule}), ContainsSubstring("requires a list value"));
    }

    SECTION("Ordering operator with a string value") {
        RuleSpec rule = make_custom_rule("BAD_GT", 60);
        rule.conditions.push_back(Condition("total_disturbed_acres", ConditionOperator::Gt,
                                            Scalar(std::string("ten"))));
        REQUIRE_THROWS_WITH(RuleRepository({rule}), ContainsSubstring("requires a numeric value"));
    }

    SECTION("Missing identity and action fields") {
        RuleSpec no_name = make_custom_rule("NO_NAME", 60);
        no_name.name.clear();
        REQUIRE_THROWS_AS(RuleRepository::validate_rule(no_name), RuleValidationError);

        RuleSpec no_unit = make_custom_rule("NO_UNIT", 60);
        no_unit.action.unit.clear();
        REQUIRE_THROWS_AS(RuleRepository::validate_rule(no_unit), RuleValidationError);

        RuleSpec no_pay_item = make_custom_rule("NO_PAY", 60);
        no_pay_item.action.pay_item_number.clear();
        REQUIRE_THROWS_AS(RuleRepository::validate_rule(no_pay_item), RuleValidationError);

        RuleSpec negative_cost = make_custom_rule("NEG_COST", 60);
        negative_cost.action.estimated_unit_cost = -1.0;
        REQUIRE_THROWS_AS(RuleRepository::validate_rule(negative_cost), RuleValidationError);
    }

    SECTION("Error carries the rule id and defect") {
        RuleSpec rule = make_custom_rule("NO_UNIT", 60);
        rule.action.unit.clear();
        try {
            RuleRepository::validate_rule(rule);
            FAIL("expected RuleValidationError");
        } catch (const RuleValidationError& e) {
            REQUIRE(e.rule_id() == "NO_UNIT");
            REQUIRE(e.defect() == "unit must not be empty");
        }
    }

    SECTION("Missing cost is allowed") {
        RuleSpec rule = make_custom_rule("NO_COST", 60);
        rule.action.estimated_unit_cost.reset();
        REQUIRE_NOTHROW(RuleRepository::validate_rule(rule));
    }
}
