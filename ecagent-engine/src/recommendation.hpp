#ifndef ECAGENT_RECOMMENDATION_HPP
#define ECAGENT_RECOMMENDATION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ecagent {

enum class PracticeType : uint8_t {
    // Temporary practices
    SiltFence = 0,
    InletProtection = 1,
    SedimentTrap = 2,
    TemporarySeeding = 3,
    Mulch = 4,
    ErosionControlBlanket = 5,
    ConstructionEntrance = 6,
    DustControl = 7,

    // Permanent practices
    PermanentSeeding = 8,
    Sodding = 9,
    Riprap = 10,
    RetainingWall = 11,
    Bioswale = 12,
    DetentionBasin = 13
};

// Wire names ("silt_fence"); parse returns nullopt for unrecognized values
std::string to_string(PracticeType type);
std::optional<PracticeType> parse_practice_type(const std::string& value);

// Recommended erosion control measure, traceable to the rule that produced it
struct ECPractice {
    PracticeType practice_type = PracticeType::SiltFence;
    bool is_temporary = true;
    double quantity = 0.0;
    std::string unit;
    std::string location;
    std::string rule_id;
    std::string rule_source;
    std::string justification;
    std::string notes;

    // Identifier carried by the matching PayItem: "<practice_type>_<rule_id>"
    std::string reference() const;
};

// Construction billing line, one per ECPractice
struct PayItem {
    std::string item_number;
    std::string description;
    double quantity = 0.0;
    std::string unit;
    std::optional<double> estimated_unit_cost;
    std::string ec_practice_ref;
    std::string rule_id;
    std::string rule_source;

    // quantity × unit cost, 0 when no cost estimate is available
    double extended_cost() const {
        return estimated_unit_cost ? quantity * *estimated_unit_cost : 0.0;
    }
};

struct ProjectSummary {
    size_t total_temporary_practices = 0;
    size_t total_permanent_practices = 0;
    size_t total_pay_items = 0;
    double total_estimated_cost = 0.0;
};

// Result of one engine run
struct ProjectOutput {
    std::string project_name;
    std::string timestamp;
    std::vector<ECPractice> temporary_practices;
    std::vector<ECPractice> permanent_practices;
    std::vector<PayItem> pay_items;
    ProjectSummary summary;
};

// Local time, ISO-8601 with milliseconds
std::string current_timestamp();

} // namespace ecagent

#endif // ECAGENT_RECOMMENDATION_HPP
