#ifndef ECAGENT_PROJECT_HPP
#define ECAGENT_PROJECT_HPP

#include "scalar.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ecagent {

enum class SoilType : uint8_t {
    Clay = 0,
    Silt = 1,
    Sand = 2,
    Gravel = 3,
    Loam = 4,
    Bedrock = 5
};

enum class SlopeType : uint8_t {
    Flat = 0,       // 0-5%
    Gentle = 1,     // 5-15%
    Moderate = 2,   // 15-25%
    Steep = 3,      // 25-50%
    VerySteep = 4   // >50%
};

// Wire names ("clay", "very_steep"); parse returns nullopt for unrecognized values
std::string to_string(SoilType soil);
std::string to_string(SlopeType slope);
std::optional<SoilType> parse_soil_type(const std::string& value);
std::optional<SlopeType> parse_slope_type(const std::string& value);

// Inlet, outfall, culvert, ...
struct DrainageFeature {
    std::string id;
    std::string type;
    std::string location;
    double drainage_area_acres = 0.0;
    std::map<std::string, std::string> additional_properties;
};

struct ProjectPhase {
    std::string phase_id;
    std::string name;
    int duration_days = 0;
    double disturbed_acres = 0.0;
    std::string description;
};

// Characteristics of one roadway project. The engine only ever reads it.
struct ProjectInput {
    std::string project_name;
    std::string jurisdiction;
    double total_disturbed_acres = 0.0;
    SoilType predominant_soil = SoilType::Loam;
    SlopeType predominant_slope = SlopeType::Flat;
    double average_slope_percent = 0.0;
    std::vector<DrainageFeature> drainage_features;
    std::vector<ProjectPhase> phases;
    std::map<std::string, Scalar> metadata;

    bool has_drainage_features() const { return !drainage_features.empty(); }
    size_t drainage_feature_count() const { return drainage_features.size(); }
    size_t phase_count() const { return phases.size(); }
    double total_drainage_area_acres() const;
};

// Range checks mirrored from the input schema.
// Throws: ProjectInputError naming the first offending field
void validate_project(const ProjectInput& project);

} // namespace ecagent

#endif // ECAGENT_PROJECT_HPP
