#include "project.hpp"
#include "errors.hpp"
#include <iomanip>
#include <sstream>

namespace ecagent {

std::string scalar_to_string(const Scalar& value) {
    if (std::holds_alternative<bool>(value)) {
        return std::get<bool>(value) ? "true" : "false";
    }
    if (std::holds_alternative<double>(value)) {
        std::ostringstream oss;
        oss << std::setprecision(15) << std::get<double>(value);
        return oss.str();
    }
    return std::get<std::string>(value);
}

std::string to_string(SoilType soil) {
    switch (soil) {
        case SoilType::Clay: return "clay";
        case SoilType::Silt: return "silt";
        case SoilType::Sand: return "sand";
        case SoilType::Gravel: return "gravel";
        case SoilType::Loam: return "loam";
        case SoilType::Bedrock: return "bedrock";
    }
    return "unknown";
}

std::string to_string(SlopeType slope) {
    switch (slope) {
        case SlopeType::Flat: return "flat";
        case SlopeType::Gentle: return "gentle";
        case SlopeType::Moderate: return "moderate";
        case SlopeType::Steep: return "steep";
        case SlopeType::VerySteep: return "very_steep";
    }
    return "unknown";
}

std::optional<SoilType> parse_soil_type(const std::string& value) {
    if (value == "clay") return SoilType::Clay;
    if (value == "silt") return SoilType::Silt;
    if (value == "sand") return SoilType::Sand;
    if (value == "gravel") return SoilType::Gravel;
    if (value == "loam") return SoilType::Loam;
    if (value == "bedrock") return SoilType::Bedrock;
    return std::nullopt;
}

std::optional<SlopeType> parse_slope_type(const std::string& value) {
    if (value == "flat") return SlopeType::Flat;
    if (value == "gentle") return SlopeType::Gentle;
    if (value == "moderate") return SlopeType::Moderate;
    if (value == "steep") return SlopeType::Steep;
    if (value == "very_steep") return SlopeType::VerySteep;
    return std::nullopt;
}

double ProjectInput::total_drainage_area_acres() const {
    double total = 0.0;
    for (const auto& feature : drainage_features) {
        total += feature.drainage_area_acres;
    }
    return total;
}

void validate_project(const ProjectInput& project) {
    if (project.project_name.empty()) {
        throw ProjectInputError("project_name must not be empty");
    }
    if (project.jurisdiction.empty()) {
        throw ProjectInputError("jurisdiction must not be empty");
    }
    if (!(project.total_disturbed_acres > 0.0)) {
        throw ProjectInputError("total_disturbed_acres must be greater than 0");
    }
    if (project.average_slope_percent < 0.0 || project.average_slope_percent > 100.0) {
        throw ProjectInputError("average_slope_percent must be between 0 and 100");
    }

    for (size_t i = 0; i < project.drainage_features.size(); ++i) {
        const auto& feature = project.drainage_features[i];
        if (feature.id.empty()) {
            throw ProjectInputError("drainage_features[" + std::to_string(i) + "].id must not be empty");
        }
        if (!(feature.drainage_area_acres > 0.0)) {
            throw ProjectInputError("drainage feature '" + feature.id +
                "': drainage_area_acres must be greater than 0");
        }
    }

    for (size_t i = 0; i < project.phases.size(); ++i) {
        const auto& phase = project.phases[i];
        if (phase.phase_id.empty()) {
            throw ProjectInputError("phases[" + std::to_string(i) + "].phase_id must not be empty");
        }
        if (phase.duration_days <= 0) {
            throw ProjectInputError("phase '" + phase.phase_id + "': duration_days must be greater than 0");
        }
        if (phase.disturbed_acres < 0.0) {
            throw ProjectInputError("phase '" + phase.phase_id + "': disturbed_acres must not be negative");
        }
    }
}

} // namespace ecagent
