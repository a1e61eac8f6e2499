#include "project_reader.hpp"
#include "document_reader.hpp"
#include "../errors.hpp"
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace ecagent {
namespace io {

namespace {

const json& require(const json& object, const std::string& key, const std::string& where) {
    if (!object.contains(key) || object.at(key).is_null()) {
        throw ProjectInputError("missing required field '" + where + key + "'");
    }
    return object.at(key);
}

std::string get_string(const json& object, const std::string& key, const std::string& where) {
    const json& value = require(object, key, where);
    if (!value.is_string()) {
        throw ProjectInputError("field '" + where + key + "' must be a string");
    }
    return value.get<std::string>();
}

std::string get_optional_string(const json& object, const std::string& key, const std::string& where) {
    if (!object.contains(key) || object.at(key).is_null()) {
        return "";
    }
    return get_string(object, key, where);
}

double get_number(const json& object, const std::string& key, const std::string& where) {
    const json& value = require(object, key, where);
    if (!value.is_number()) {
        throw ProjectInputError("field '" + where + key + "' must be a number");
    }
    return value.get<double>();
}

// Non-string values are kept in their JSON text form
std::string stringify(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

DrainageFeature parse_drainage_feature(const json& j, size_t index) {
    const std::string where = "drainage_features[" + std::to_string(index) + "].";
    if (!j.is_object()) {
        throw ProjectInputError("'drainage_features[" + std::to_string(index) + "]' must be an object");
    }

    DrainageFeature feature;
    feature.id = get_string(j, "id", where);
    feature.type = get_string(j, "type", where);
    feature.location = get_string(j, "location", where);
    feature.drainage_area_acres = get_number(j, "drainage_area_acres", where);

    if (j.contains("additional_properties") && !j["additional_properties"].is_null()) {
        const json& props = j["additional_properties"];
        if (!props.is_object()) {
            throw ProjectInputError("field '" + where + "additional_properties' must be a mapping");
        }
        for (auto it = props.begin(); it != props.end(); ++it) {
            feature.additional_properties[it.key()] = stringify(it.value());
        }
    }
    return feature;
}

ProjectPhase parse_phase(const json& j, size_t index) {
    const std::string where = "phases[" + std::to_string(index) + "].";
    if (!j.is_object()) {
        throw ProjectInputError("'phases[" + std::to_string(index) + "]' must be an object");
    }

    ProjectPhase phase;
    phase.phase_id = get_string(j, "phase_id", where);
    phase.name = get_string(j, "name", where);

    const json& duration = require(j, "duration_days", where);
    if (!duration.is_number_integer()) {
        throw ProjectInputError("field '" + where + "duration_days' must be an integer");
    }
    bool in_range = duration.is_number_unsigned()
        ? duration.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : duration.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
          duration.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw ProjectInputError("field '" + where + "duration_days' is out of range");
    }
    phase.duration_days = static_cast<int>(duration.get<std::int64_t>());

    phase.disturbed_acres = get_number(j, "disturbed_acres", where);
    phase.description = get_optional_string(j, "description", where);
    return phase;
}

Scalar parse_metadata_value(const std::string& key, const json& value) {
    if (value.is_boolean()) {
        return Scalar(value.get<bool>());
    }
    if (value.is_number()) {
        return Scalar(value.get<double>());
    }
    if (value.is_string()) {
        return Scalar(value.get<std::string>());
    }
    if (value.is_structured()) {
        return Scalar(value.dump());
    }
    throw ProjectInputError("metadata value '" + key + "' is not supported");
}

} // anonymous namespace

ProjectInput parse_project(const json& document) {
    if (!document.is_object()) {
        throw ProjectInputError("project document must be a mapping");
    }

    ProjectInput project;
    project.project_name = get_string(document, "project_name", "");
    project.jurisdiction = get_string(document, "jurisdiction", "");
    project.total_disturbed_acres = get_number(document, "total_disturbed_acres", "");
    project.average_slope_percent = get_number(document, "average_slope_percent", "");

    std::string soil = get_string(document, "predominant_soil", "");
    auto soil_type = parse_soil_type(soil);
    if (!soil_type) {
        throw ProjectInputError("unrecognized predominant_soil '" + soil + "'");
    }
    project.predominant_soil = *soil_type;

    std::string slope = get_string(document, "predominant_slope", "");
    auto slope_type = parse_slope_type(slope);
    if (!slope_type) {
        throw ProjectInputError("unrecognized predominant_slope '" + slope + "'");
    }
    project.predominant_slope = *slope_type;

    if (document.contains("drainage_features") && !document["drainage_features"].is_null()) {
        const json& features = document["drainage_features"];
        if (!features.is_array()) {
            throw ProjectInputError("field 'drainage_features' must be a list");
        }
        for (size_t i = 0; i < features.size(); ++i) {
            project.drainage_features.push_back(parse_drainage_feature(features[i], i));
        }
    }

    if (document.contains("phases") && !document["phases"].is_null()) {
        const json& phases = document["phases"];
        if (!phases.is_array()) {
            throw ProjectInputError("field 'phases' must be a list");
        }
        for (size_t i = 0; i < phases.size(); ++i) {
            project.phases.push_back(parse_phase(phases[i], i));
        }
    }

    if (document.contains("metadata") && !document["metadata"].is_null()) {
        const json& metadata = document["metadata"];
        if (!metadata.is_object()) {
            throw ProjectInputError("field 'metadata' must be a mapping");
        }
        for (auto it = metadata.begin(); it != metadata.end(); ++it) {
            if (it.value().is_null()) {
                continue;
            }
            project.metadata[it.key()] = parse_metadata_value(it.key(), it.value());
        }
    }

    validate_project(project);
    return project;
}

ProjectInput read_project_file(const std::string& path) {
    json document;
    try {
        document = read_document(path);
    } catch (const DocumentError& e) {
        throw ProjectInputError(e.what());
    }
    return parse_project(document);
}

} // namespace io
} // namespace ecagent
