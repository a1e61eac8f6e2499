#include "document_reader.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ecagent {
namespace io {

namespace {

bool parse_int64(const std::string& value, int64_t& out) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return false;
    }
    out = static_cast<int64_t>(parsed);
    return true;
}

bool parse_double(const std::string& value, double& out) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    out = std::strtod(value.c_str(), &end);
    return end && *end == '\0';
}

json plain_scalar_to_json(const std::string& scalar) {
    if (scalar == "true" || scalar == "True" || scalar == "TRUE") return true;
    if (scalar == "false" || scalar == "False" || scalar == "FALSE") return false;

    int64_t as_int = 0;
    if (parse_int64(scalar, as_int)) {
        return as_int;
    }
    double as_double = 0.0;
    if (parse_double(scalar, as_double)) {
        return as_double;
    }
    return scalar;
}

} // anonymous namespace

DocumentFormat format_from_path(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".json") {
        return DocumentFormat::Json;
    }
    if (ext == ".yaml" || ext == ".yml") {
        return DocumentFormat::Yaml;
    }
    throw DocumentError("Unsupported file extension '" + ext + "' for " + path +
                        " (expected .json, .yaml or .yml)");
}

json yaml_to_json(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) {
        return nullptr;
    }
    if (node.IsScalar()) {
        const std::string scalar = node.as<std::string>();
        // Quoted scalars carry the non-specific tag "!"
        if (node.Tag() == "!") {
            return scalar;
        }
        return plain_scalar_to_json(scalar);
    }
    if (node.IsSequence()) {
        json arr = json::array();
        for (const auto& item : node) {
            arr.push_back(yaml_to_json(item));
        }
        return arr;
    }
    if (node.IsMap()) {
        json obj = json::object();
        for (const auto& pair : node) {
            obj[pair.first.as<std::string>()] = yaml_to_json(pair.second);
        }
        return obj;
    }
    return nullptr;
}

json parse_document(const std::string& text, DocumentFormat format, const std::string& origin) {
    if (format == DocumentFormat::Json) {
        try {
            return json::parse(text);
        } catch (const json::parse_error& e) {
            throw DocumentError("Failed to parse JSON in " + origin + ": " + e.what());
        }
    }

    try {
        return yaml_to_json(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw DocumentError("Failed to parse YAML in " + origin + ": " + e.what());
    }
}

json read_document(const std::string& path) {
    DocumentFormat format = format_from_path(path);

    std::ifstream file(path);
    if (!file.is_open()) {
        throw DocumentError("Failed to open file: " + path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_document(buffer.str(), format, path);
}

} // namespace io
} // namespace ecagent
