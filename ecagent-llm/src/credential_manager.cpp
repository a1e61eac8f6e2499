/**
 * @file credential_manager.cpp
 * @brief Implementation of CredentialManager for OpenAI API keys
 */

#include "credential_manager.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace ecagent {
namespace llm {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

std::string to_string(CredentialSource source) {
    switch (source) {
        case CredentialSource::EXPLICIT: return "EXPLICIT";
        case CredentialSource::ENVIRONMENT: return "ENVIRONMENT";
        case CredentialSource::KEY_FILE: return "KEY_FILE";
        case CredentialSource::NONE: return "NONE";
    }
    return "UNKNOWN";
}

CredentialManager::CredentialManager(const std::string& explicit_key)
    : source_(CredentialSource::NONE) {
    // Try loading the key in priority order
    if (!explicit_key.empty()) {
        api_key_ = explicit_key;
        source_ = CredentialSource::EXPLICIT;
    } else if (load_from_environment()) {
        source_ = CredentialSource::ENVIRONMENT;
    } else if (load_from_file()) {
        source_ = CredentialSource::KEY_FILE;
    }
}

CredentialManager::~CredentialManager() {
    api_key_.clear();
}

const std::string& CredentialManager::get_api_key() const {
    if (api_key_.empty()) {
        throw EcAgentError("No OpenAI API key available. Pass --llm-api-key, set "
                           "OPENAI_API_KEY, or put the key in " + key_file_path());
    }
    return api_key_;
}

std::string CredentialManager::key_file_path() {
    const char* key_file = std::getenv(API_KEY_FILE_ENV);
    if (key_file && *key_file) {
        return key_file;
    }
    return DEFAULT_KEY_FILE;
}

std::string CredentialManager::read_key_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return "";
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return "";
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return trim(buffer.str());
}

std::string CredentialManager::to_string() const {
    std::ostringstream oss;
    oss << "CredentialManager{";
    oss << "source=" << llm::to_string(source_);
    oss << ", api_key=" << (api_key_.empty() ? "<empty>" : Logger::mask_token(api_key_));
    oss << "}";
    return oss.str();
}

void CredentialManager::clear() {
    api_key_.clear();
    source_ = CredentialSource::NONE;
}

bool CredentialManager::load_from_environment() {
    const char* key = std::getenv(API_KEY_ENV);
    if (!key || !*key) {
        return false;
    }
    api_key_ = key;
    return true;
}

bool CredentialManager::load_from_file() {
    std::string key = read_key_file(key_file_path());
    if (key.empty()) {
        return false;
    }
    api_key_ = key;
    return true;
}

} // namespace llm
} // namespace ecagent
