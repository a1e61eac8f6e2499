/**
 * @file credential_manager.hpp
 * @brief API key discovery for the OpenAI-compatible enhancer
 *
 * Credential Sources (in priority order):
 * 1. Explicit key passed to the constructor (--llm-api-key or config llm.api_key)
 * 2. Environment variable OPENAI_API_KEY
 * 3. Key file named by OPENAI_API_KEY_FILE, default API_KEY/API_KEY.txt
 *
 * The key is never logged unmasked.
 */

#ifndef ECAGENT_CREDENTIAL_MANAGER_HPP
#define ECAGENT_CREDENTIAL_MANAGER_HPP

#include <string>

namespace ecagent {
namespace llm {

/**
 * @brief Source from which the API key was loaded
 */
enum class CredentialSource {
    EXPLICIT,       ///< Passed directly to constructor
    ENVIRONMENT,    ///< Loaded from OPENAI_API_KEY
    KEY_FILE,       ///< Loaded from the key file
    NONE            ///< No key available
};

std::string to_string(CredentialSource source);

class CredentialManager {
public:
    static constexpr const char* API_KEY_ENV = "OPENAI_API_KEY";
    static constexpr const char* API_KEY_FILE_ENV = "OPENAI_API_KEY_FILE";
    static constexpr const char* DEFAULT_KEY_FILE = "API_KEY/API_KEY.txt";

    /**
     * @brief Discover a key; an empty explicit key falls through to the environment and file
     */
    explicit CredentialManager(const std::string& explicit_key = "");

    ~CredentialManager();

    bool has_api_key() const { return !api_key_.empty(); }

    /**
     * @brief Get the API key
     * @throws EcAgentError if no key was found
     */
    const std::string& get_api_key() const;

    CredentialSource get_source() const { return source_; }

    /**
     * @brief Key file consulted by this process (OPENAI_API_KEY_FILE or the default)
     */
    static std::string key_file_path();

    /**
     * @brief Read and trim a key file; empty when missing or blank
     */
    static std::string read_key_file(const std::string& path);

    /**
     * @brief Get a sanitized string representation for logging
     */
    std::string to_string() const;

    /**
     * @brief Forget the key
     */
    void clear();

private:
    std::string api_key_;
    CredentialSource source_;

    bool load_from_environment();
    bool load_from_file();
};

} // namespace llm
} // namespace ecagent

#endif // ECAGENT_CREDENTIAL_MANAGER_HPP
