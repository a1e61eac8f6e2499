#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace ecagent {
namespace llm {

/**
 * HTTP response structure
 */
struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds duration{0};
};

/**
 * HTTP client error
 */
class HttpClientError : public std::runtime_error {
public:
    HttpClientError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

/**
 * Minimal transport seam used by the enhancers, so tests can replace the network
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * POST a JSON body
     * @param path Path relative to the transport's base URL (may be empty)
     * @throws HttpClientError on transport failure or non-2xx status
     */
    virtual HttpResponse post(const std::string& path,
                              const std::string& body,
                              const std::map<std::string, std::string>& headers = {}) = 0;
};

/**
 * libcurl HTTP client with retry logic and timeout support
 *
 * Features:
 * - Exponential backoff retry (1s, 2s, 4s) on 408, 429 and 5xx
 * - Configurable timeout per attempt
 * - Request logging at DEBUG level with the Authorization header redacted
 *
 * One instance owns one curl handle; do not share an instance between threads.
 */
class HttpClient : public HttpTransport {
public:
    static constexpr int MAX_RETRIES = 3;

    /**
     * Constructor
     * @param base_url Base URL for all requests (e.g., "https://api.openai.com/v1")
     * @param timeout_ms Timeout in milliseconds per attempt (default: 30000)
     * @param max_attempts Attempts before giving up, 1..MAX_RETRIES
     */
    explicit HttpClient(const std::string& base_url, long timeout_ms = 30000,
                        int max_attempts = MAX_RETRIES);

    ~HttpClient() override;

    /**
     * POST request with automatic retry
     * @throws HttpClientError on failure after retries
     */
    HttpResponse post(const std::string& path,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers = {}) override;

    /**
     * Set debug mode (logs requests/responses, redacts tokens)
     */
    void set_debug(bool debug) { debug_ = debug; }
    bool debug() const { return debug_; }

    const std::string& base_url() const { return base_url_; }
    long timeout_ms() const { return timeout_ms_; }
    int max_attempts() const { return max_attempts_; }

    /**
     * Timeout (408), rate limit (429) and server errors (5xx) are retried;
     * auth, not-found and other client errors are not
     */
    static bool is_retryable_status(int status_code);

    /**
     * Delay before retry number attempt (0-based)
     */
    static std::chrono::milliseconds retry_delay(int attempt);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    std::string base_url_;
    long timeout_ms_;
    int max_attempts_;
    bool debug_;

    HttpResponse execute_once(
        const std::string& method,
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers
    );

    HttpResponse execute_with_retry(
        const std::string& method,
        const std::string& path,
        const std::string& body,
        const std::map<std::string, std::string>& headers
    );
};

} // namespace llm
} // namespace ecagent
