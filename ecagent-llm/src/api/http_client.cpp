#include "api/http_client.hpp"
#include "logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <sstream>
#include <thread>

namespace ecagent {
namespace llm {

namespace {

constexpr int RETRY_DELAYS_MS[HttpClient::MAX_RETRIES] = {1000, 2000, 4000};

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// CURL header callback
size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header(buffer, total_size);

    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);

    // Parse header line: "Name: Value\r\n"
    size_t colon_pos = header.find(':');
    if (colon_pos != std::string::npos) {
        std::string name = header.substr(0, colon_pos);
        std::string value = header.substr(colon_pos + 1);

        // Trim whitespace
        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        headers->insert({name, value});
    }

    return total_size;
}

// Frees the header list on every exit path
struct HeaderList {
    curl_slist* list = nullptr;
    ~HeaderList() {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

} // anonymous namespace

struct HttpClient::Impl {
    CURL* curl;

    Impl() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curl = curl_easy_init();
        if (!curl) {
            curl_global_cleanup();
            throw HttpClientError("Failed to initialize CURL");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
        curl_global_cleanup();
    }
};

HttpClient::HttpClient(const std::string& base_url, long timeout_ms, int max_attempts)
    : impl_(std::make_unique<Impl>())
    , base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , max_attempts_(std::clamp(max_attempts, 1, MAX_RETRIES))
    , debug_(false)
{
    // Remove trailing slash from base_url
    if (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

HttpClient::~HttpClient() = default;

bool HttpClient::is_retryable_status(int status_code) {
    if (status_code == 408 || status_code == 429) {
        return true;
    }
    return status_code >= 500 && status_code < 600;
}

std::chrono::milliseconds HttpClient::retry_delay(int attempt) {
    int index = std::clamp(attempt, 0, MAX_RETRIES - 1);
    return std::chrono::milliseconds(RETRY_DELAYS_MS[index]);
}

HttpResponse HttpClient::execute_once(
    const std::string& method,
    const std::string& url,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
{
    Logger& logger = Logger::get_instance();
    auto start = std::chrono::steady_clock::now();

    curl_easy_reset(impl_->curl);
    curl_easy_setopt(impl_->curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(impl_->curl, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(impl_->curl, CURLOPT_POST, 1L);
        curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    HeaderList curl_headers;
    curl_headers.list = curl_slist_append(curl_headers.list, "Content-Type: application/json");

    std::map<std::string, std::string> logged_headers;
    for (const auto& [key, value] : headers) {
        logged_headers["header." + key] = (key == "Authorization") ? "[REDACTED]" : value;
        std::string header_line = key + ": " + value;
        curl_headers.list = curl_slist_append(curl_headers.list, header_line.c_str());
    }
    curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, curl_headers.list);

    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(impl_->curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_HEADERDATA, &response_headers);

    if (debug_) {
        logged_headers["method"] = method;
        logged_headers["url"] = url;
        logger.log_debug(RunContext(), "HTTP request", logged_headers);
    }

    CURLcode res = curl_easy_perform(impl_->curl);

    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    if (res != CURLE_OK) {
        std::string error_msg = "CURL error: ";
        error_msg += curl_easy_strerror(res);
        // A timed-out attempt is retried like an HTTP 408
        throw HttpClientError(error_msg, res == CURLE_OPERATION_TIMEDOUT ? 408 : 0);
    }

    long status_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &status_code);

    if (debug_) {
        logger.log_debug(RunContext(), "HTTP response", {
            {"status", std::to_string(status_code)},
            {"duration_ms", std::to_string(duration.count())}
        });
    }

    if (status_code >= 400) {
        std::ostringstream oss;
        if (status_code == 401) {
            oss << "Authentication failed - check the API key";
        } else if (status_code == 403) {
            oss << "Access denied for this API key";
        } else if (status_code == 404) {
            oss << "Resource not found: " << url;
        } else {
            oss << "HTTP " << status_code << ": " << response_body;
        }
        throw HttpClientError(oss.str(), static_cast<int>(status_code));
    }

    HttpResponse response;
    response.status_code = static_cast<int>(status_code);
    response.body = std::move(response_body);
    response.headers = std::move(response_headers);
    response.duration = duration;
    return response;
}

HttpResponse HttpClient::execute_with_retry(
    const std::string& method,
    const std::string& path,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
{
    const std::string url = base_url_ + path;

    for (int attempt = 0; ; ++attempt) {
        try {
            return execute_once(method, url, body, headers);
        } catch (const HttpClientError& e) {
            // If not retryable or out of attempts, give up
            if (!is_retryable_status(e.status_code()) || attempt + 1 >= max_attempts_) {
                throw;
            }

            if (debug_) {
                Logger::get_instance().log_debug(RunContext(), "HTTP retry", {
                    {"error", e.what()},
                    {"delay_ms", std::to_string(retry_delay(attempt).count())}
                });
            }
            std::this_thread::sleep_for(retry_delay(attempt));
        }
    }
}

HttpResponse HttpClient::post(
    const std::string& path,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
{
    return execute_with_retry("POST", path, body, headers);
}

} // namespace llm
} // namespace ecagent
