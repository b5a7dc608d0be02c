#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blobvault::net {

// HTTP methods
enum class HttpMethod {
    GET,
    POST,
    DELETE
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_retryable_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    void set_bearer_token(const std::string& token);

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

// HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    static HttpRequest get(const std::string& url);
    static HttpRequest post(const std::string& url, const std::vector<uint8_t>& body);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest del(const std::string& url);
};

// HTTP response
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
};

struct HttpClientConfig {
    size_t max_idle_handles = 16;

    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{300000};  // 5 minutes

    // execute_with_retry: network errors and 429/5xx
    int max_retries = 3;
    std::chrono::milliseconds initial_retry_delay{1000};
    double retry_backoff_multiplier = 2.0;

    // Response size limits (0 = unlimited)
    size_t max_response_size = 256 * 1024 * 1024;

    bool verify_ssl_by_default = true;
    std::string default_ca_bundle;

    std::string user_agent = "blobvault/1.0";

    bool verbose = false;
};

// HTTP client over libcurl easy handles, reusing idle handles between calls.
// Safe for concurrent use.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Synchronous request
    HttpResponse execute(const HttpRequest& request);

    // Synchronous request with retry on network errors and 429/5xx
    HttpResponse execute_with_retry(const HttpRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// URL encoding/decoding
std::string url_encode(const std::string& str);
std::string url_decode(const std::string& str);

// Base64url (no padding), used for JWT segments
std::string base64url_encode(const std::vector<uint8_t>& data);
std::string base64url_encode(const std::string& str);

}  // namespace blobvault::net
