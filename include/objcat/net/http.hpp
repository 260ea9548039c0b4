#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace objcat::net {

// HTTP methods
enum class HttpMethod {
    GET,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_server_error_status(int status);
bool is_retryable_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    std::optional<uint64_t> content_length() const;

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

    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{300000};

    // Inclusive byte range, sent as "Range: bytes=first-second"
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;

    // Transfer is aborted as soon as this flag reads true
    const std::atomic<bool>* cancel_flag = nullptr;

    // Largest success body accepted; a longer one fails with status 413
    // (0 = unlimited)
    uint64_t max_response_size = 0;

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
};

// HTTP response
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds total_time{0};

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
    bool cancelled = false;         // True if aborted through cancel_flag
};

// HTTP client configuration
struct HttpClientConfig {
    // Upper bound on pooled idle handles
    size_t max_idle_connections = 64;

    bool tcp_keepalive = true;
    std::chrono::seconds tcp_keepalive_idle{60};
    std::chrono::seconds tcp_keepalive_interval{15};

    bool verify_ssl = true;
    std::string ca_bundle;

    std::string user_agent = "objcat/1.0";

    std::chrono::seconds dns_cache_timeout{60};
};

// HTTP client with a shared, thread-safe handle pool.
// execute() may be called concurrently from any number of threads.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// AWS SigV4 signing helper (used for S3)
class AwsSigV4Signer {
public:
    AwsSigV4Signer(const std::string& access_key_id,
                   const std::string& secret_access_key,
                   const std::string& region,
                   const std::string& service);

    void sign(HttpRequest& request) const;

    // Sign with session token (for STS credentials)
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

    // Sign at a fixed time; "YYYYMMDDTHHMMSSZ"
    void sign_at(HttpRequest& request, const std::string& datetime) const;

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;

    std::string get_canonical_request(const HttpRequest& request,
                                      const std::string& signed_headers,
                                      const std::string& payload_hash) const;
    std::string get_string_to_sign(const std::string& datetime,
                                   const std::string& date,
                                   const std::string& canonical_request) const;
    std::string calculate_signature(const std::string& date,
                                    const std::string& string_to_sign) const;
};

// URL parsing helper
struct ParsedUrl {
    std::string scheme;   // http, https
    std::string host;
    int port = 0;         // 0 = default for scheme
    std::string path;
    std::string query;

    // Host header value: host plus port when it is not the scheme default
    std::string authority() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

// Percent-encode everything except RFC 3986 unreserved characters
std::string url_encode(const std::string& str);

// As url_encode, but '/' is kept (object key paths)
std::string url_encode_path(const std::string& str);

} // namespace objcat::net
