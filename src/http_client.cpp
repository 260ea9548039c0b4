#include "objcat/net/http.hpp"
#include "objcat/core/log.hpp"

#include <curl/curl.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string_view>

namespace objcat::net {

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_server_error_status(int status) {
    return status >= 500 && status < 600;
}

bool is_retryable_status(int status) {
    // Server errors, request timeout and rate limiting
    return status == 408 || status == 429 || is_server_error_status(status);
}

static std::string url_encode_impl(const std::string& str, bool keep_slash) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keep_slash && c == '/')) {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string url_encode(const std::string& str) {
    return url_encode_impl(str, false);
}

std::string url_encode_path(const std::string& str) {
    return url_encode_impl(str, true);
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (val) {
        try {
            return std::stoull(*val);
        } catch (const std::invalid_argument&) {
            // Invalid Content-Length header format
        } catch (const std::out_of_range&) {
            // Content-Length value out of range
        }
    }
    return std::nullopt;
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::head(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::HEAD;
    req.url = url;
    return req;
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    size_t pos = scheme_end + 3;

    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) {
        return std::nullopt;
    }

    // IPv6 literal
    if (host_port.front() == '[') {
        size_t bracket_end = host_port.find(']');
        if (bracket_end == std::string::npos) {
            return std::nullopt;
        }
        result.host = host_port.substr(1, bracket_end - 1);
        if (bracket_end + 1 < host_port.size() && host_port[bracket_end + 1] == ':') {
            try {
                result.port = std::stoi(host_port.substr(bracket_end + 2));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    } else {
        size_t colon_pos = host_port.rfind(':');
        if (colon_pos != std::string::npos) {
            result.host = host_port.substr(0, colon_pos);
            try {
                result.port = std::stoi(host_port.substr(colon_pos + 1));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        } else {
            result.host = host_port;
        }
    }

    pos = host_end;

    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) {
            query_end = url.size();
        }
        result.query = url.substr(pos + 1, query_end - pos - 1);
    }

    return result;
}

std::string ParsedUrl::authority() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    bool default_port = port == 0 ||
                        (scheme == "https" && port == 443) ||
                        (scheme == "http" && port == 80);
    if (default_port) return h;
    return h + ":" + std::to_string(port);
}

// ============================================================================
// CURL callback functions
// ============================================================================

namespace {

// Response body accumulation with an optional size ceiling. The ceiling
// applies to success bodies only; error documents are always read whole.
struct BodyBuffer {
    CURL* handle = nullptr;
    std::vector<uint8_t> bytes;
    uint64_t limit = 0;  // 0 = unlimited
    bool overflowed = false;
};

size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<BodyBuffer*>(userdata);
    const size_t n = size * nmemb;
    if (body->limit > 0 && body->bytes.size() + n > body->limit) {
        long status = 0;
        curl_easy_getinfo(body->handle, CURLINFO_RESPONSE_CODE, &status);
        if (is_success_status(static_cast<int>(status))) {
            body->overflowed = true;
            return 0;  // CURLE_WRITE_ERROR
        }
    }
    body->bytes.insert(body->bytes.end(), ptr, ptr + n);
    return n;
}

size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    const size_t n = size * nitems;

    std::string_view line(buffer, n);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // Every status line (redirect, 100-continue) opens a new header block
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders{};
        return n;
    }

    size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
        return n;
    }
    std::string_view value = line.substr(colon + 1);
    size_t first = value.find_first_not_of(" \t");
    value = first == std::string_view::npos ? std::string_view{} : value.substr(first);
    headers->add(std::string(line.substr(0, colon)), std::string(value));
    return n;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int on_progress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const std::atomic<bool>*>(clientp);
    return cancel->load(std::memory_order_relaxed) ? 1 : 0;
}

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

HeaderList build_header_list(const HttpHeaders& headers) {
    curl_slist* list = nullptr;
    for (const auto& [name, value] : headers.all()) {
        std::string line = name + ": " + value;
        curl_slist* grown = curl_slist_append(list, line.c_str());
        if (!grown) break;
        list = grown;
    }
    return HeaderList(list);
}

}  // namespace

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag global_init;
        std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_ALL); });
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (CURL* handle : idle_) {
            curl_easy_cleanup(handle);
        }
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        Lease lease(*this);
        if (!lease.handle) {
            response.error = "cannot allocate a curl handle";
            response.is_network_error = true;
            return response;
        }
        CURL* curl = lease.handle;

        HeaderList header_list = build_header_list(request.headers);
        BodyBuffer body;
        body.handle = curl;
        body.limit = request.max_response_size;

        std::string range;
        if (request.byte_range) {
            range = std::to_string(request.byte_range->first) + "-" +
                    std::to_string(request.byte_range->second);
        }

        configure(curl, request, header_list.get(), range);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        auto started = std::chrono::steady_clock::now();
        CURLcode rc = curl_easy_perform(curl);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        switch (rc) {
            case CURLE_OK: {
                long status = 0;
                curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
                response.status_code = static_cast<int>(status);
                response.body = std::move(body.bytes);
                break;
            }
            case CURLE_ABORTED_BY_CALLBACK:
                response.error = "request cancelled";
                response.cancelled = true;
                break;
            case CURLE_WRITE_ERROR:
                if (body.overflowed) {
                    response.error = "response body larger than " +
                                     std::to_string(body.limit) + " bytes";
                    response.status_code = 413;
                    break;
                }
                [[fallthrough]];
            default:
                response.error = curl_easy_strerror(rc);
                response.is_network_error = true;
                break;
        }

        log_trace("%s %s -> %d in %lldms", http_method_to_string(request.method),
                  request.url.c_str(), response.status_code,
                  static_cast<long long>(response.total_time.count()));
        return response;
    }

private:
    // A pooled handle, returned (reset) to the idle list on destruction
    struct Lease {
        explicit Lease(Impl& owner) : impl(owner), handle(owner.acquire()) {}
        ~Lease() {
            if (handle) impl.release(handle);
        }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Impl& impl;
        CURL* handle;
    };

    void configure(CURL* curl, const HttpRequest& request,
                   curl_slist* header_list, const std::string& range) const {
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        // No SIGALRM based timeouts in a threaded process
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (request.method == HttpMethod::HEAD) {
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        } else {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }
        if (header_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        }
        if (!range.empty()) {
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        }
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(request.total_timeout.count()));

        if (request.cancel_flag) {
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, on_progress);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA,
                             const_cast<std::atomic<bool>*>(request.cancel_flag));
        }

        if (config_.tcp_keepalive) {
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE,
                             static_cast<long>(config_.tcp_keepalive_idle.count()));
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL,
                             static_cast<long>(config_.tcp_keepalive_interval.count()));
        }

        const long verify = config_.verify_ssl ? 1L : 0L;
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify * 2);
        if (!config_.ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_DNS_CACHE_TIMEOUT,
                         static_cast<long>(config_.dns_cache_timeout.count()));
    }

    CURL* acquire() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!idle_.empty()) {
                CURL* handle = idle_.back();
                idle_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    // Reset options but keep the handle's connection cache for reuse
    void release(CURL* handle) {
        curl_easy_reset(handle);
        std::lock_guard<std::mutex> lock(mutex_);
        if (idle_.size() < config_.max_idle_connections) {
            idle_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;
    std::mutex mutex_;
    std::vector<CURL*> idle_;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

namespace {

constexpr const char* kSigningAlgorithm = "AWS4-HMAC-SHA256";

std::string hex_encode(const unsigned char* data, size_t len) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

std::string sha256_hex(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    return hex_encode(digest, sizeof(digest));
}

using Mac = std::vector<unsigned char>;

Mac hmac_sha256(const void* key, size_t key_len, const std::string& data) {
    Mac mac(EVP_MAX_MD_SIZE);
    unsigned int mac_len = 0;
    HMAC(EVP_sha256(), key, static_cast<int>(key_len),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         mac.data(), &mac_len);
    mac.resize(mac_len);
    return mac;
}

Mac hmac_sha256(const Mac& key, const std::string& data) {
    return hmac_sha256(key.data(), key.size(), data);
}

// "YYYYMMDDTHHMMSSZ" for the current UTC time
std::string amz_datetime_now() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buf[17];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &utc);
    return buf;
}

// Parameters in the URL are already percent-encoded; the canonical form
// only needs them sorted, with "name=" for valueless ones.
std::string canonical_query(const std::string& query) {
    std::map<std::string, std::string> sorted;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t end = query.find('&', pos);
        if (end == std::string::npos) end = query.size();
        std::string_view param(query.data() + pos, end - pos);
        if (!param.empty()) {
            size_t eq = param.find('=');
            if (eq == std::string_view::npos) {
                sorted[std::string(param)] = "";
            } else {
                sorted[std::string(param.substr(0, eq))] = std::string(param.substr(eq + 1));
            }
        }
        pos = end + 1;
    }

    std::string out;
    for (const auto& [name, value] : sorted) {
        if (!out.empty()) out += '&';
        out += name + "=" + value;
    }
    return out;
}

}  // namespace

AwsSigV4Signer::AwsSigV4Signer(const std::string& access_key_id,
                               const std::string& secret_access_key,
                               const std::string& region,
                               const std::string& service)
    : access_key_id_(access_key_id)
    , secret_access_key_(secret_access_key)
    , region_(region)
    , service_(service) {}

std::string AwsSigV4Signer::get_canonical_request(const HttpRequest& request,
                                                  const std::string& signed_headers,
                                                  const std::string& payload_hash) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return "";

    std::string canonical = http_method_to_string(request.method);
    canonical += '\n';
    canonical += url->path.empty() ? "/" : url->path;
    canonical += '\n';
    canonical += canonical_query(url->query);
    canonical += '\n';
    // Names come back lowercase and sorted
    for (const auto& [name, value] : request.headers.all()) {
        canonical += name + ":" + value + "\n";
    }
    canonical += '\n';
    canonical += signed_headers + "\n" + payload_hash;
    return canonical;
}

std::string AwsSigV4Signer::get_string_to_sign(const std::string& datetime,
                                               const std::string& date,
                                               const std::string& canonical_request) const {
    return std::string(kSigningAlgorithm) + "\n" + datetime + "\n" +
           date + "/" + region_ + "/" + service_ + "/aws4_request\n" +
           sha256_hex(canonical_request);
}

std::string AwsSigV4Signer::calculate_signature(const std::string& date,
                                                const std::string& string_to_sign) const {
    const std::string secret = "AWS4" + secret_access_key_;
    Mac key = hmac_sha256(secret.data(), secret.size(), date);
    for (const std::string* scope : {&region_, &service_}) {
        key = hmac_sha256(key, *scope);
    }
    key = hmac_sha256(key, "aws4_request");

    Mac signature = hmac_sha256(key, string_to_sign);
    return hex_encode(signature.data(), signature.size());
}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    sign_at(request, amz_datetime_now());
}

void AwsSigV4Signer::sign_at(HttpRequest& request, const std::string& datetime) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return;

    const std::string date = datetime.substr(0, 8);

    request.headers.set("Host", url->authority());
    request.headers.set("X-Amz-Date", datetime);
    // GET and HEAD carry no payload
    const std::string payload_hash =
        request.headers.get("x-amz-content-sha256").value_or(sha256_hex(""));
    request.headers.set("X-Amz-Content-Sha256", payload_hash);

    // Every header present is signed
    std::string signed_headers;
    std::string previous;
    for (const auto& [name, value] : request.headers.all()) {
        if (name == previous) continue;
        if (!signed_headers.empty()) signed_headers += ';';
        signed_headers += name;
        previous = name;
    }

    const std::string signature = calculate_signature(
        date, get_string_to_sign(datetime, date,
                                 get_canonical_request(request, signed_headers, payload_hash)));

    request.headers.set("Authorization",
                        std::string(kSigningAlgorithm) + " Credential=" + access_key_id_ + "/" +
                        date + "/" + region_ + "/" + service_ + "/aws4_request, " +
                        "SignedHeaders=" + signed_headers + ", Signature=" + signature);
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request,
                                     const std::string& session_token) const {
    request.headers.set("X-Amz-Security-Token", session_token);
    sign(request);
}

} // namespace objcat::net
