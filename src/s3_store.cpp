#include "objcat/storage/s3_store.hpp"
#include "objcat/core/log.hpp"
#include "objcat/net/http.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>
#include <vector>

namespace objcat {

const char* store_status_name(StoreStatus status) {
    switch (status) {
        case StoreStatus::Ok: return "ok";
        case StoreStatus::NotFound: return "not_found";
        case StoreStatus::NoSuchVersion: return "no_such_version";
        case StoreStatus::Transient: return "transient";
        case StoreStatus::Fatal: return "fatal";
        case StoreStatus::Cancelled: return "cancelled";
    }
    return "fatal";
}

// ============================================================================
// XML parsing helpers for S3 responses
// ============================================================================

namespace xml {

// Find the value between <tag>value</tag>, returns empty string if not found
static std::string get_element(const std::string& xml, const std::string& tag) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

// Content of every <tag>...</tag> in document order
static std::vector<std::string> find_elements(const std::string& xml, const std::string& tag) {
    std::vector<std::string> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;

        size_t content_start = start + open_tag.length();
        size_t end = xml.find(close_tag, content_start);
        if (end == std::string::npos) break;

        results.push_back(xml.substr(content_start, end - content_start));
        pos = end + close_tag.length();
    }

    return results;
}

// Decode XML entities (basic set used by S3, plus numeric references)
static std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] != '&') {
            result += s[i++];
            continue;
        }
        if (s.compare(i, 4, "&lt;") == 0) {
            result += '<';
            i += 4;
        } else if (s.compare(i, 4, "&gt;") == 0) {
            result += '>';
            i += 4;
        } else if (s.compare(i, 5, "&amp;") == 0) {
            result += '&';
            i += 5;
        } else if (s.compare(i, 6, "&quot;") == 0) {
            result += '"';
            i += 6;
        } else if (s.compare(i, 6, "&apos;") == 0) {
            result += '\'';
            i += 6;
        } else if (s.compare(i, 2, "&#") == 0 && s.find(';', i) != std::string::npos) {
            // &#13; style references, emitted by S3 for control characters
            size_t semi = s.find(';', i);
            std::string num = s.substr(i + 2, semi - i - 2);
            unsigned long code = 0;
            bool ok = !num.empty();
            try {
                if (ok && (num[0] == 'x' || num[0] == 'X')) {
                    code = std::stoul(num.substr(1), nullptr, 16);
                } else if (ok) {
                    code = std::stoul(num);
                }
            } catch (const std::exception&) {
                ok = false;
            }
            if (ok && code < 0x80) {
                result += static_cast<char>(code);
                i = semi + 1;
            } else {
                result += s[i++];
            }
        } else {
            // Unknown entity, keep as-is
            result += s[i++];
        }
    }

    return result;
}

} // namespace xml

namespace s3 {

static std::string base_url(const S3StoreConfig& config) {
    if (!config.endpoint.empty()) {
        std::string url = config.endpoint;
        while (!url.empty() && url.back() == '/') url.pop_back();
        return url + "/" + config.bucket;
    }
    if (config.use_path_style) {
        return "https://s3." + config.region + ".amazonaws.com/" + config.bucket;
    }
    return "https://" + config.bucket + ".s3." + config.region + ".amazonaws.com";
}

std::string build_object_url(const S3StoreConfig& config,
                             const std::string& key,
                             const std::optional<std::string>& version_id) {
    std::string url = base_url(config) + "/" + net::url_encode_path(key);
    if (version_id) {
        url += "?versionId=" + net::url_encode(*version_id);
    }
    return url;
}

std::string build_list_url(const S3StoreConfig& config, const ListOptions& options) {
    std::vector<std::string> params;
    params.push_back("list-type=2");
    if (!options.prefix.empty()) {
        params.push_back("prefix=" + net::url_encode(options.prefix));
    }
    if (!options.delimiter.empty()) {
        params.push_back("delimiter=" + net::url_encode(options.delimiter));
    }
    params.push_back("max-keys=" + std::to_string(options.max_keys));
    if (!options.continuation_token.empty()) {
        params.push_back("continuation-token=" + net::url_encode(options.continuation_token));
    }

    // Bucket root: path-style needs the trailing slash, virtual-host uses "/"
    std::string url = base_url(config) + "/?";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) url += "&";
        url += params[i];
    }
    return url;
}

net::HttpRequest build_get_request(const S3StoreConfig& config,
                                   const std::string& key,
                                   const GetOptions& options) {
    net::HttpRequest request = net::HttpRequest::get(
        build_object_url(config, key, options.version_id));

    if (options.range_start || options.range_end) {
        uint64_t start = options.range_start.value_or(0);
        if (options.range_end && *options.range_end > start) {
            request.byte_range = std::make_pair(start, *options.range_end - 1);
            // A longer body (Range ignored) fails with 413
            request.max_response_size = *options.range_end - start;
        } else {
            request.headers.set("Range", "bytes=" + std::to_string(start) + "-");
        }
    }

    if (options.if_match) {
        request.headers.set("If-Match", *options.if_match);
    }
    request.cancel_flag = options.cancel;
    return request;
}

ListResult parse_list_objects_response(const std::string& xml_str) {
    ListResult result;
    result.success = true;
    result.status = StoreStatus::Ok;

    result.truncated = xml::get_element(xml_str, "IsTruncated") == "true";
    result.continuation_token = xml::decode_entities(
        xml::get_element(xml_str, "NextContinuationToken"));

    for (const auto& content : xml::find_elements(xml_str, "Contents")) {
        ListEntry entry;
        entry.key = xml::decode_entities(xml::get_element(content, "Key"));

        std::string size_str = xml::get_element(content, "Size");
        if (!size_str.empty()) {
            try {
                entry.size = std::stoull(size_str);
            } catch (const std::exception&) {
                result.success = false;
                result.status = StoreStatus::Fatal;
                result.error_message = "malformed listing: bad size for " + entry.key;
                return result;
            }
        }

        entry.etag = xml::decode_entities(xml::get_element(content, "ETag"));
        result.entries.push_back(std::move(entry));
    }

    for (const auto& content : xml::find_elements(xml_str, "CommonPrefixes")) {
        ListEntry entry;
        entry.key = xml::decode_entities(xml::get_element(content, "Prefix"));
        entry.is_directory = true;
        result.entries.push_back(std::move(entry));
    }

    return result;
}

std::string parse_error_code(const std::string& body) {
    return xml::get_element(body, "Code");
}

std::string parse_error_message(const std::string& body) {
    return xml::decode_entities(xml::get_element(body, "Message"));
}

StoreStatus classify_http_status(int http_status, const std::string& error_code) {
    if (net::is_success_status(http_status)) {
        return StoreStatus::Ok;
    }
    if (error_code == "NoSuchVersion") {
        return StoreStatus::NoSuchVersion;
    }
    if (http_status == 404) {
        // HEAD replies carry no body; a bare 404 means the key is absent
        if (error_code.empty() || error_code == "NoSuchKey") {
            return StoreStatus::NotFound;
        }
        return StoreStatus::Fatal;  // NoSuchBucket and friends
    }
    if (net::is_retryable_status(http_status) ||
        error_code == "SlowDown" || error_code == "RequestTimeout") {
        return StoreStatus::Transient;
    }
    return StoreStatus::Fatal;
}

} // namespace s3

// ============================================================================
// S3ObjectStore - S3-compatible implementation
// ============================================================================

class S3ObjectStore : public ObjectStore {
public:
    explicit S3ObjectStore(const S3StoreConfig& config)
        : config_(config)
        , signer_(config.access_key, config.secret_key, config.region, "s3") {
        // Custom endpoints (MinIO, Ceph, localstack) are addressed path-style
        if (!config_.endpoint.empty()) {
            config_.use_path_style = true;
        }
        // Credentials are held by the signer only
        config_.access_key.clear();
        config_.secret_key.clear();

        net::HttpClientConfig http_config;
        http_config.verify_ssl = config_.verify_ssl;
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "s3"; }

    HeadResult head(const std::string& key,
                    const std::optional<std::string>& version_id) const override {
        HeadResult result;

        net::HttpRequest request = net::HttpRequest::head(
            s3::build_object_url(config_, key, version_id));
        apply_timeouts(request, std::chrono::milliseconds(0));

        auto response = execute_with_retry(request, "HEAD " + key);
        fill_status(result, response);
        if (!result.success) {
            return result;
        }

        result.metadata.size = response.headers.content_length().value_or(0);
        result.metadata.etag = response.headers.get("ETag").value_or("");
        return result;
    }

    GetResult get(const std::string& key, const GetOptions& options) const override {
        GetResult result;

        if (options.range_end && *options.range_end <= options.range_start.value_or(0)) {
            result.status = StoreStatus::Fatal;
            result.error_message = "empty byte range";
            return result;
        }

        net::HttpRequest request = s3::build_get_request(config_, key, options);
        apply_timeouts(request, options.timeout);

        // Ranged reads are retried by the caller, one attempt here
        sign_request(request);
        auto response = http_client_->execute(request);

        fill_status(result, response);
        if (!result.success) {
            return result;
        }

        result.data = std::move(response.body);
        result.metadata.size = response.headers.content_length().value_or(result.data.size());
        result.metadata.etag = response.headers.get("ETag").value_or("");
        return result;
    }

    ListResult list(const ListOptions& options) const override {
        net::HttpRequest request = net::HttpRequest::get(s3::build_list_url(config_, options));
        apply_timeouts(request, std::chrono::milliseconds(0));

        auto response = execute_with_retry(request, "LIST " + options.prefix);

        if (!response.ok()) {
            ListResult result;
            fill_status(result, response);
            return result;
        }

        ListResult result = s3::parse_list_objects_response(response.body_string());
        result.http_status = response.status_code;
        return result;
    }

private:
    void apply_timeouts(net::HttpRequest& request, std::chrono::milliseconds timeout) const {
        request.connect_timeout = std::chrono::seconds(config_.connect_timeout_secs);
        request.total_timeout = timeout.count() > 0
            ? timeout
            : std::chrono::milliseconds(config_.request_timeout_secs * 1000ULL);
    }

    // Sign request, using session token if configured
    void sign_request(net::HttpRequest& request) const {
        if (!config_.request_payer.empty()) {
            request.headers.set("x-amz-request-payer", config_.request_payer);
        }
        if (!config_.sign_request) {
            return;
        }
        if (!config_.session_token.empty()) {
            signer_.sign_with_token(request, config_.session_token);
        } else {
            signer_.sign(request);
        }
    }

    // Retry with exponential backoff; each attempt is signed afresh
    net::HttpResponse execute_with_retry(const net::HttpRequest& request,
                                         const std::string& what) const {
        net::HttpResponse response;
        uint32_t attempts = 0;
        uint32_t max_attempts = config_.max_retries + 1;
        while (attempts < max_attempts) {
            net::HttpRequest signed_request = request;
            sign_request(signed_request);
            response = http_client_->execute(signed_request);

            bool retryable = response.is_network_error ||
                             net::is_retryable_status(response.status_code);
            if (response.ok() || response.cancelled || !retryable) {
                break;
            }
            ++attempts;
            if (attempts < max_attempts) {
                auto delay = std::min<uint64_t>(100ULL << std::min<uint32_t>(attempts, 10), 10000);
                log_debug("%s: attempt %u failed (%s), retrying in %llums",
                          what.c_str(), attempts,
                          response.error.empty() ? std::to_string(response.status_code).c_str()
                                                 : response.error.c_str(),
                          static_cast<unsigned long long>(delay));
                std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            }
        }
        return response;
    }

    template <typename Result>
    static void fill_status(Result& result, const net::HttpResponse& response) {
        result.http_status = response.status_code;

        if (response.cancelled) {
            result.success = false;
            result.status = StoreStatus::Cancelled;
            result.error_message = response.error;
            return;
        }
        if (response.is_network_error) {
            result.success = false;
            result.status = StoreStatus::Transient;
            result.error_message = response.error;
            return;
        }
        if (response.ok()) {
            result.success = true;
            result.status = StoreStatus::Ok;
            return;
        }

        std::string body = response.body_string();
        result.success = false;
        result.error_code = s3::parse_error_code(body);
        result.status = s3::classify_http_status(response.status_code, result.error_code);

        std::string message = s3::parse_error_message(body);
        if (!response.error.empty()) {
            result.error_message = response.error;
        } else if (!result.error_code.empty()) {
            result.error_message = result.error_code +
                (message.empty() ? "" : ": " + message);
        } else {
            result.error_message = "HTTP " + std::to_string(response.status_code);
        }
    }

    S3StoreConfig config_;
    net::AwsSigV4Signer signer_;
    std::unique_ptr<net::HttpClient> http_client_;
};

std::unique_ptr<ObjectStore> create_s3_store(const S3StoreConfig& config) {
    log_debug("s3 store: bucket=%s region=%s endpoint=%s signed=%s",
              config.bucket.c_str(), config.region.c_str(),
              config.endpoint.empty() ? "(aws)" : config.endpoint.c_str(),
              config.sign_request ? "yes" : "no");
    return std::make_unique<S3ObjectStore>(config);
}

} // namespace objcat
