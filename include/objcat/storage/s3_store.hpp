#pragma once

#include "objcat/net/http.hpp"
#include "objcat/storage/backend.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace objcat {

// Connection settings for an S3-compatible store
struct S3StoreConfig {
    std::string bucket;
    std::string region = "us-east-1";
    std::string endpoint;          // Empty for AWS, custom for MinIO/etc
    bool use_path_style = false;   // Always on when an endpoint is given
    std::string access_key;
    std::string secret_key;
    std::string session_token;     // STS/temporary credentials
    bool sign_request = true;      // false = anonymous requests
    bool verify_ssl = true;
    std::string request_payer;     // x-amz-request-payer, e.g. "requester"

    uint32_t connect_timeout_secs = 30;
    uint32_t request_timeout_secs = 300;

    // Retries for head and list; ranged reads retry in the fetcher
    uint32_t max_retries = 10;
};

std::unique_ptr<ObjectStore> create_s3_store(const S3StoreConfig& config);

namespace s3 {

// URL of an object, with ?versionId= when a version is given
std::string build_object_url(const S3StoreConfig& config,
                             const std::string& key,
                             const std::optional<std::string>& version_id = std::nullopt);

// Unsigned GET for an object. A bounded range caps the accepted body at the
// range length.
net::HttpRequest build_get_request(const S3StoreConfig& config,
                                   const std::string& key,
                                   const GetOptions& options);

// ListObjectsV2 URL for one page
std::string build_list_url(const S3StoreConfig& config, const ListOptions& options);

// Parse a ListObjectsV2 reply; CommonPrefixes become directory entries
ListResult parse_list_objects_response(const std::string& xml);

// <Code> and <Message> of an S3 error document, empty when absent
std::string parse_error_code(const std::string& body);
std::string parse_error_message(const std::string& body);

// Map an HTTP status plus S3 error code to a store status
StoreStatus classify_http_status(int http_status, const std::string& error_code);

} // namespace s3

} // namespace objcat
