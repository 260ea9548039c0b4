#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace objcat {

// Outcome class of a store request, independent of transport details
enum class StoreStatus {
    Ok,
    NotFound,       // key absent
    NoSuchVersion,  // key present, requested version absent
    Transient,      // network error, timeout, throttling, 5xx, short body
    Fatal,          // any other rejection (403, 412, 416, malformed reply)
    Cancelled       // aborted through the cancellation flag
};

const char* store_status_name(StoreStatus status);

// Metadata about a stored object
struct ObjectMetadata {
    uint64_t size = 0;
    std::string etag;
};

// Result of a head operation
struct HeadResult {
    bool success = false;
    StoreStatus status = StoreStatus::Fatal;
    ObjectMetadata metadata;
    int http_status = 0;
    std::string error_code;     // S3 error code when the body carried one
    std::string error_message;
};

// Result of a get operation
struct GetResult {
    bool success = false;
    StoreStatus status = StoreStatus::Fatal;
    std::vector<uint8_t> data;
    ObjectMetadata metadata;
    int http_status = 0;
    std::string error_code;
    std::string error_message;
};

// Entry in a listing operation
struct ListEntry {
    std::string key;
    uint64_t size = 0;
    std::string etag;
    bool is_directory = false;  // common prefix
};

// Result of a list operation (one page)
struct ListResult {
    bool success = false;
    StoreStatus status = StoreStatus::Fatal;
    std::vector<ListEntry> entries;
    bool truncated = false;
    std::string continuation_token;
    int http_status = 0;
    std::string error_code;
    std::string error_message;
};

// Options for get operations. The range is half-open [range_start, range_end).
struct GetOptions {
    std::optional<uint64_t> range_start;
    std::optional<uint64_t> range_end;
    std::optional<std::string> version_id;
    std::optional<std::string> if_match;  // ETag condition
    std::chrono::milliseconds timeout{0};  // 0 = store default
    const std::atomic<bool>* cancel = nullptr;
};

// Options for list operations
struct ListOptions {
    std::string prefix;
    std::string delimiter;  // empty = recursive
    uint32_t max_keys = 1000;
    std::string continuation_token;
};

// Read-only object store capability used by cat.
// Implementations must be safe to call from several threads at once.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Get the store type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    // Object metadata without downloading content
    virtual HeadResult head(const std::string& key,
                            const std::optional<std::string>& version_id = std::nullopt) const = 0;

    // Read object content, optionally a byte range of it
    virtual GetResult get(const std::string& key,
                          const GetOptions& options = {}) const = 0;

    // One page of a listing
    virtual ListResult list(const ListOptions& options = {}) const = 0;
};

} // namespace objcat
