#pragma once

#include <cstddef>
#include <cstdint>

namespace objcat::constants {

// Transfer defaults
constexpr uint64_t DEFAULT_PART_SIZE = 50ULL * 1024 * 1024;   // 50 MiB
constexpr uint32_t DEFAULT_CONCURRENCY = 5;
constexpr uint32_t DEFAULT_RETRY_COUNT = 10;
constexpr int DEFAULT_RETRY_BASE_DELAY_MS = 100;
constexpr int DEFAULT_RETRY_MAX_DELAY_MS = 10000;
constexpr int DEFAULT_RANGE_TIMEOUT_SECONDS = 300;
constexpr int DEFAULT_CONNECT_TIMEOUT_SECONDS = 30;

// Listing
constexpr uint32_t DEFAULT_LIST_MAX_KEYS = 1000;

// S3 defaults
constexpr const char* DEFAULT_REGION = "us-east-1";
constexpr const char* REMOTE_SCHEME = "s3";
constexpr char KEY_SEPARATOR = '/';

// Metrics
constexpr int DEFAULT_METRICS_INTERVAL_SECONDS = 15;

} // namespace objcat::constants
