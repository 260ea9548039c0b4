#pragma once

#include "objcat/cat/wildcard.hpp"
#include "objcat/core/constants.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace objcat {

// Tuning for one cat run. Fixed once the pipeline is constructed.
struct CatOptions {
    uint64_t part_size = constants::DEFAULT_PART_SIZE;
    uint32_t concurrency = constants::DEFAULT_CONCURRENCY;

    // Retries per range after the first attempt
    uint32_t max_retries = constants::DEFAULT_RETRY_COUNT;
    std::chrono::milliseconds retry_base_delay{constants::DEFAULT_RETRY_BASE_DELAY_MS};
    std::chrono::milliseconds retry_max_delay{constants::DEFAULT_RETRY_MAX_DELAY_MS};

    std::chrono::milliseconds range_timeout{constants::DEFAULT_RANGE_TIMEOUT_SECONDS * 1000};
    std::chrono::milliseconds connect_timeout{constants::DEFAULT_CONNECT_TIMEOUT_SECONDS * 1000};

    WildcardMode wildcard_mode = WildcardMode::Segment;

    // Returns error message if invalid, empty string if valid
    std::string validate() const;
};

} // namespace objcat
