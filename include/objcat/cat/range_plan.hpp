#pragma once

#include <cstdint>
#include <vector>

namespace objcat {

// Half-open byte range [start, end) of an object
struct ByteRange {
    uint32_t index = 0;
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t length() const { return end - start; }
};

// Contiguous, non-overlapping ranges covering [0, object_size), index
// ascending == start ascending.
struct RangePlan {
    uint64_t object_size = 0;
    uint64_t part_size = 0;
    uint32_t concurrency = 0;
    std::vector<ByteRange> ranges;
};

// Split an object into ranges of part_size bytes (last one possibly shorter).
// A single range covers the object when it fits in one part or when
// concurrency is 1; an empty object has no ranges.
// Throws std::invalid_argument on zero part_size or concurrency, or when the
// range count does not fit a uint32 index.
RangePlan plan_ranges(uint64_t object_size, uint64_t part_size, uint32_t concurrency);

} // namespace objcat
