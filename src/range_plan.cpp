#include "objcat/cat/range_plan.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace objcat {

RangePlan plan_ranges(uint64_t object_size, uint64_t part_size, uint32_t concurrency) {
    if (part_size == 0) {
        throw std::invalid_argument("part size must be positive");
    }
    if (concurrency == 0) {
        throw std::invalid_argument("concurrency must be positive");
    }

    RangePlan plan;
    plan.object_size = object_size;
    plan.part_size = part_size;
    plan.concurrency = concurrency;

    if (object_size == 0) {
        return plan;
    }

    if (concurrency == 1 || object_size <= part_size) {
        plan.ranges.push_back(ByteRange{0, 0, object_size});
        return plan;
    }

    uint64_t count = object_size / part_size + (object_size % part_size != 0 ? 1 : 0);
    if (count > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("part size too small: " + std::to_string(count) +
                                    " ranges exceed the range index limit");
    }

    plan.ranges.reserve(static_cast<size_t>(count));
    uint64_t start = 0;
    for (uint32_t i = 0; i < static_cast<uint32_t>(count); ++i) {
        uint64_t end = object_size - start > part_size ? start + part_size : object_size;
        plan.ranges.push_back(ByteRange{i, start, end});
        start = end;
    }
    return plan;
}

} // namespace objcat
