#pragma once

#include "objcat/cat/error.hpp"
#include "objcat/cat/options.hpp"
#include "objcat/cat/range_plan.hpp"
#include "objcat/cat/sink.hpp"
#include "objcat/cat/target.hpp"
#include "objcat/storage/backend.hpp"

#include <cstdint>
#include <optional>

namespace objcat {

class MetricsExporter;

// Counters from the most recent fetch()
struct FetchStats {
    uint32_t ranges_completed = 0;
    uint32_t retries = 0;
    uint64_t bytes_written = 0;
    uint32_t max_outstanding = 0;  // peak of in-flight plus buffered ranges
    uint64_t max_buffered_bytes = 0;
};

// Streams one object to a sink by executing its range plan.
//
// Up to plan.concurrency ranges are requested at once, each on its own task.
// Completed ranges wait in a ReorderBuffer until every earlier range has
// been written, so the sink sees the bytes in object order whatever order
// the requests finish in. A new range is dispatched only while
// dispatched - delivered < concurrency, which bounds in-flight plus
// buffered ranges by concurrency.
//
// With concurrency 1 the plan is read on the calling thread in slices of at
// most part_size, each written before the next is requested.
//
// On the first failed range the remaining requests are cancelled and the
// error is returned. Bytes already written stay written.
class ObjectFetcher {
public:
    ObjectFetcher(const ObjectStore& store,
                  const CatOptions& options,
                  MetricsExporter* metrics = nullptr);

    // Empty optional on success
    std::optional<CatError> fetch(const ObjectDescriptor& descriptor,
                                  const RangePlan& plan,
                                  OutputSink& sink);

    const FetchStats& last_stats() const { return stats_; }

private:
    std::optional<CatError> fetch_sequential(const ObjectDescriptor& descriptor,
                                             const RangePlan& plan,
                                             OutputSink& sink);

    const ObjectStore& store_;
    CatOptions options_;
    MetricsExporter* metrics_;
    FetchStats stats_;
};

} // namespace objcat
