#pragma once

#include "objcat/cat/error.hpp"
#include "objcat/cat/options.hpp"
#include "objcat/cat/sink.hpp"
#include "objcat/cat/target.hpp"
#include "objcat/cat/wildcard.hpp"
#include "objcat/storage/backend.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace objcat {

class MetricsExporter;

struct PipelineStats {
    uint32_t objects_resolved = 0;
    uint32_t objects_completed = 0;
    uint64_t bytes_written = 0;
    uint32_t list_requests = 0;
};

// Resolves a target once, then streams each object in ascending key order,
// one object at a time, onto a single sink. Stops at the first error;
// bytes of objects already written are not retracted.
class CatPipeline {
public:
    CatPipeline(const ObjectStore& store,
                const CatOptions& options,
                MetricsExporter* metrics = nullptr);

    // Empty optional on success, including a prefix with no objects
    std::optional<CatError> run(const Target& target, OutputSink& sink);

    const PipelineStats& stats() const { return stats_; }

private:
    // Object size and etag via head() when the resolver left them unknown
    std::optional<CatError> probe(ObjectDescriptor& descriptor) const;

    const ObjectStore& store_;
    CatOptions options_;
    MetricsExporter* metrics_;
    std::unique_ptr<WildcardMatcher> matcher_;
    PipelineStats stats_;
};

} // namespace objcat
