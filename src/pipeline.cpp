#include "objcat/cat/pipeline.hpp"
#include "objcat/cat/fetcher.hpp"
#include "objcat/cat/range_plan.hpp"
#include "objcat/cat/resolver.hpp"
#include "objcat/core/log.hpp"
#include "objcat/metrics.hpp"

#include <stdexcept>

namespace objcat {

CatPipeline::CatPipeline(const ObjectStore& store,
                         const CatOptions& options,
                         MetricsExporter* metrics)
    : store_(store)
    , options_(options)
    , metrics_(metrics)
    , matcher_(make_wildcard_matcher(options.wildcard_mode)) {}

std::optional<CatError> CatPipeline::probe(ObjectDescriptor& descriptor) const {
    HeadResult head = store_.head(descriptor.key, descriptor.version_id);
    if (head.success) {
        descriptor.size = head.metadata.size;
        descriptor.etag = head.metadata.etag;
        return std::nullopt;
    }

    switch (classify_store_failure(head.status, descriptor.version_id.has_value())) {
        case ErrorKind::NotFound:
            return CatError::not_found();
        case ErrorKind::VersionNotFound:
            return CatError::version_not_found(descriptor.version_id.value_or(""));
        case ErrorKind::Cancelled:
            return CatError::cancelled();
        default:
            return CatError{ErrorKind::FatalFetchFailure,
                            "failed to stat " + descriptor.key + ": " + head.error_message};
    }
}

std::optional<CatError> CatPipeline::run(const Target& target, OutputSink& sink) {
    stats_ = PipelineStats{};

    std::string invalid = options_.validate();
    if (!invalid.empty()) {
        return CatError::invalid_config(invalid);
    }

    TargetResolver resolver(store_, *matcher_);
    ResolveResult resolved = resolver.resolve(target);

    stats_.list_requests = resolved.list_requests;
    if (metrics_ && resolved.list_requests > 0) {
        metrics_->list_requests().Increment(resolved.list_requests);
    }
    if (!resolved.success) {
        return resolved.error.value_or(CatError::list_failure("target could not be resolved"));
    }
    stats_.objects_resolved = static_cast<uint32_t>(resolved.objects.size());

    ObjectFetcher fetcher(store_, options_, metrics_);

    for (auto& descriptor : resolved.objects) {
        if (!descriptor.size) {
            if (auto error = probe(descriptor)) {
                if (metrics_) metrics_->objects_failure().Increment();
                return error;
            }
        }

        RangePlan plan;
        try {
            plan = plan_ranges(*descriptor.size, options_.part_size, options_.concurrency);
        } catch (const std::invalid_argument& e) {
            return CatError::invalid_config(e.what());
        }

        log_debug("cat %s: %llu bytes in %zu range(s), concurrency %u",
                  descriptor.key.c_str(),
                  static_cast<unsigned long long>(plan.object_size),
                  plan.ranges.size(), plan.concurrency);

        std::optional<CatError> error;
        {
            std::optional<ScopedTimer> timer;
            if (metrics_) timer.emplace(metrics_->object_duration());
            error = fetcher.fetch(descriptor, plan, sink);
        }

        const FetchStats& fetched = fetcher.last_stats();
        stats_.bytes_written += fetched.bytes_written;

        if (error) {
            if (metrics_) metrics_->objects_failure().Increment();
            log_debug("cat %s failed after %llu bytes: %s (%s)",
                      descriptor.key.c_str(),
                      static_cast<unsigned long long>(fetched.bytes_written),
                      error->message.c_str(), error_kind_name(error->kind));
            return error;
        }

        if (metrics_) metrics_->objects_success().Increment();
        stats_.objects_completed++;
        log_debug("cat %s done: %u range(s), %u retr%s",
                  descriptor.key.c_str(), fetched.ranges_completed, fetched.retries,
                  fetched.retries == 1 ? "y" : "ies");
    }

    if (!sink.flush()) {
        return CatError::cancelled();
    }
    return std::nullopt;
}

} // namespace objcat
