#include "objcat/cat/fetcher.hpp"
#include "objcat/cat/reorder_buffer.hpp"
#include "objcat/core/log.hpp"
#include "objcat/metrics.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <system_error>
#include <utility>

namespace objcat {

namespace {

// Cancellation shared by the controller and every range task of one fetch
class CancelToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            flag_.store(true);
        }
        cv_.notify_all();
    }

    bool cancelled() const { return flag_.load(); }
    const std::atomic<bool>* flag() const { return &flag_; }

    // Sleep for the given time; false if woken by cancel()
    bool sleep_for(std::chrono::milliseconds delay) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, delay, [this] { return flag_.load(); });
    }

private:
    std::atomic<bool> flag_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

struct RangeOutcome {
    uint32_t index = 0;
    std::vector<uint8_t> data;
    std::optional<CatError> error;
    uint32_t attempts = 0;
};

// Results posted by range tasks, consumed by the controller
class CompletionQueue {
public:
    void push(RangeOutcome outcome) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            outcomes_.push_back(std::move(outcome));
        }
        cv_.notify_one();
    }

    RangeOutcome pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !outcomes_.empty(); });
        RangeOutcome outcome = std::move(outcomes_.front());
        outcomes_.pop_front();
        return outcome;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<RangeOutcome> outcomes_;
};

std::chrono::milliseconds backoff_delay(const CatOptions& options, uint32_t retry) {
    // base * 2^(retry-1), capped
    auto delay = options.retry_base_delay;
    for (uint32_t i = 1; i < retry && delay < options.retry_max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, options.retry_max_delay);
}

// Fetch one range with bounded retries. Never throws.
RangeOutcome fetch_range(const ObjectStore& store,
                         const CatOptions& options,
                         MetricsExporter* metrics,
                         const ObjectDescriptor& descriptor,
                         const ByteRange& range,
                         CancelToken& cancel,
                         std::atomic<uint32_t>& retries) {
    RangeOutcome outcome;
    outcome.index = range.index;

    GetOptions get_options;
    get_options.range_start = range.start;
    get_options.range_end = range.end;
    get_options.version_id = descriptor.version_id;
    // Pin the object's content so an overwrite cannot produce a mixed stream
    if (!descriptor.version_id && !descriptor.etag.empty()) {
        get_options.if_match = descriptor.etag;
    }
    get_options.timeout = options.range_timeout;
    get_options.cancel = cancel.flag();

    const uint64_t last_byte = range.end - 1;

    while (true) {
        if (cancel.cancelled()) {
            outcome.error = CatError::cancelled();
            return outcome;
        }

        outcome.attempts++;
        GetResult result;
        {
            std::optional<ScopedTimer> timer;
            if (metrics) timer.emplace(metrics->range_duration());
            result = store.get(descriptor.key, get_options);
        }

        std::string detail;
        ErrorKind kind = ErrorKind::TransientFetchFailure;

        if (result.success) {
            if (result.data.size() == range.length()) {
                if (metrics) metrics->range_success().Increment();
                outcome.data = std::move(result.data);
                return outcome;
            }
            detail = "got " + std::to_string(result.data.size()) + " of " +
                     std::to_string(range.length()) + " bytes";
            // A short body is a dropped connection; a long one is a server
            // that ignored the Range header
            kind = result.data.size() < range.length() ? ErrorKind::TransientFetchFailure
                                                       : ErrorKind::FatalFetchFailure;
        } else {
            detail = result.error_message;
            kind = classify_store_failure(result.status, descriptor.version_id.has_value());
        }

        switch (kind) {
            case ErrorKind::NotFound:
                outcome.error = CatError::not_found();
                break;
            case ErrorKind::VersionNotFound:
                outcome.error = CatError::version_not_found(descriptor.version_id.value_or(""));
                break;
            case ErrorKind::Cancelled:
                outcome.error = CatError::cancelled();
                break;
            case ErrorKind::TransientFetchFailure:
                if (outcome.attempts <= options.max_retries) {
                    auto delay = backoff_delay(options, outcome.attempts);
                    log_debug("%s bytes=%llu-%llu attempt %u failed: %s; retrying in %lldms",
                              descriptor.key.c_str(),
                              static_cast<unsigned long long>(range.start),
                              static_cast<unsigned long long>(last_byte),
                              outcome.attempts, detail.c_str(),
                              static_cast<long long>(delay.count()));
                    retries++;
                    if (metrics) metrics->range_retry().Increment();
                    if (!cancel.sleep_for(delay)) {
                        outcome.error = CatError::cancelled();
                        return outcome;
                    }
                    continue;
                }
                outcome.error = CatError::fatal_fetch(descriptor.key, range.start, last_byte,
                                                      outcome.attempts, detail);
                break;
            default:
                outcome.error = CatError::fatal_fetch(descriptor.key, range.start, last_byte,
                                                      outcome.attempts, detail);
                break;
        }

        if (metrics && outcome.error->kind != ErrorKind::Cancelled) {
            metrics->range_failure().Increment();
        }
        return outcome;
    }
}

}  // namespace

ObjectFetcher::ObjectFetcher(const ObjectStore& store,
                             const CatOptions& options,
                             MetricsExporter* metrics)
    : store_(store)
    , options_(options)
    , metrics_(metrics) {}

std::optional<CatError> ObjectFetcher::fetch(const ObjectDescriptor& descriptor,
                                             const RangePlan& plan,
                                             OutputSink& sink) {
    stats_ = FetchStats{};

    const uint32_t total = static_cast<uint32_t>(plan.ranges.size());
    if (total == 0) {
        return std::nullopt;
    }
    if (plan.concurrency == 1) {
        return fetch_sequential(descriptor, plan, sink);
    }

    ReorderBuffer buffer(plan.concurrency);
    CompletionQueue completions;
    CancelToken cancel;
    std::atomic<uint32_t> retries{0};

    std::map<uint32_t, std::future<void>> tasks;
    uint32_t dispatch = 0;
    std::optional<CatError> failure;

    auto launch = [&](const ByteRange& range) {
        tasks.emplace(range.index, std::async(std::launch::async, [&, range]() {
            RangeOutcome outcome;
            try {
                outcome = fetch_range(store_, options_, metrics_, descriptor, range,
                                      cancel, retries);
            } catch (const std::exception& e) {
                outcome.index = range.index;
                outcome.error = CatError::fatal_fetch(descriptor.key, range.start,
                                                      range.end - 1, 1, e.what());
            }
            completions.push(std::move(outcome));
        }));
        if (metrics_) metrics_->ranges_in_flight().Increment();
    };

    while (buffer.next_index() < total) {
        while (dispatch < total && dispatch - buffer.next_index() < plan.concurrency) {
            try {
                launch(plan.ranges[dispatch]);
            } catch (const std::system_error& e) {
                failure = CatError::fatal_fetch(descriptor.key, plan.ranges[dispatch].start,
                                                plan.ranges[dispatch].end - 1, 0,
                                                std::string("cannot start range task: ") + e.what());
                break;
            }
            log_trace("%s: dispatched range %u", descriptor.key.c_str(), dispatch);
            dispatch++;
            stats_.max_outstanding = std::max(stats_.max_outstanding,
                                              dispatch - buffer.next_index());
        }
        if (failure) break;

        RangeOutcome outcome = completions.pop();
        if (metrics_) metrics_->ranges_in_flight().Decrement();
        auto it = tasks.find(outcome.index);
        if (it != tasks.end()) {
            it->second.get();
            tasks.erase(it);
        }

        if (outcome.error) {
            failure = std::move(outcome.error);
            break;
        }
        stats_.ranges_completed++;

        if (!buffer.put(outcome.index, std::move(outcome.data))) {
            failure = CatError::fatal_fetch(descriptor.key, plan.ranges[outcome.index].start,
                                            plan.ranges[outcome.index].end - 1, outcome.attempts,
                                            "range completed outside the reorder window");
            break;
        }
        stats_.max_buffered_bytes = std::max<uint64_t>(stats_.max_buffered_bytes,
                                                       buffer.buffered_bytes());

        // Drain everything that is now contiguous with the delivery cursor
        while (auto bytes = buffer.take_next()) {
            if (!sink.write(*bytes)) {
                failure = CatError::cancelled();
                break;
            }
            stats_.bytes_written += bytes->size();
            if (metrics_) metrics_->bytes_written().Increment(static_cast<double>(bytes->size()));
        }
        if (metrics_) {
            metrics_->reorder_buffered_bytes().Set(static_cast<double>(buffer.buffered_bytes()));
        }
        if (failure) break;
    }

    if (failure) {
        log_debug("%s: aborting fetch with %zu range(s) outstanding: %s",
                  descriptor.key.c_str(), tasks.size(), failure->message.c_str());
        cancel.cancel();
        for (auto& [index, task] : tasks) {
            task.get();
            if (metrics_) metrics_->ranges_in_flight().Decrement();
        }
        tasks.clear();
        buffer.clear();
        if (metrics_) metrics_->reorder_buffered_bytes().Set(0);
    }

    stats_.retries = retries.load();
    return failure;
}

std::optional<CatError> ObjectFetcher::fetch_sequential(const ObjectDescriptor& descriptor,
                                                        const RangePlan& plan,
                                                        OutputSink& sink) {
    CancelToken cancel;
    std::atomic<uint32_t> retries{0};
    std::optional<CatError> failure;

    for (const auto& range : plan.ranges) {
        // At most part_size bytes requested or held at once
        const uint64_t slice_size = plan.part_size > 0 ? plan.part_size : range.length();
        for (uint64_t start = range.start; start < range.end && !failure;) {
            const uint64_t end = range.end - start > slice_size ? start + slice_size : range.end;
            const ByteRange slice{range.index, start, end};

            RangeOutcome outcome;
            if (metrics_) metrics_->ranges_in_flight().Increment();
            try {
                outcome = fetch_range(store_, options_, metrics_, descriptor, slice,
                                      cancel, retries);
            } catch (const std::exception& e) {
                outcome.error = CatError::fatal_fetch(descriptor.key, slice.start,
                                                      slice.end - 1, 1, e.what());
            }
            if (metrics_) metrics_->ranges_in_flight().Decrement();

            if (outcome.error) {
                failure = std::move(outcome.error);
                break;
            }
            stats_.max_outstanding = 1;
            stats_.max_buffered_bytes = std::max<uint64_t>(stats_.max_buffered_bytes,
                                                           outcome.data.size());
            if (!sink.write(outcome.data)) {
                failure = CatError::cancelled();
                break;
            }
            stats_.bytes_written += outcome.data.size();
            if (metrics_) {
                metrics_->bytes_written().Increment(static_cast<double>(outcome.data.size()));
            }
            start = end;
        }
        if (failure) break;
        stats_.ranges_completed++;
    }

    if (failure) {
        log_debug("%s: aborting sequential fetch: %s", descriptor.key.c_str(),
                  failure->message.c_str());
    }
    stats_.retries = retries.load();
    return failure;
}

} // namespace objcat
