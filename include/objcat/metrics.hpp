#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace objcat {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports cat transfer metrics to a Prometheus textfile for node_exporter
/// pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename, so long transfers can be watched while they run.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file while running.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    // --- Counter accessors ---
    prometheus::Counter& objects_success() { return *objects_success_; }
    prometheus::Counter& objects_failure() { return *objects_failure_; }
    prometheus::Counter& bytes_written() { return *bytes_written_; }
    prometheus::Counter& range_success() { return *range_success_; }
    prometheus::Counter& range_retry() { return *range_retry_; }
    prometheus::Counter& range_failure() { return *range_failure_; }
    prometheus::Counter& list_requests() { return *list_requests_; }

    // --- Gauge accessors ---
    prometheus::Gauge& ranges_in_flight() { return *ranges_in_flight_; }
    prometheus::Gauge& reorder_buffered_bytes() { return *reorder_buffered_bytes_; }

    // --- Histogram accessors ---
    prometheus::Histogram& range_duration() { return *range_duration_; }
    prometheus::Histogram& object_duration() { return *object_duration_; }

private:
    void writer_loop();
    bool write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* objects_success_;
    prometheus::Counter* objects_failure_;
    prometheus::Counter* bytes_written_;
    prometheus::Counter* range_success_;
    prometheus::Counter* range_retry_;
    prometheus::Counter* range_failure_;
    prometheus::Counter* list_requests_;

    // --- Gauges ---
    prometheus::Gauge* ranges_in_flight_;
    prometheus::Gauge* reorder_buffered_bytes_;

    // --- Histograms ---
    prometheus::Histogram* range_duration_;
    prometheus::Histogram* object_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    bool stopped_ = false;
};

}  // namespace objcat
