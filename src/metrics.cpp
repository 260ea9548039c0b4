#include "objcat/metrics.hpp"
#include "objcat/core/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace objcat {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& objects_family = prometheus::BuildCounter()
        .Name("objcat_objects_total")
        .Help("Objects streamed, by outcome")
        .Labels(labels)
        .Register(*registry_);
    objects_success_ = &objects_family.Add({{"result", "success"}});
    objects_failure_ = &objects_family.Add({{"result", "failure"}});

    bytes_written_ = &prometheus::BuildCounter()
        .Name("objcat_bytes_written_total")
        .Help("Object bytes written to the output")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& range_family = prometheus::BuildCounter()
        .Name("objcat_range_requests_total")
        .Help("Ranged GET attempts, by outcome")
        .Labels(labels)
        .Register(*registry_);
    range_success_ = &range_family.Add({{"result", "success"}});
    range_retry_ = &range_family.Add({{"result", "retry"}});
    range_failure_ = &range_family.Add({{"result", "failure"}});

    list_requests_ = &prometheus::BuildCounter()
        .Name("objcat_list_requests_total")
        .Help("Listing pages requested while resolving targets")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    ranges_in_flight_ = &gauge_reg("objcat_ranges_in_flight", "Range requests currently outstanding");
    reorder_buffered_bytes_ = &gauge_reg("objcat_reorder_buffered_bytes",
                                         "Completed range bytes waiting for earlier ranges");

    // --- Histograms ---

    range_duration_ = &prometheus::BuildHistogram()
        .Name("objcat_range_duration_seconds")
        .Help("Ranged GET duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 300});

    object_duration_ = &prometheus::BuildHistogram()
        .Name("objcat_object_duration_seconds")
        .Help("Whole-object fetch duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 300, 900});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
        stopped_ = false;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        if (stopped_) return;
        stopped_ = true;
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    if (!write_file()) {
        log_error("failed to write metrics file %s", prom_file_path_.c_str());
    }
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        if (!write_file()) {
            log_error("failed to write metrics file %s", prom_file_path_.c_str());
        }
    }
}

bool MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return false;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    return !ec;
}

}  // namespace objcat
