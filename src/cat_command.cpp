#include "objcat/cat_command.hpp"
#include "objcat/cat/error.hpp"
#include "objcat/cat/pipeline.hpp"
#include "objcat/cat/target.hpp"
#include "objcat/core/log.hpp"
#include "objcat/metrics.hpp"
#include "objcat/report.hpp"

#include <exception>
#include <map>
#include <optional>
#include <string>

namespace objcat {

int run_cat_command(const CliConfig& config,
                    const StoreFactory& make_store,
                    OutputSink& sink,
                    FILE* err_out) {
    ErrorReport report;
    report.operation = "cat";
    report.command = "cat " + config.target;

    auto fail = [&](const CatError& error) {
        report.message = error.message;
        print_error_report(report, config.json_output, err_out);
        return exit_code_for(error);
    };

    auto err = config.validate();
    if (!err.empty()) {
        return fail(CatError::invalid_config(err));
    }

    // Checked before any store exists, so a local path never reaches the network
    auto url = RemoteUrl::parse(config.target);
    if (!url) {
        return fail(CatError::source_type());
    }

    std::unique_ptr<MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<MetricsExporter>(
            config.metrics_file,
            std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"bucket", url->bucket}});
        metrics->start();
        log_debug("metrics: %s every %zus",
                  config.metrics_file.c_str(), config.metrics_interval_secs);
    }

    Target target;
    target.path_spec = url->key;
    target.version_id = config.version_id;
    target.raw = config.raw;

    std::optional<CatError> result;
    try {
        auto store = make_store(config.store_config(url->bucket));
        CatPipeline pipeline(*store, config.cat_options(), metrics.get());

        result = pipeline.run(target, sink);

        const auto& stats = pipeline.stats();
        log_debug("%u of %u object(s), %llu bytes, %u list request(s)",
                  stats.objects_completed, stats.objects_resolved,
                  static_cast<unsigned long long>(stats.bytes_written),
                  stats.list_requests);
    } catch (const std::exception& e) {
        result = CatError{ErrorKind::FatalFetchFailure, e.what()};
    }

    if (metrics) {
        metrics->stop();
    }

    if (result) {
        return fail(*result);
    }
    return 0;
}

}  // namespace objcat
