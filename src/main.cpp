#include "objcat/cat/sink.hpp"
#include "objcat/cat_command.hpp"
#include "objcat/cli_config.hpp"
#include "objcat/core/log.hpp"
#include "objcat/storage/s3_store.hpp"

#include <csignal>
#include <cstdio>
#include <utility>
#include <unistd.h>

int main(int argc, char* argv[]) {
    // A closed stdout must surface as EPIPE from write(), not kill us
    std::signal(SIGPIPE, SIG_IGN);

    auto config_opt = objcat::CliConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    if (config.show_help) {
        fputs(objcat::usage_text(), stdout);
        return 0;
    }

    objcat::set_log_level(config.log_level);

    objcat::FdSink sink(STDOUT_FILENO);
    return objcat::run_cat_command(config, objcat::create_s3_store, sink);
}
