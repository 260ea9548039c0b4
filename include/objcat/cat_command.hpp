#pragma once

#include "objcat/cat/sink.hpp"
#include "objcat/cli_config.hpp"
#include "objcat/storage/backend.hpp"
#include "objcat/storage/s3_store.hpp"

#include <cstdio>
#include <functional>
#include <memory>

namespace objcat {

using StoreFactory = std::function<std::unique_ptr<ObjectStore>(const S3StoreConfig&)>;

// Run "cat" for a parsed configuration: check the target, build the store
// through the factory (only for remote targets), stream to the sink and
// print the error envelope to err_out on failure. Returns the exit code.
int run_cat_command(const CliConfig& config,
                    const StoreFactory& make_store,
                    OutputSink& sink,
                    FILE* err_out = stderr);

}  // namespace objcat
