#pragma once

#include "objcat/cat/options.hpp"
#include "objcat/cat/wildcard.hpp"
#include "objcat/core/constants.hpp"
#include "objcat/core/log.hpp"
#include "objcat/storage/s3_store.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace objcat {

/// Parse a byte count with an optional binary suffix: "512", "64K", "50M",
/// "1G" (also "KiB"/"MiB"/"GiB", case-insensitive). Empty on malformed or
/// overflowing input.
std::optional<uint64_t> parse_size(const std::string& text);

/// Configuration for one objcat invocation:
///
///   objcat [global options] cat [cat options] <target>
///
/// Precedence: built-in defaults < environment < --config file < flags.
/// A --config file overlays whatever was parsed before it, so flags that
/// follow it win.
struct CliConfig {
    // Global options
    bool json_output = false;
    LogLevel log_level = LogLevel::Info;
    std::string endpoint_url;
    std::string region;
    bool verify_ssl = true;
    bool sign_request = true;
    std::string request_payer;
    uint32_t retry_count = constants::DEFAULT_RETRY_COUNT;

    // Credentials (flags never carry these; JSON file or environment)
    std::string access_key;
    std::string secret_key;
    std::string session_token;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    // Subcommand
    std::string command;
    std::string target;  // as typed

    // cat options
    uint64_t part_size = constants::DEFAULT_PART_SIZE;
    uint32_t concurrency = constants::DEFAULT_CONCURRENCY;
    std::optional<std::string> version_id;
    bool raw = false;
    WildcardMode wildcard_mode = WildcardMode::Segment;
    uint32_t range_timeout_secs = constants::DEFAULT_RANGE_TIMEOUT_SECONDS;
    uint32_t connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECONDS;

    bool show_help = false;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints the problem and a usage hint
    /// to stderr). --help yields a config with show_help set.
    static std::optional<CliConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill unset region, endpoint and credentials from the environment.
    void apply_defaults();

    /// Validate option values. Returns error message or empty string.
    std::string validate() const;

    CatOptions cat_options() const;
    S3StoreConfig store_config(const std::string& bucket) const;
};

/// Full usage text
const char* usage_text();

}  // namespace objcat
