#include "objcat/cli_config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace objcat {

std::optional<uint64_t> parse_size(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    if (pos == 0) {
        return std::nullopt;
    }

    uint64_t value = 0;
    try {
        value = std::stoull(text.substr(0, pos));
    } catch (const std::exception&) {
        return std::nullopt;
    }

    std::string suffix;
    for (size_t i = pos; i < text.size(); ++i) {
        suffix += static_cast<char>(std::toupper(static_cast<unsigned char>(text[i])));
    }

    uint64_t multiplier = 1;
    if (suffix.empty() || suffix == "B") {
        multiplier = 1;
    } else if (suffix == "K" || suffix == "KB" || suffix == "KIB") {
        multiplier = 1024ULL;
    } else if (suffix == "M" || suffix == "MB" || suffix == "MIB") {
        multiplier = 1024ULL * 1024;
    } else if (suffix == "G" || suffix == "GB" || suffix == "GIB") {
        multiplier = 1024ULL * 1024 * 1024;
    } else {
        return std::nullopt;
    }

    if (value > std::numeric_limits<uint64_t>::max() / multiplier) {
        return std::nullopt;
    }
    return value * multiplier;
}

namespace {

bool parse_u32(const std::string& text, uint32_t& out) {
    if (text.empty()) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    try {
        unsigned long long v = std::stoull(text);
        if (v > std::numeric_limits<uint32_t>::max()) return false;
        out = static_cast<uint32_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void report_usage_error(const std::string& message) {
    std::cerr << "Error: " << message << "\n"
              << "Run 'objcat --help' for usage.\n";
}

}  // namespace

const char* usage_text() {
    return
        "Usage: objcat [global options] cat [cat options] s3://bucket/<key|prefix/|pattern>\n"
        "\n"
        "Streams the content of one or more objects to standard output. A key\n"
        "ending in '/' selects the objects directly under that prefix; a key\n"
        "containing *, ? or [...] selects every matching object. Objects are\n"
        "written in ascending key order.\n"
        "\n"
        "Global options:\n"
        "  --json                           Print errors as JSON\n"
        "  --log <level>                    trace, debug, info or error (default: info)\n"
        "  --endpoint-url <url>             Custom S3 endpoint (or S3_ENDPOINT_URL env)\n"
        "  --region <region>                Region (or AWS_REGION env, default: us-east-1)\n"
        "  --no-verify-ssl                  Skip SSL verification\n"
        "  --no-sign-request                Send anonymous requests\n"
        "  --request-payer <who>            Requester-pays header value, e.g. requester\n"
        "  -r, --retry-count <N>            Retries per failed request (default: 10)\n"
        "  --config <path>                  JSON config file\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  -h, --help                       Show this help\n"
        "\n"
        "cat options:\n"
        "  -p, --part-size <size>           Bytes per ranged read, K/M/G suffix allowed (default: 50M)\n"
        "  -c, --concurrency <N>            Ranged reads in flight per object (default: 5)\n"
        "  --version-id <id>                Read a specific version of a single object\n"
        "  --raw                            Treat the key literally, no wildcards\n"
        "  --wildcard-mode <mode>           segment: wildcards stop at '/' (default)\n"
        "                                   flat: wildcards also match '/'\n"
        "  --range-timeout <secs>           Timeout per ranged read (default: 300)\n"
        "  --connect-timeout <secs>         Connection timeout (default: 30)\n"
        "\n"
        "Credentials come from AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and\n"
        "AWS_SESSION_TOKEN, or from the config file.\n";
}

std::optional<CliConfig> CliConfig::from_args(int argc, char* argv[]) {
    CliConfig config;

    auto next_arg = [&](int& i, const std::string& name) -> const char* {
        if (i + 1 >= argc) {
            report_usage_error(name + " requires an argument");
            return nullptr;
        }
        return argv[++i];
    };

    auto u32_arg = [&](int& i, const std::string& name, uint32_t& out) -> bool {
        auto* v = next_arg(i, name);
        if (!v) return false;
        if (!parse_u32(v, out)) {
            report_usage_error("invalid value for " + name + ": " + v);
            return false;
        }
        return true;
    };

    int i = 1;

    // Global options, up to the subcommand
    for (; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--json") {
            config.json_output = true;
        } else if (arg == "--log") {
            auto* v = next_arg(i, "--log");
            if (!v) return std::nullopt;
            auto level = parse_log_level(v);
            if (!level) {
                report_usage_error(std::string("invalid log level: ") + v);
                return std::nullopt;
            }
            config.log_level = *level;
        } else if (arg == "--endpoint-url") {
            auto* v = next_arg(i, "--endpoint-url");
            if (!v) return std::nullopt;
            config.endpoint_url = v;
        } else if (arg == "--region") {
            auto* v = next_arg(i, "--region");
            if (!v) return std::nullopt;
            config.region = v;
        } else if (arg == "--no-verify-ssl") {
            config.verify_ssl = false;
        } else if (arg == "--no-sign-request") {
            config.sign_request = false;
        } else if (arg == "--request-payer") {
            auto* v = next_arg(i, "--request-payer");
            if (!v) return std::nullopt;
            config.request_payer = v;
        } else if (arg == "--retry-count" || arg == "-r") {
            if (!u32_arg(i, arg, config.retry_count)) return std::nullopt;
        } else if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            uint32_t secs = 0;
            if (!u32_arg(i, arg, secs)) return std::nullopt;
            config.metrics_interval_secs = secs;
        } else if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            return config;
        } else if (!arg.empty() && arg[0] == '-') {
            report_usage_error("unknown option: " + arg);
            return std::nullopt;
        } else {
            config.command = arg;
            ++i;
            break;
        }
    }

    if (config.command.empty()) {
        report_usage_error("no command given");
        return std::nullopt;
    }
    if (config.command != "cat") {
        report_usage_error("unknown command: " + config.command);
        return std::nullopt;
    }

    // cat options and the target
    bool options_done = false;
    for (; i < argc; ++i) {
        std::string arg = argv[i];

        bool is_flag = !options_done && arg.size() > 1 && arg[0] == '-';
        if (!is_flag) {
            if (!config.target.empty()) {
                report_usage_error("cat expects a single target, got extra argument: " + arg);
                return std::nullopt;
            }
            config.target = arg;
            continue;
        }

        if (arg == "--") {
            options_done = true;
        } else if (arg == "--part-size" || arg == "-p") {
            auto* v = next_arg(i, arg);
            if (!v) return std::nullopt;
            auto size = parse_size(v);
            if (!size) {
                report_usage_error("invalid value for " + arg + ": " + v);
                return std::nullopt;
            }
            config.part_size = *size;
        } else if (arg == "--concurrency" || arg == "-c") {
            if (!u32_arg(i, arg, config.concurrency)) return std::nullopt;
        } else if (arg == "--version-id") {
            auto* v = next_arg(i, "--version-id");
            if (!v) return std::nullopt;
            config.version_id = std::string(v);
        } else if (arg == "--raw") {
            config.raw = true;
        } else if (arg == "--wildcard-mode") {
            auto* v = next_arg(i, "--wildcard-mode");
            if (!v) return std::nullopt;
            auto mode = parse_wildcard_mode(v);
            if (!mode) {
                report_usage_error(std::string("invalid wildcard mode: ") + v);
                return std::nullopt;
            }
            config.wildcard_mode = *mode;
        } else if (arg == "--range-timeout") {
            if (!u32_arg(i, arg, config.range_timeout_secs)) return std::nullopt;
        } else if (arg == "--connect-timeout") {
            if (!u32_arg(i, arg, config.connect_timeout_secs)) return std::nullopt;
        } else if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            return config;
        } else {
            report_usage_error("unknown option for cat: " + arg);
            return std::nullopt;
        }
    }

    if (config.target.empty()) {
        report_usage_error("cat requires a target");
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool CliConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("endpoint_url")) endpoint_url = j["endpoint_url"].get<std::string>();
        if (j.contains("region")) region = j["region"].get<std::string>();
        if (j.contains("verify_ssl")) verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("sign_request")) sign_request = j["sign_request"].get<bool>();
        if (j.contains("request_payer")) request_payer = j["request_payer"].get<std::string>();
        if (j.contains("retry_count")) retry_count = j["retry_count"].get<uint32_t>();
        if (j.contains("concurrency")) concurrency = j["concurrency"].get<uint32_t>();
        if (j.contains("range_timeout")) range_timeout_secs = j["range_timeout"].get<uint32_t>();
        if (j.contains("connect_timeout")) connect_timeout_secs = j["connect_timeout"].get<uint32_t>();
        if (j.contains("json")) json_output = j["json"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();
        if (j.contains("access_key")) access_key = j["access_key"].get<std::string>();
        if (j.contains("secret_key")) secret_key = j["secret_key"].get<std::string>();
        if (j.contains("session_token")) session_token = j["session_token"].get<std::string>();

        // Either a byte count or a string with a size suffix
        if (j.contains("part_size")) {
            if (j["part_size"].is_string()) {
                auto size = parse_size(j["part_size"].get<std::string>());
                if (!size) {
                    std::cerr << "Error parsing config: invalid part_size: "
                              << j["part_size"].get<std::string>() << "\n";
                    return false;
                }
                part_size = *size;
            } else {
                part_size = j["part_size"].get<uint64_t>();
            }
        }

        if (j.contains("wildcard_mode")) {
            auto name = j["wildcard_mode"].get<std::string>();
            auto mode = parse_wildcard_mode(name);
            if (!mode) {
                std::cerr << "Error parsing config: invalid wildcard_mode: " << name << "\n";
                return false;
            }
            wildcard_mode = *mode;
        }

        if (j.contains("log")) {
            auto name = j["log"].get<std::string>();
            auto level = parse_log_level(name);
            if (!level) {
                std::cerr << "Error parsing config: invalid log level: " << name << "\n";
                return false;
            }
            log_level = *level;
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void CliConfig::apply_defaults() {
    auto env_fallback = [](std::string& field, const char* name) {
        if (field.empty()) {
            if (const char* v = std::getenv(name)) {
                field = v;
            }
        }
    };

    env_fallback(endpoint_url, "S3_ENDPOINT_URL");
    env_fallback(region, "AWS_REGION");
    env_fallback(region, "AWS_DEFAULT_REGION");
    env_fallback(access_key, "AWS_ACCESS_KEY_ID");
    env_fallback(secret_key, "AWS_SECRET_ACCESS_KEY");
    env_fallback(session_token, "AWS_SESSION_TOKEN");

    if (region.empty()) {
        region = constants::DEFAULT_REGION;
    }
}

std::string CliConfig::validate() const {
    std::string err = cat_options().validate();
    if (!err.empty()) return err;
    if (!endpoint_url.empty() &&
        endpoint_url.rfind("http://", 0) != 0 && endpoint_url.rfind("https://", 0) != 0) {
        return "endpoint url must start with http:// or https://: " + endpoint_url;
    }
    if (sign_request && (access_key.empty() != secret_key.empty())) {
        return "access key and secret key must be given together";
    }
    return {};
}

CatOptions CliConfig::cat_options() const {
    CatOptions options;
    options.part_size = part_size;
    options.concurrency = concurrency;
    options.max_retries = retry_count;
    options.range_timeout = std::chrono::seconds(range_timeout_secs);
    options.connect_timeout = std::chrono::seconds(connect_timeout_secs);
    options.wildcard_mode = wildcard_mode;
    return options;
}

S3StoreConfig CliConfig::store_config(const std::string& bucket) const {
    S3StoreConfig store;
    store.bucket = bucket;
    store.region = region.empty() ? constants::DEFAULT_REGION : region;
    store.endpoint = endpoint_url;
    store.use_path_style = !endpoint_url.empty();
    store.access_key = access_key;
    store.secret_key = secret_key;
    store.session_token = session_token;
    // Without credentials there is nothing to sign with
    store.sign_request = sign_request && !access_key.empty();
    store.verify_ssl = verify_ssl;
    store.request_payer = request_payer;
    store.connect_timeout_secs = connect_timeout_secs;
    store.request_timeout_secs = range_timeout_secs;
    store.max_retries = retry_count;
    return store;
}

}  // namespace objcat
