#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace objcat {

// One object to be streamed. A listed object always carries its size;
// an exact key does not until it has been probed with head().
struct ObjectDescriptor {
    std::string key;
    std::optional<std::string> version_id;
    std::optional<uint64_t> size;
    std::string etag;
};

// Parsed "s3://bucket/key..."
struct RemoteUrl {
    std::string scheme;
    std::string bucket;
    std::string key;

    // Empty optional when the text is not a remote URL with a bucket
    static std::optional<RemoteUrl> parse(const std::string& text);

    std::string to_string() const;
};

// What the user asked for, with the bucket already split off
struct Target {
    std::string path_spec;
    std::optional<std::string> version_id;
    bool raw = false;  // disable glob interpretation
};

// A single key, fetched as-is
struct ExactKey {
    std::string key;
};

// Every object directly under a "directory" prefix
struct PrefixTarget {
    std::string prefix;
};

// Every object whose key matches a glob pattern
struct PatternTarget {
    std::string pattern;
    std::string literal_prefix;  // listing prefix
};

using TargetKind = std::variant<ExactKey, PrefixTarget, PatternTarget>;

TargetKind classify_target(const Target& target);

} // namespace objcat
