#include "objcat/cat/target.hpp"
#include "objcat/cat/wildcard.hpp"
#include "objcat/core/constants.hpp"

namespace objcat {

std::optional<RemoteUrl> RemoteUrl::parse(const std::string& text) {
    const std::string scheme_sep = "://";
    size_t scheme_end = text.find(scheme_sep);
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }

    RemoteUrl url;
    url.scheme = text.substr(0, scheme_end);
    if (url.scheme != constants::REMOTE_SCHEME) {
        return std::nullopt;
    }

    std::string rest = text.substr(scheme_end + scheme_sep.size());
    size_t slash = rest.find(constants::KEY_SEPARATOR);
    if (slash == std::string::npos) {
        url.bucket = rest;
    } else {
        url.bucket = rest.substr(0, slash);
        url.key = rest.substr(slash + 1);
    }

    if (url.bucket.empty()) {
        return std::nullopt;
    }
    return url;
}

std::string RemoteUrl::to_string() const {
    std::string s = scheme + "://" + bucket;
    if (!key.empty()) {
        s += "/" + key;
    }
    return s;
}

TargetKind classify_target(const Target& target) {
    const std::string& spec = target.path_spec;

    if (!target.raw && has_glob(spec)) {
        return PatternTarget{spec, glob_literal_prefix(spec)};
    }
    if (target.raw && !spec.empty()) {
        return ExactKey{spec};
    }
    std::string key = target.raw ? spec : unescape_glob(spec);
    if (key.empty() || key.back() == constants::KEY_SEPARATOR) {
        return PrefixTarget{key};
    }
    return ExactKey{key};
}

} // namespace objcat
