#include "objcat/cat/error.hpp"

#include <stdexcept>

namespace objcat {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SourceTypeError: return "SourceTypeError";
        case ErrorKind::InvalidVersionScope: return "InvalidVersionScope";
        case ErrorKind::NoMatch: return "NoMatch";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::VersionNotFound: return "VersionNotFound";
        case ErrorKind::TransientFetchFailure: return "TransientFetchFailure";
        case ErrorKind::FatalFetchFailure: return "FatalFetchFailure";
        case ErrorKind::InvalidPattern: return "InvalidPattern";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
        case ErrorKind::ListFailure: return "ListFailure";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

CatError CatError::source_type() {
    return {ErrorKind::SourceTypeError, "source must be a remote object"};
}

CatError CatError::invalid_version_scope() {
    return {ErrorKind::InvalidVersionScope,
            "wildcard/prefix operations are disabled with --version-id flag"};
}

CatError CatError::no_match() {
    return {ErrorKind::NoMatch, "no object found"};
}

CatError CatError::not_found() {
    return {ErrorKind::NotFound, "object not found"};
}

CatError CatError::version_not_found(const std::string& version_id) {
    return {ErrorKind::VersionNotFound, "version " + version_id + " not found"};
}

CatError CatError::fatal_fetch(const std::string& key, uint64_t start, uint64_t end,
                               uint32_t attempts, const std::string& detail) {
    return {ErrorKind::FatalFetchFailure,
            "failed to read " + key + " bytes=" + std::to_string(start) + "-" +
                std::to_string(end) + " after " + std::to_string(attempts) +
                (attempts == 1 ? " attempt: " : " attempts: ") + detail};
}

CatError CatError::invalid_pattern(const std::string& pattern, const std::string& why) {
    return {ErrorKind::InvalidPattern, "invalid wildcard pattern \"" + pattern + "\": " + why};
}

CatError CatError::invalid_config(const std::string& why) {
    return {ErrorKind::InvalidConfig, why};
}

CatError CatError::list_failure(const std::string& detail) {
    return {ErrorKind::ListFailure, "list failed: " + detail};
}

CatError CatError::cancelled() {
    return {ErrorKind::Cancelled, "output stream closed"};
}

ErrorKind classify_store_failure(StoreStatus status, bool version_pinned) {
    switch (status) {
        case StoreStatus::NotFound:
            return version_pinned ? ErrorKind::VersionNotFound : ErrorKind::NotFound;
        case StoreStatus::NoSuchVersion:
            return ErrorKind::VersionNotFound;
        case StoreStatus::Transient:
            return ErrorKind::TransientFetchFailure;
        case StoreStatus::Fatal:
            return ErrorKind::FatalFetchFailure;
        case StoreStatus::Cancelled:
            return ErrorKind::Cancelled;
        case StoreStatus::Ok:
            break;
    }
    throw std::invalid_argument("classify_store_failure: status is not a failure");
}

int exit_code_for(const std::optional<CatError>& error) {
    return error ? 1 : 0;
}

} // namespace objcat
