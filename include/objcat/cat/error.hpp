#pragma once

#include "objcat/storage/backend.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace objcat {

// Every failure cat can report
enum class ErrorKind {
    SourceTypeError,
    InvalidVersionScope,
    NoMatch,
    NotFound,
    VersionNotFound,
    TransientFetchFailure,  // retryable, never surfaced after a successful retry
    FatalFetchFailure,
    InvalidPattern,
    InvalidConfig,
    ListFailure,
    Cancelled
};

const char* error_kind_name(ErrorKind kind);

// A classified error with its user-facing message
struct CatError {
    ErrorKind kind = ErrorKind::FatalFetchFailure;
    std::string message;

    static CatError source_type();
    static CatError invalid_version_scope();
    static CatError no_match();
    static CatError not_found();
    static CatError version_not_found(const std::string& version_id);
    static CatError fatal_fetch(const std::string& key, uint64_t start, uint64_t end,
                                uint32_t attempts, const std::string& detail);
    static CatError invalid_pattern(const std::string& pattern, const std::string& why);
    static CatError invalid_config(const std::string& why);
    static CatError list_failure(const std::string& detail);
    static CatError cancelled();
};

// Kind for a failed store request. Ok is not a failure and throws
// std::invalid_argument.
ErrorKind classify_store_failure(StoreStatus status, bool version_pinned);

// 0 on success, 1 for any classified error
int exit_code_for(const std::optional<CatError>& error);

} // namespace objcat
