#pragma once

#include <stdexcept>
#include <string>

namespace admedia {

enum class ErrorKind {
    NotFound,
    InvalidInput,
    StorageWriteFailure,
    CorruptAnalysis,
};

const char* error_kind_name(ErrorKind kind);

/// Typed failure raised by the cache write path and by input validation.
/// Read-path misses are reported as empty optionals, never as exceptions.
class CacheError : public std::runtime_error {
public:
    CacheError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace admedia
