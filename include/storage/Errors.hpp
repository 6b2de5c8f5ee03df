#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace mg::storage {

enum class ErrorKind {
    Configuration,        // unsupported endpoint, missing credentials; never retried
    TransientIO,          // network or filesystem fault; retry policy lives with the caller
    NotFound,
    AlreadyExists,
    CrossDevice,          // rename across volumes, caller falls back to copy
    UnsupportedOperation, // cross-backend or cross-bucket request
    MalformedPath,
    Verification          // size or checksum mismatch
};

std::string_view to_string(ErrorKind kind);

class StorageError : public std::runtime_error {
public:
    StorageError(const ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// One exception type per kind, so callers can catch exactly the failures they handle.
template <ErrorKind Kind>
class KindedError final : public StorageError {
public:
    explicit KindedError(const std::string& msg) : StorageError(Kind, msg) {}
};

using ConfigurationError = KindedError<ErrorKind::Configuration>;
using TransientIOError = KindedError<ErrorKind::TransientIO>;
using NotFoundError = KindedError<ErrorKind::NotFound>;
using AlreadyExistsError = KindedError<ErrorKind::AlreadyExists>;
using CrossDeviceError = KindedError<ErrorKind::CrossDevice>;
using UnsupportedOperationError = KindedError<ErrorKind::UnsupportedOperation>;
using MalformedPathError = KindedError<ErrorKind::MalformedPath>;
using VerificationFailure = KindedError<ErrorKind::Verification>;

// Maps an OS error to its named kind and throws it. context should name the
// operation and path, e.g. "rename /a -> /b".
[[noreturn]] void throwSystemError(const std::error_code& ec, const std::string& context);
[[noreturn]] void throwErrno(int err, const std::string& context);

}
