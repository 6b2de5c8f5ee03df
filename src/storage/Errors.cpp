#include "storage/Errors.hpp"

#include <cerrno>

namespace mg::storage {

std::string_view to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::TransientIO: return "transient_io";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::AlreadyExists: return "already_exists";
        case ErrorKind::CrossDevice: return "cross_device";
        case ErrorKind::UnsupportedOperation: return "unsupported_operation";
        case ErrorKind::MalformedPath: return "malformed_path";
        case ErrorKind::Verification: return "verification";
    }
    return "unknown";
}

void throwSystemError(const std::error_code& ec, const std::string& context) {
    const auto msg = context + ": " + ec.message();
    if (ec == std::errc::no_such_file_or_directory) throw NotFoundError(msg);
    if (ec == std::errc::cross_device_link) throw CrossDeviceError(msg);
    if (ec == std::errc::file_exists) throw AlreadyExistsError(msg);
    throw TransientIOError(msg);
}

void throwErrno(const int err, const std::string& context) {
    throwSystemError(std::error_code(err, std::generic_category()), context);
}

}
