#include "broom/error.hpp"

#include <cerrno>

namespace Broom {

std::string errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::InvalidInput:       return "InvalidInput";
    case ErrorKind::PolicyViolation:    return "PolicyViolation";
    case ErrorKind::NotFound:           return "NotFound";
    case ErrorKind::PermissionDenied:   return "PermissionDenied";
    case ErrorKind::EnumerationFailure: return "EnumerationFailure";
    case ErrorKind::IoFailure:          return "IoFailure";
    }
    return "IoFailure";
}

ErrorKind errorKindFromCode(const std::error_code& ec)
{
    if (ec.category() != std::generic_category() && ec.category() != std::system_category()) {
        return ErrorKind::IoFailure;
    }
    switch (ec.value()) {
    case ENOENT:
    case ENOTDIR:
        return ErrorKind::NotFound;
    case EACCES:
    case EPERM:
    case EROFS:
        return ErrorKind::PermissionDenied;
    default:
        return ErrorKind::IoFailure;
    }
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message),
      kind_(kind)
{
}

} // namespace Broom
