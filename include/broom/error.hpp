#ifndef BROOM_ERROR_HPP
#define BROOM_ERROR_HPP

#include <stdexcept>
#include <string>
#include <system_error>

namespace Broom {

/**
 * @brief Classes of failure the engine distinguishes.
 *
 * InvalidInput and PolicyViolation block a single item. NotFound,
 * PermissionDenied, EnumerationFailure and IoFailure are reported per item.
 * None of them aborts a batch.
 */
enum class ErrorKind
{
    InvalidInput,
    PolicyViolation,
    NotFound,
    PermissionDenied,
    EnumerationFailure,
    IoFailure
};

/**
 * @return A short stable name for the kind, e.g. "PermissionDenied".
 */
std::string errorKindName(ErrorKind kind);

/**
 * @brief Maps an OS error code onto the engine's taxonomy.
 *
 * ENOENT/ENOTDIR become NotFound, EACCES/EPERM/EROFS become
 * PermissionDenied, anything else IoFailure.
 */
ErrorKind errorKindFromCode(const std::error_code& ec);

/**
 * @class Error
 * @brief Exception carrying an ErrorKind alongside the message.
 */
class Error : public std::runtime_error
{
public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace Broom

#endif // BROOM_ERROR_HPP
