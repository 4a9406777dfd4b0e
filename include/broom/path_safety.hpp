#ifndef BROOM_PATH_SAFETY_HPP
#define BROOM_PATH_SAFETY_HPP

#include "broom/error.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace Broom {

/**
 * @brief Outcome tags of path validation.
 */
enum class ValidationStatus
{
    Safe,
    ProtectedPath,
    OutsideAllowedPaths,
    SymlinkToProtected,
    PathTraversal,
    DoesNotExist,
    InvalidPath
};

/**
 * @struct ValidationResult
 * @brief Result of validating one path. For ProtectedPath, protectedPath
 *        names the entry that matched.
 */
struct ValidationResult
{
    ValidationStatus status = ValidationStatus::InvalidPath;
    std::string protectedPath;

    static ValidationResult safe() { return {ValidationStatus::Safe, ""}; }
    static ValidationResult protectedBy(const std::string& entry) { return {ValidationStatus::ProtectedPath, entry}; }
    static ValidationResult of(ValidationStatus status) { return {status, ""}; }

    bool isSafe() const { return status == ValidationStatus::Safe; }

    /**
     * @return A human-readable explanation, e.g. "Protected system path: /usr".
     */
    std::string reason() const;

    /**
     * @return InvalidInput for malformed paths, NotFound for DoesNotExist,
     *         PolicyViolation for every other rejection.
     */
    ErrorKind errorKind() const;

    bool operator==(const ValidationResult& other) const
    {
        return status == other.status && protectedPath == other.protectedPath;
    }
    bool operator!=(const ValidationResult& other) const { return !(*this == other); }
};

/**
 * @class SafetyPolicy
 * @brief Immutable catalogs the validator decides against.
 *
 * Every entry is stored in normalized form. The allow-list cannot be
 * widened from configuration; extra protected paths can only tighten it.
 */
class SafetyPolicy
{
public:
    /**
     * @param home               The user's home directory.
     * @param protectedPaths     Paths that may never be deleted themselves.
     * @param protectedHomeNames Home subdirectories that may never be deleted
     *                           (e.g. "Documents").
     * @param allowedRoots       Roots whose strict descendants may be deleted.
     */
    SafetyPolicy(const std::string& home,
                 const std::vector<std::string>& protectedPaths,
                 const std::vector<std::string>& protectedHomeNames,
                 const std::vector<std::string>& allowedRoots);

    /**
     * @brief The built-in policy for the given home directory.
     *
     * @param home           The user's home directory.
     * @param extraProtected Additional protected paths ("~" allowed).
     */
    static SafetyPolicy defaults(const std::string& home,
                                 const std::vector<std::string>& extraProtected = {});

    const std::string& home() const { return home_; }
    const std::vector<std::string>& protectedPaths() const { return protectedPaths_; }
    const std::vector<std::string>& protectedHomePaths() const { return protectedHomePaths_; }
    const std::vector<std::string>& allowedRoots() const { return allowedRoots_; }

private:
    std::string home_;
    std::vector<std::string> protectedPaths_;
    std::vector<std::string> protectedHomePaths_;
    std::vector<std::string> allowedRoots_;
};

namespace PathSafety {

/**
 * @brief Lexically normalizes an absolute or relative path.
 *
 * Collapses repeated separators and "." segments, resolves ".." against
 * the preceding segment, and drops trailing separators. Symlinks are not
 * consulted.
 */
std::string normalizePath(const std::string& path);

/**
 * @return True if any segment of the path is exactly "..".
 */
bool hasTraversal(const std::string& path);

/**
 * @return True if path is a strict descendant of root. Both arguments
 *         must already be normalized.
 */
bool isStrictDescendant(const std::string& path, const std::string& root);

/**
 * @brief Decides whether a path may be deleted under the given policy.
 *
 * Rules, first match wins: empty/malformed, "..", protected entry,
 * protected home folder, outside the allow-list, symlink into a protected
 * location, symlinked parent leading out of the allow-list or into a
 * protected location, safe. A leading "~" is expanded with the policy's
 * home. The filesystem is only queried through lstat, readlink and the
 * resolution of the containing directory.
 */
ValidationResult validate(const std::string& path, const SafetyPolicy& policy);

/**
 * @brief Validates every path independently, preserving input order.
 *
 * Large batches are split across worker tasks.
 */
std::vector<std::pair<std::string, ValidationResult>> validateBatch(const std::vector<std::string>& paths,
                                                                     const SafetyPolicy& policy);

/**
 * @return The paths that validate as safe, in input order.
 */
std::vector<std::string> filterSafePaths(const std::vector<std::string>& paths,
                                         const SafetyPolicy& policy);

/**
 * @brief Measures a file or directory in bytes.
 *
 * Regular files report their stat size. Directories report the sum over
 * every regular file found by a full traversal. Symlinks are never
 * followed and count as 0 bytes, at the top level and inside directories.
 *
 * @throws Broom::Error NotFound if the path does not exist,
 *         the mapped stat error (usually PermissionDenied) if it cannot be
 *         stat-ed, EnumerationFailure if a directory cannot be listed.
 */
std::uint64_t measureSize(const std::string& path);

} // namespace PathSafety
} // namespace Broom

#endif // BROOM_PATH_SAFETY_HPP
