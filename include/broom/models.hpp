#ifndef BROOM_MODELS_HPP
#define BROOM_MODELS_HPP

#include "broom/error.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Broom {

// ============================================================================
// Cleanup catalog
// ============================================================================

/**
 * @brief Categories of cleanable items, in display order.
 */
enum class CleanupCategory
{
    SystemCaches,
    UserCaches,
    Logs,
    Trash,
    XcodeDerivedData,
    XcodeArchives,
    XcodeDeviceSupport,
    Homebrew,
    Npm,
    Pip
};

/**
 * @return Every CleanupCategory in display order.
 */
const std::vector<CleanupCategory>& allCleanupCategories();

/**
 * @return The configuration key of a category, e.g. "user_caches".
 */
std::string cleanupCategoryKey(CleanupCategory category);

/**
 * @return The display name of a category, e.g. "User Caches".
 */
std::string cleanupCategoryName(CleanupCategory category);

/**
 * @brief Parses a configuration key back into a category.
 * @return The category, or std::nullopt for an unknown key.
 */
std::optional<CleanupCategory> parseCleanupCategory(const std::string& key);

/**
 * @struct CleanupPathDefinition
 * @brief One configured cleanup pattern, e.g. "~/.cache/*".
 *
 * The pattern may start with "~" and may contain a single "*" marker.
 */
struct CleanupPathDefinition
{
    std::string pattern;
    CleanupCategory category = CleanupCategory::UserCaches;
    std::string description;
    bool requiresRoot = false;
    bool safeToClean = true;
};

/**
 * @struct CleanableItem
 * @brief A concrete, measured path the disk cleaner offers for removal.
 */
struct CleanableItem
{
    std::string id;
    std::string path;
    std::string name;
    std::uint64_t sizeBytes = 0;
    CleanupCategory category = CleanupCategory::UserCaches;
    bool isSelected = true;
};

/**
 * @struct CleanupGroup
 * @brief Cleanable items of one category.
 */
struct CleanupGroup
{
    CleanupCategory category = CleanupCategory::UserCaches;
    std::vector<CleanableItem> items;

    std::uint64_t totalSize() const;
    std::size_t selectedCount() const;
    std::uint64_t selectedSize() const;
};

// ============================================================================
// Leftovers and installed applications
// ============================================================================

enum class LeftoverCategory
{
    Cache,
    Preferences,
    ApplicationSupport,
    Container,
    Logs,
    LaunchItem,
    Cookies,
    SavedState,
    Webkit,
    CrashReports,
    Other
};

std::string leftoverCategoryKey(LeftoverCategory category);
std::string leftoverCategoryName(LeftoverCategory category);
std::optional<LeftoverCategory> parseLeftoverCategory(const std::string& key);

/**
 * @brief Detector certainty, totally ordered: Low < Medium < High.
 */
enum class LeftoverConfidence
{
    Low = 0,
    Medium = 1,
    High = 2
};

std::string confidenceName(LeftoverConfidence confidence);
std::optional<LeftoverConfidence> parseConfidence(const std::string& name);

/**
 * @brief The classification rule that decided a candidate's fate.
 */
enum class MatchRule
{
    IdentifierMatch,     // token == installed identifier
    IdentifierFamily,    // token and installed identifier share a dotted prefix
    NameMatch,           // file name contains an installed app name
    SystemItem,          // ignored system pattern
    DeveloperMatch,      // reverse-DNS developer segment is known
    BundlePattern,       // reverse-DNS token, developer unknown
    DeveloperNameFuzzy,  // plain name mentions a known developer
    NoSignal
};

std::string matchRuleName(MatchRule rule);

/**
 * @struct LeftoverFile
 * @brief Residue believed to belong to an application that is gone.
 */
struct LeftoverFile
{
    std::string id;
    std::string path;
    std::uint64_t sizeBytes = 0;
    LeftoverCategory category = LeftoverCategory::Other;
    LeftoverConfidence confidence = LeftoverConfidence::Low;
    MatchRule rule = MatchRule::NoSignal;
    std::optional<std::string> relatedIdentifier;
    std::optional<std::chrono::system_clock::time_point> modified;

    std::string name() const;
};

/**
 * @struct InstalledApp
 * @brief Registry entry for an installed application.
 *
 * Two entries are equal when their identifiers are equal.
 */
struct InstalledApp
{
    std::string id;
    std::string name;
    std::string identifier;
    std::string path;
    std::optional<std::string> version;
    std::uint64_t sizeBytes = 0;

    /**
     * @brief Second reverse-DNS segment of the identifier,
     *        e.g. "com.microsoft.Word" -> "microsoft".
     */
    std::optional<std::string> developerName() const;

    bool operator==(const InstalledApp& other) const { return identifier == other.identifier; }
    bool operator!=(const InstalledApp& other) const { return !(*this == other); }
};

// ============================================================================
// Folder access
// ============================================================================

enum class FolderAccessStatus
{
    NotExists,
    Denied,
    Accessible,
    Checking
};

std::string folderAccessStatusName(FolderAccessStatus status);

/**
 * @brief Groups of the permissions catalog.
 */
enum class PermissionGroup
{
    FullDiskAccess,
    UserFolders,
    SystemFolders,
    ApplicationData,
    StartupPaths
};

const std::vector<PermissionGroup>& allPermissionGroups();
std::string permissionGroupKey(PermissionGroup group);
std::string permissionGroupName(PermissionGroup group);
std::optional<PermissionGroup> parsePermissionGroup(const std::string& key);

/**
 * @struct FolderAccessInfo
 * @brief One entry of the permissions catalog and its probed status.
 *
 * A folder that was never probed has no lastChecked value.
 */
struct FolderAccessInfo
{
    std::string path;
    std::string displayName;
    PermissionGroup group = PermissionGroup::ApplicationData;
    bool requiresElevatedAccess = false;
    bool canTriggerConsentDialog = false;
    FolderAccessStatus status = FolderAccessStatus::NotExists;
    std::optional<std::chrono::system_clock::time_point> lastChecked;
};

// ============================================================================
// Deletion
// ============================================================================

struct DeletionCandidate
{
    std::string path;
    std::uint64_t sizeBytes = 0;
};

struct DeletionError
{
    std::string path;
    std::string reason;
    ErrorKind kind = ErrorKind::IoFailure;
};

/**
 * @struct DeletionResult
 * @brief Outcome of one deletion batch.
 */
struct DeletionResult
{
    std::size_t successCount = 0;
    std::size_t failedCount = 0;
    std::vector<DeletionError> errors;
    std::uint64_t freedBytes = 0;
    std::vector<std::string> trashedPaths;
};

} // namespace Broom

namespace std {

template <>
struct hash<Broom::InstalledApp>
{
    size_t operator()(const Broom::InstalledApp& app) const
    {
        return hash<string>()(app.identifier);
    }
};

} // namespace std

#endif // BROOM_MODELS_HPP
