#include "broom/models.hpp"

#include <filesystem>

namespace fs = std::filesystem;

// ============================================================================
// Anonymous Namespace - Key/name tables
// ============================================================================
namespace {
    template <typename E>
    struct NamedValue
    {
        E value;
        const char* key;
        const char* name;
    };

    const std::vector<NamedValue<Broom::CleanupCategory>> cleanupCategories = {
        {Broom::CleanupCategory::SystemCaches,       "system_caches",        "System Caches"},
        {Broom::CleanupCategory::UserCaches,         "user_caches",          "User Caches"},
        {Broom::CleanupCategory::Logs,               "logs",                 "Logs"},
        {Broom::CleanupCategory::Trash,              "trash",                "Trash"},
        {Broom::CleanupCategory::XcodeDerivedData,   "xcode_derived_data",   "Xcode Derived Data"},
        {Broom::CleanupCategory::XcodeArchives,      "xcode_archives",       "Xcode Archives"},
        {Broom::CleanupCategory::XcodeDeviceSupport, "xcode_device_support", "Xcode Device Support"},
        {Broom::CleanupCategory::Homebrew,           "homebrew",             "Homebrew Cache"},
        {Broom::CleanupCategory::Npm,                "npm",                  "npm Cache"},
        {Broom::CleanupCategory::Pip,                "pip",                  "pip Cache"},
    };

    const std::vector<NamedValue<Broom::LeftoverCategory>> leftoverCategories = {
        {Broom::LeftoverCategory::Cache,              "cache",               "Cache"},
        {Broom::LeftoverCategory::Preferences,        "preferences",         "Preferences"},
        {Broom::LeftoverCategory::ApplicationSupport, "application_support", "Application Support"},
        {Broom::LeftoverCategory::Container,          "container",           "Container"},
        {Broom::LeftoverCategory::Logs,               "logs",                "Logs"},
        {Broom::LeftoverCategory::LaunchItem,         "launch_item",         "Launch Item"},
        {Broom::LeftoverCategory::Cookies,            "cookies",             "Cookies"},
        {Broom::LeftoverCategory::SavedState,         "saved_state",         "Saved State"},
        {Broom::LeftoverCategory::Webkit,             "webkit",              "WebKit Data"},
        {Broom::LeftoverCategory::CrashReports,       "crash_reports",       "Crash Reports"},
        {Broom::LeftoverCategory::Other,              "other",               "Other"},
    };

    const std::vector<NamedValue<Broom::LeftoverConfidence>> confidences = {
        {Broom::LeftoverConfidence::Low,    "low",    "Low"},
        {Broom::LeftoverConfidence::Medium, "medium", "Medium"},
        {Broom::LeftoverConfidence::High,   "high",   "High"},
    };

    const std::vector<NamedValue<Broom::PermissionGroup>> permissionGroups = {
        {Broom::PermissionGroup::FullDiskAccess,  "full_disk_access", "Full Disk Access"},
        {Broom::PermissionGroup::UserFolders,     "user_folders",     "User Folders"},
        {Broom::PermissionGroup::SystemFolders,   "system_folders",   "System Folders"},
        {Broom::PermissionGroup::ApplicationData, "application_data", "Application Data"},
        {Broom::PermissionGroup::StartupPaths,    "startup_paths",    "Startup Paths"},
    };

    template <typename E>
    const NamedValue<E>* findByValue(const std::vector<NamedValue<E>>& table, E value)
    {
        for (const auto& entry : table) {
            if (entry.value == value) {
                return &entry;
            }
        }
        return nullptr;
    }

    template <typename E>
    std::optional<E> findByKey(const std::vector<NamedValue<E>>& table, const std::string& key)
    {
        for (const auto& entry : table) {
            if (key == entry.key) {
                return entry.value;
            }
        }
        return std::nullopt;
    }
} // end anonymous namespace

namespace Broom {

// ============================================================================
// Cleanup categories
// ============================================================================
const std::vector<CleanupCategory>& allCleanupCategories()
{
    static const std::vector<CleanupCategory> all = [] {
        std::vector<CleanupCategory> values;
        for (const auto& entry : cleanupCategories) {
            values.push_back(entry.value);
        }
        return values;
    }();
    return all;
}

std::string cleanupCategoryKey(CleanupCategory category)
{
    const auto* entry = findByValue(cleanupCategories, category);
    return entry ? entry->key : "";
}

std::string cleanupCategoryName(CleanupCategory category)
{
    const auto* entry = findByValue(cleanupCategories, category);
    return entry ? entry->name : "";
}

std::optional<CleanupCategory> parseCleanupCategory(const std::string& key)
{
    return findByKey(cleanupCategories, key);
}

std::uint64_t CleanupGroup::totalSize() const
{
    std::uint64_t total = 0;
    for (const auto& item : items) {
        total += item.sizeBytes;
    }
    return total;
}

std::size_t CleanupGroup::selectedCount() const
{
    std::size_t count = 0;
    for (const auto& item : items) {
        if (item.isSelected) {
            ++count;
        }
    }
    return count;
}

std::uint64_t CleanupGroup::selectedSize() const
{
    std::uint64_t total = 0;
    for (const auto& item : items) {
        if (item.isSelected) {
            total += item.sizeBytes;
        }
    }
    return total;
}

// ============================================================================
// Leftovers
// ============================================================================
std::string leftoverCategoryKey(LeftoverCategory category)
{
    const auto* entry = findByValue(leftoverCategories, category);
    return entry ? entry->key : "";
}

std::string leftoverCategoryName(LeftoverCategory category)
{
    const auto* entry = findByValue(leftoverCategories, category);
    return entry ? entry->name : "";
}

std::optional<LeftoverCategory> parseLeftoverCategory(const std::string& key)
{
    return findByKey(leftoverCategories, key);
}

std::string confidenceName(LeftoverConfidence confidence)
{
    const auto* entry = findByValue(confidences, confidence);
    return entry ? entry->name : "";
}

std::optional<LeftoverConfidence> parseConfidence(const std::string& name)
{
    return findByKey(confidences, name);
}

std::string matchRuleName(MatchRule rule)
{
    switch (rule) {
    case MatchRule::IdentifierMatch:    return "identifier match";
    case MatchRule::IdentifierFamily:   return "identifier family";
    case MatchRule::NameMatch:          return "name match";
    case MatchRule::SystemItem:         return "system item";
    case MatchRule::DeveloperMatch:     return "known developer";
    case MatchRule::BundlePattern:      return "bundle pattern";
    case MatchRule::DeveloperNameFuzzy: return "developer name";
    case MatchRule::NoSignal:           return "no signal";
    }
    return "no signal";
}

std::string LeftoverFile::name() const
{
    return fs::path(path).filename().string();
}

std::optional<std::string> InstalledApp::developerName() const
{
    size_t firstDot = identifier.find('.');
    if (firstDot == std::string::npos) {
        return std::nullopt;
    }
    size_t secondDot = identifier.find('.', firstDot + 1);
    std::string developer = identifier.substr(firstDot + 1,
        secondDot == std::string::npos ? std::string::npos : secondDot - firstDot - 1);
    if (developer.empty()) {
        return std::nullopt;
    }
    return developer;
}

// ============================================================================
// Folder access
// ============================================================================
std::string folderAccessStatusName(FolderAccessStatus status)
{
    switch (status) {
    case FolderAccessStatus::NotExists:  return "not found";
    case FolderAccessStatus::Denied:     return "denied";
    case FolderAccessStatus::Accessible: return "accessible";
    case FolderAccessStatus::Checking:   return "checking";
    }
    return "not found";
}

const std::vector<PermissionGroup>& allPermissionGroups()
{
    static const std::vector<PermissionGroup> all = [] {
        std::vector<PermissionGroup> values;
        for (const auto& entry : permissionGroups) {
            values.push_back(entry.value);
        }
        return values;
    }();
    return all;
}

std::string permissionGroupKey(PermissionGroup group)
{
    const auto* entry = findByValue(permissionGroups, group);
    return entry ? entry->key : "";
}

std::string permissionGroupName(PermissionGroup group)
{
    const auto* entry = findByValue(permissionGroups, group);
    return entry ? entry->name : "";
}

std::optional<PermissionGroup> parsePermissionGroup(const std::string& key)
{
    return findByKey(permissionGroups, key);
}

} // namespace Broom
