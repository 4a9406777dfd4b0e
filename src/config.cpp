#include "broom/config.hpp"
#include "broom/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

// ============================================================================
// Anonymous Namespace - Built-in catalogs
// ============================================================================
namespace {
    using Broom::CleanupCategory;
    using Broom::LeftoverCategory;
    using Broom::PermissionGroup;

    const char* defaultConfigPath = "/etc/broom/broom.yaml";

    std::vector<Broom::CleanupPathDefinition> defaultCleanupPaths()
    {
        return {
            // System caches
            {"~/Library/Caches/*", CleanupCategory::UserCaches, "User application caches", false, true},
            {"/Library/Caches/*", CleanupCategory::SystemCaches, "System-wide caches", true, true},

            // Logs
            {"~/Library/Logs/*", CleanupCategory::Logs, "User application logs", false, true},
            {"/Library/Logs/*", CleanupCategory::Logs, "System logs", true, true},
            {"/private/var/log/*", CleanupCategory::Logs, "System log files", true, false},

            // Xcode
            {"~/Library/Developer/Xcode/DerivedData/*", CleanupCategory::XcodeDerivedData, "Xcode build artifacts and indexes", false, true},
            {"~/Library/Developer/Xcode/Archives/*", CleanupCategory::XcodeArchives, "Xcode app archives", false, false},
            {"~/Library/Developer/Xcode/iOS DeviceSupport/*", CleanupCategory::XcodeDeviceSupport, "iOS device debug symbols", false, true},
            // Expanded one level deep: these list whole devices, so they start unselected.
            {"~/Library/Developer/CoreSimulator/Devices/*/data/Caches/*", CleanupCategory::XcodeDerivedData, "Simulator caches", false, false},
            {"~/Library/Developer/CoreSimulator/Caches/*", CleanupCategory::XcodeDerivedData, "CoreSimulator caches", false, true},

            // Package managers
            {"~/Library/Caches/Homebrew/*", CleanupCategory::Homebrew, "Homebrew downloaded packages", false, true},
            {"~/.cache/Homebrew/*", CleanupCategory::Homebrew, "Homebrew downloaded packages (Linux)", false, true},
            {"/opt/homebrew/Caskroom/*/.metadata", CleanupCategory::Homebrew, "Homebrew Cask metadata", false, true},
            {"/usr/local/Caskroom/*/.metadata", CleanupCategory::Homebrew, "Homebrew Cask metadata (Intel)", false, true},
            {"~/.npm/_cacache/*", CleanupCategory::Npm, "npm package cache", false, true},
            {"~/.npm/_logs/*", CleanupCategory::Npm, "npm log files", false, true},
            {"~/Library/Caches/pip/*", CleanupCategory::Pip, "Python pip cache", false, true},
            {"~/.cache/pip/*", CleanupCategory::Pip, "Python pip cache (XDG)", false, true},

            // Other caches
            {"~/.cache/*", CleanupCategory::UserCaches, "XDG cache directory", false, true},
            // Lists whole containers; starts unselected.
            {"~/Library/Containers/*/Data/Library/Caches/*", CleanupCategory::UserCaches, "Sandboxed app caches", false, false},

            // Trash
            {"~/.Trash/*", CleanupCategory::Trash, "User Trash", false, true},
            {"/Volumes/*/.Trashes/*", CleanupCategory::Trash, "External drive trash", true, true},
            {"~/.local/share/Trash/files/*", CleanupCategory::Trash, "Items already in the trash", false, false},
        };
    }

    std::vector<Broom::LeftoverSearchRoot> defaultLeftoverRoots()
    {
        return {
            {"~/Library/Application Support", LeftoverCategory::ApplicationSupport},
            {"~/Library/Preferences", LeftoverCategory::Preferences},
            {"~/Library/Caches", LeftoverCategory::Cache},
            {"~/Library/Containers", LeftoverCategory::Container},
            {"~/Library/Logs", LeftoverCategory::Logs},
            {"~/Library/Saved Application State", LeftoverCategory::SavedState},
            {"~/Library/Cookies", LeftoverCategory::Cookies},
            {"~/Library/WebKit", LeftoverCategory::Webkit},
            {"~/Library/HTTPStorages", LeftoverCategory::Cache},
            {"~/Library/Group Containers", LeftoverCategory::Container},
            {"~/Library/Application Scripts", LeftoverCategory::Other},

            {"~/.config", LeftoverCategory::Preferences},
            {"~/.config/autostart", LeftoverCategory::LaunchItem},
            {"~/.local/share", LeftoverCategory::ApplicationSupport},
            {"~/.local/state", LeftoverCategory::Other},
            {"~/.cache", LeftoverCategory::Cache},
            {"~/.var/app", LeftoverCategory::Container},

            {"/Library/Application Support", LeftoverCategory::ApplicationSupport},
            {"/Library/Preferences", LeftoverCategory::Preferences},
            {"/Library/Caches", LeftoverCategory::Cache},
            {"/Library/LaunchAgents", LeftoverCategory::LaunchItem},
            {"/Library/LaunchDaemons", LeftoverCategory::LaunchItem},
            {"/Library/PrivilegedHelperTools", LeftoverCategory::Other},
            {"/Library/Logs/DiagnosticReports", LeftoverCategory::CrashReports},
            {"/var/crash", LeftoverCategory::CrashReports},
        };
    }

    Broom::FolderAccessInfo folder(const std::string& path, const std::string& displayName,
                                   PermissionGroup group, bool elevated, bool consent)
    {
        Broom::FolderAccessInfo info;
        info.path = path;
        info.displayName = displayName;
        info.group = group;
        info.requiresElevatedAccess = elevated;
        info.canTriggerConsentDialog = consent;
        return info;
    }

    std::vector<Broom::FolderAccessInfo> defaultFolders()
    {
        return {
            folder("~/Library/Application Support/com.apple.TCC/TCC.db", "TCC Database", PermissionGroup::FullDiskAccess, true, false),
            folder("~/Library/Safari/Bookmarks.plist", "Safari Bookmarks", PermissionGroup::FullDiskAccess, true, false),
            folder("~/Library/Mail", "Mail Library", PermissionGroup::FullDiskAccess, true, false),
            folder("~/Library/Containers/com.apple.mail/Data/Library/Mail Downloads", "Mail Attachments", PermissionGroup::FullDiskAccess, true, false),

            folder("~/Downloads", "Downloads", PermissionGroup::UserFolders, false, true),
            folder("~/Documents", "Documents", PermissionGroup::UserFolders, false, true),
            folder("~/Desktop", "Desktop", PermissionGroup::UserFolders, false, true),

            folder("/Library/Caches", "System Caches", PermissionGroup::SystemFolders, true, false),
            folder("/Library/Logs", "System Logs", PermissionGroup::SystemFolders, true, false),
            folder("/Library/LaunchAgents", "System Launch Agents", PermissionGroup::SystemFolders, false, false),
            folder("/Library/LaunchDaemons", "System Launch Daemons", PermissionGroup::SystemFolders, false, false),
            folder("/var/log", "System Logs (Linux)", PermissionGroup::SystemFolders, true, false),

            folder("~/Library/Caches", "User Caches", PermissionGroup::ApplicationData, false, false),
            folder("~/Library/Logs", "User Logs", PermissionGroup::ApplicationData, false, false),
            folder("~/Library/Caches/com.apple.Safari", "Safari Cache", PermissionGroup::ApplicationData, false, false),
            folder("~/Library/Caches/Google/Chrome", "Chrome Cache", PermissionGroup::ApplicationData, false, false),
            folder("~/Library/Developer/Xcode/DerivedData", "Xcode DerivedData", PermissionGroup::ApplicationData, false, false),
            folder("~/.Trash", "Trash", PermissionGroup::ApplicationData, false, false),
            folder("~/.cache", "XDG Cache", PermissionGroup::ApplicationData, false, false),
            folder("~/.local/share/Trash", "XDG Trash", PermissionGroup::ApplicationData, false, false),

            folder("~/Library/LaunchAgents", "User Launch Agents", PermissionGroup::StartupPaths, false, false),
            folder("/System/Library/LaunchAgents", "System Launch Agents", PermissionGroup::StartupPaths, false, false),
            folder("/System/Library/LaunchDaemons", "System Launch Daemons", PermissionGroup::StartupPaths, false, false),
            folder("~/.config/autostart", "Autostart Entries", PermissionGroup::StartupPaths, false, false),
            folder("/etc/xdg/autostart", "System Autostart Entries", PermissionGroup::StartupPaths, false, false),
        };
    }

    std::vector<std::string> defaultIgnoredNames()
    {
        return {
            "apple", "macos", "finder", "safari", "mail.app", "calendar", "contacts",
            "photos", "music", "tv", "news", "stocks", "home", "notes", "reminders",
            "books", "preview", "textedit", "quicktime", "automator", "terminal",
            "console", "activity monitor", "disk utility", "migration assistant",
            "system preferences", "system settings", "font book", "colorsync",
            "digital color meter", "grapher", "keychain access", "screenshot",
            "voice memos", "bootcamp", "bluetooth", "audio midi setup",
            "launchservices", "com.apple", "loginitems", "startup", "backgrounditems",
            "cloudd", "appstore", "itunes", "xcode", "instruments", "simulator",

            "gnome", "kde", "plasma", "systemd", "dconf", "pulse", "pipewire",
            "fontconfig", "mesa_shader_cache", "ibus", "gvfs", "gtk", "xdg",
            "user-dirs", "mimeapps", "recently-used", "trash", "flatpak", "dbus",
            "keyrings", "thumbnails", "autostart", "applications", "icons", "fonts"
        };
    }

    // ------------------------------------------------------------------------
    // YAML helpers
    // ------------------------------------------------------------------------
    Broom::CleanupCategory cleanupCategoryOf(const YAML::Node& node, const std::string& origin)
    {
        std::string key = node.as<std::string>();
        auto category = Broom::parseCleanupCategory(key);
        if (!category) {
            throw Broom::Error(Broom::ErrorKind::InvalidInput, origin + ": unknown cleanup category '" + key + "'");
        }
        return *category;
    }

    Broom::LeftoverCategory leftoverCategoryOf(const YAML::Node& node, const std::string& origin)
    {
        std::string key = node.as<std::string>();
        auto category = Broom::parseLeftoverCategory(key);
        if (!category) {
            throw Broom::Error(Broom::ErrorKind::InvalidInput, origin + ": unknown leftover category '" + key + "'");
        }
        return *category;
    }

    Broom::PermissionGroup permissionGroupOf(const YAML::Node& node, const std::string& origin)
    {
        std::string key = node.as<std::string>();
        auto group = Broom::parsePermissionGroup(key);
        if (!group) {
            throw Broom::Error(Broom::ErrorKind::InvalidInput, origin + ": unknown permission group '" + key + "'");
        }
        return *group;
    }

    const YAML::Node& requireSequence(const YAML::Node& node, const std::string& section, const std::string& origin)
    {
        if (!node.IsSequence()) {
            throw Broom::Error(Broom::ErrorKind::InvalidInput, origin + ": '" + section + "' must be a list");
        }
        return node;
    }

    std::vector<std::string> stringList(const YAML::Node& node, const std::string& section, const std::string& origin)
    {
        std::vector<std::string> values;
        for (const auto& item : requireSequence(node, section, origin)) {
            values.push_back(item.as<std::string>());
        }
        return values;
    }

    void appendUnique(std::vector<std::string>& target, const std::vector<std::string>& extra)
    {
        for (const auto& value : extra) {
            if (std::find(target.begin(), target.end(), value) == target.end()) {
                target.push_back(value);
            }
        }
    }

    const std::unordered_set<std::string> knownSections = {
        "cleanup_paths", "leftover_roots", "folders", "protected_paths",
        "ignored_names", "known_identifiers", "app_registry"
    };
} // end anonymous namespace

namespace Broom {

Config Config::defaults()
{
    Config config;
    config.cleanupPaths = defaultCleanupPaths();
    config.leftoverRoots = defaultLeftoverRoots();
    config.folders = defaultFolders();
    config.ignoredNames = defaultIgnoredNames();
    return config;
}

std::string Config::defaultPath()
{
    const char* env = std::getenv("BROOM_CONFIG");
    if (env && *env) {
        return env;
    }
    return defaultConfigPath;
}

Config Config::loadFromFile(const std::string& path)
{
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        log_warning("Configuration file not found: " + path + " (using built-in defaults)");
        return defaults();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw Error(ErrorKind::InvalidInput, "Unable to open configuration file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return loadFromString(content, path);
}

Config Config::loadFromString(const std::string& yaml, const std::string& origin)
{
    Config config = defaults();

    try {
        YAML::Node root = YAML::Load(yaml);
        if (!root || root.IsNull()) {
            return config;
        }
        if (!root.IsMap()) {
            throw Error(ErrorKind::InvalidInput, origin + ": top level must be a mapping");
        }

        for (const auto& entry : root) {
            std::string key = entry.first.as<std::string>();
            if (!knownSections.count(key)) {
                throw Error(ErrorKind::InvalidInput, origin + ": unknown section '" + key + "'");
            }
        }

        if (root["cleanup_paths"]) {
            config.cleanupPaths.clear();
            for (const auto& node : requireSequence(root["cleanup_paths"], "cleanup_paths", origin)) {
                CleanupPathDefinition def;
                def.pattern = node["pattern"].as<std::string>();
                def.category = cleanupCategoryOf(node["category"], origin);
                def.description = node["description"].as<std::string>("");
                def.requiresRoot = node["requires_root"].as<bool>(false);
                def.safeToClean = node["safe_to_clean"].as<bool>(true);
                config.cleanupPaths.push_back(def);
            }
        }

        if (root["leftover_roots"]) {
            config.leftoverRoots.clear();
            for (const auto& node : requireSequence(root["leftover_roots"], "leftover_roots", origin)) {
                LeftoverSearchRoot leftoverRoot;
                leftoverRoot.path = node["path"].as<std::string>();
                leftoverRoot.category = leftoverCategoryOf(node["category"], origin);
                config.leftoverRoots.push_back(leftoverRoot);
            }
        }

        if (root["folders"]) {
            config.folders.clear();
            for (const auto& node : requireSequence(root["folders"], "folders", origin)) {
                FolderAccessInfo info;
                info.path = node["path"].as<std::string>();
                info.displayName = node["display_name"].as<std::string>(info.path);
                info.group = permissionGroupOf(node["group"], origin);
                info.requiresElevatedAccess = node["requires_elevated_access"].as<bool>(false);
                info.canTriggerConsentDialog = node["can_trigger_consent_dialog"].as<bool>(false);
                config.folders.push_back(info);
            }
        }

        if (root["protected_paths"]) {
            appendUnique(config.protectedPaths, stringList(root["protected_paths"], "protected_paths", origin));
        }
        if (root["ignored_names"]) {
            appendUnique(config.ignoredNames, stringList(root["ignored_names"], "ignored_names", origin));
        }
        if (root["known_identifiers"]) {
            config.knownIdentifiers = stringList(root["known_identifiers"], "known_identifiers", origin);
        }

        if (const YAML::Node registry = root["app_registry"]) {
            if (!registry.IsMap()) {
                throw Error(ErrorKind::InvalidInput, origin + ": 'app_registry' must be a mapping");
            }
            config.appRegistry.catalog = registry["catalog"].as<std::string>("");
            config.appRegistry.desktopEntries = registry["desktop_entries"].as<bool>(true);
        }
    } catch (const YAML::Exception& e) {
        throw Error(ErrorKind::InvalidInput, "Failed to parse configuration " + origin + ": " + e.what());
    }

    log_debug("Loaded configuration from " + origin);
    return config;
}

std::string Config::toYaml() const
{
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "cleanup_paths" << YAML::Value << YAML::BeginSeq;
    for (const auto& def : cleanupPaths) {
        out << YAML::BeginMap;
        out << YAML::Key << "pattern" << YAML::Value << def.pattern;
        out << YAML::Key << "category" << YAML::Value << cleanupCategoryKey(def.category);
        out << YAML::Key << "description" << YAML::Value << def.description;
        out << YAML::Key << "requires_root" << YAML::Value << def.requiresRoot;
        out << YAML::Key << "safe_to_clean" << YAML::Value << def.safeToClean;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "leftover_roots" << YAML::Value << YAML::BeginSeq;
    for (const auto& leftoverRoot : leftoverRoots) {
        out << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << leftoverRoot.path;
        out << YAML::Key << "category" << YAML::Value << leftoverCategoryKey(leftoverRoot.category);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "folders" << YAML::Value << YAML::BeginSeq;
    for (const auto& info : folders) {
        out << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << info.path;
        out << YAML::Key << "display_name" << YAML::Value << info.displayName;
        out << YAML::Key << "group" << YAML::Value << permissionGroupKey(info.group);
        out << YAML::Key << "requires_elevated_access" << YAML::Value << info.requiresElevatedAccess;
        out << YAML::Key << "can_trigger_consent_dialog" << YAML::Value << info.canTriggerConsentDialog;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "protected_paths" << YAML::Value << YAML::Flow << protectedPaths;
    out << YAML::Key << "ignored_names" << YAML::Value << YAML::Flow << ignoredNames;
    out << YAML::Key << "known_identifiers" << YAML::Value << YAML::Flow << knownIdentifiers;

    out << YAML::Key << "app_registry" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "catalog" << YAML::Value << appRegistry.catalog;
    out << YAML::Key << "desktop_entries" << YAML::Value << appRegistry.desktopEntries;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

void Config::saveToFile(const std::string& path) const
{
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw Error(ErrorKind::IoFailure, "Unable to open configuration file for writing: " + path);
    }

    file << "# Broom configuration\n";
    file << toYaml();
    if (!file) {
        throw Error(ErrorKind::IoFailure, "Failed to write configuration file: " + path);
    }
}

void Config::print() const
{
    std::cout << "Cleanup paths:" << std::endl;
    for (const auto& def : cleanupPaths) {
        std::cout << "  - " << def.pattern << " [" << cleanupCategoryKey(def.category) << "]";
        if (def.requiresRoot) {
            std::cout << " (root)";
        }
        if (!def.safeToClean) {
            std::cout << " (not selected by default)";
        }
        std::cout << std::endl;
    }

    std::cout << "Leftover search roots:" << std::endl;
    for (const auto& leftoverRoot : leftoverRoots) {
        std::cout << "  - " << leftoverRoot.path << " [" << leftoverCategoryKey(leftoverRoot.category) << "]" << std::endl;
    }

    std::cout << "Permission catalog:" << std::endl;
    for (const auto& info : folders) {
        std::cout << "  - " << info.displayName << ": " << info.path
                  << " [" << permissionGroupKey(info.group) << "]" << std::endl;
    }

    std::cout << "Extra protected paths:" << std::endl;
    for (const auto& path : protectedPaths) {
        std::cout << "  - " << path << std::endl;
    }

    std::cout << "Ignored name patterns: " << ignoredNames.size() << std::endl;
    std::cout << "Known identifiers: " << knownIdentifiers.size() << std::endl;
    std::cout << "Application registry: "
              << (appRegistry.catalog.empty() ? "no catalog" : appRegistry.catalog)
              << (appRegistry.desktopEntries ? ", desktop entries" : "") << std::endl;
}

SafetyPolicy Config::safetyPolicy(const std::string& home) const
{
    return SafetyPolicy::defaults(home, protectedPaths);
}

std::unique_ptr<AppRegistry> Config::makeAppRegistry() const
{
    auto registry = std::make_unique<CompositeRegistry>();
    if (!appRegistry.catalog.empty()) {
        registry->add(std::make_unique<YamlAppRegistry>(appRegistry.catalog));
    }
    if (appRegistry.desktopEntries) {
        registry->add(std::make_unique<DesktopEntryRegistry>(DesktopEntryRegistry::defaultSearchDirectories()));
    }
    if (registry->empty()) {
        log_warning("No application registry configured; every leftover will look orphaned.");
    }
    return registry;
}

} // namespace Broom
