#include "broom/app_registry.hpp"
#include "broom/error.hpp"
#include "broom/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

// ============================================================================
// Anonymous Namespace - Desktop entry helpers
// ============================================================================
namespace {
    std::string envOr(const char* name, const std::string& fallback)
    {
        const char* value = std::getenv(name);
        return (value && *value) ? std::string(value) : fallback;
    }

    std::vector<std::string> splitList(const std::string& value, char separator)
    {
        std::vector<std::string> parts;
        std::istringstream iss(value);
        std::string part;
        while (std::getline(iss, part, separator)) {
            if (!part.empty()) {
                parts.push_back(part);
            }
        }
        return parts;
    }

    /**
     * @brief First word of an Exec/TryExec value, quotes removed.
     */
    std::string programOf(const std::string& command)
    {
        std::string value = Broom::trimmed(command);
        if (value.empty()) {
            return "";
        }
        if (value[0] == '"') {
            size_t close = value.find('"', 1);
            return value.substr(1, close == std::string::npos ? std::string::npos : close - 1);
        }
        size_t space = value.find_first_of(" \t");
        return value.substr(0, space);
    }

    std::uint64_t executableSize(const std::string& program)
    {
        if (program.empty() || program[0] != '/') {
            return 0;
        }
        std::error_code ec;
        std::uintmax_t size = fs::file_size(program, ec);
        return ec ? 0 : size;
    }
} // end anonymous namespace

namespace Broom {

// ============================================================================
// YamlAppRegistry
// ============================================================================
YamlAppRegistry::YamlAppRegistry(const std::string& catalogPath)
    : catalogPath_(catalogPath)
{
}

std::vector<InstalledApp> YamlAppRegistry::installedApps() const
{
    std::vector<InstalledApp> apps;

    std::error_code ec;
    if (!fs::exists(catalogPath_, ec)) {
        log_warning("Application catalog not found: " + catalogPath_);
        return apps;
    }

    try {
        YAML::Node root = YAML::LoadFile(catalogPath_);
        YAML::Node list = root["apps"];
        if (!list) {
            return apps;
        }
        if (!list.IsSequence()) {
            throw Error(ErrorKind::InvalidInput, catalogPath_ + ": 'apps' must be a list");
        }

        std::unordered_set<std::string> seen;
        for (const auto& node : list) {
            InstalledApp app;
            app.name = node["name"].as<std::string>();
            app.identifier = node["identifier"].as<std::string>();
            if (node["path"]) {
                app.path = node["path"].as<std::string>();
            }
            if (node["version"]) {
                app.version = node["version"].as<std::string>();
            }
            if (node["size"]) {
                app.sizeBytes = node["size"].as<std::uint64_t>();
            }
            app.id = generateId();

            if (!seen.insert(toLower(app.identifier)).second) {
                log_debug("Duplicate identifier in catalog: " + app.identifier);
                continue;
            }
            apps.push_back(std::move(app));
        }
    } catch (const YAML::Exception& e) {
        throw Error(ErrorKind::InvalidInput, "Failed to parse application catalog " + catalogPath_ + ": " + e.what());
    }

    return apps;
}

// ============================================================================
// DesktopEntryRegistry
// ============================================================================
DesktopEntryRegistry::DesktopEntryRegistry(const std::vector<std::string>& searchDirectories)
    : searchDirectories_(searchDirectories)
{
}

std::vector<std::string> DesktopEntryRegistry::defaultSearchDirectories()
{
    std::vector<std::string> dirs;
    std::unordered_set<std::string> seen;
    auto add = [&](const std::string& dir) {
        if (!dir.empty() && dir[0] == '/' && seen.insert(dir).second) {
            dirs.push_back(dir);
        }
    };

    std::string home = homeDirectory();
    add(envOr("XDG_DATA_HOME", home + "/.local/share") + "/applications");
    for (const auto& dir : splitList(envOr("XDG_DATA_DIRS", "/usr/local/share:/usr/share"), ':')) {
        add(dir + "/applications");
    }
    add(home + "/.local/share/flatpak/exports/share/applications");
    add("/var/lib/flatpak/exports/share/applications");
    return dirs;
}

std::optional<InstalledApp> DesktopEntryRegistry::parseDesktopFile(const std::string& filePath)
{
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::unordered_map<std::string, std::string> entries;
    bool inMainGroup = false;
    std::string line;
    while (std::getline(file, line)) {
        line = trimmed(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line[0] == '[') {
            inMainGroup = line == "[Desktop Entry]";
            continue;
        }
        if (!inMainGroup) {
            continue;
        }
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        // Localized keys such as Name[de] are ignored.
        std::string key = trimmed(line.substr(0, eq));
        if (key.find('[') != std::string::npos) {
            continue;
        }
        entries.emplace(key, trimmed(line.substr(eq + 1)));
    }

    auto value = [&entries](const std::string& key) -> std::string {
        auto it = entries.find(key);
        return it == entries.end() ? "" : it->second;
    };

    if (value("Hidden") == "true") {
        return std::nullopt;
    }
    std::string type = value("Type");
    if (!type.empty() && type != "Application") {
        return std::nullopt;
    }
    if (value("Name").empty()) {
        return std::nullopt;
    }

    InstalledApp app;
    app.id = generateId();
    app.name = value("Name");
    app.identifier = fs::path(filePath).stem().string();

    std::string program = programOf(value("TryExec"));
    if (program.empty()) {
        program = programOf(value("Exec"));
    }
    app.path = (!program.empty() && program[0] == '/') ? program : filePath;
    app.sizeBytes = executableSize(program);

    std::string version = value("X-AppVersion");
    if (version.empty()) {
        version = value("Version");
    }
    if (!version.empty()) {
        app.version = version;
    }
    return app;
}

std::vector<InstalledApp> DesktopEntryRegistry::installedApps() const
{
    std::vector<InstalledApp> apps;
    std::unordered_set<std::string> seen;

    for (const auto& dir : searchDirectories_) {
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            log_debug("Skipping application directory " + dir + ": " + ec.message());
            continue;
        }

        std::vector<std::string> files;
        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                break;
            }
            if (it->path().extension() == ".desktop") {
                files.push_back(it->path().string());
            }
        }
        std::sort(files.begin(), files.end());

        for (const auto& filePath : files) {
            auto app = parseDesktopFile(filePath);
            if (!app) {
                continue;
            }
            if (!seen.insert(toLower(app->identifier)).second) {
                continue;
            }
            apps.push_back(std::move(*app));
        }
    }

    log_debug("Found " + std::to_string(apps.size()) + " desktop applications.");
    return apps;
}

// ============================================================================
// CompositeRegistry
// ============================================================================
void CompositeRegistry::add(std::unique_ptr<AppRegistry> registry)
{
    if (registry) {
        registries_.push_back(std::move(registry));
    }
}

std::vector<InstalledApp> CompositeRegistry::installedApps() const
{
    std::vector<InstalledApp> apps;
    std::unordered_set<std::string> seen;
    for (const auto& registry : registries_) {
        for (auto& app : registry->installedApps()) {
            if (seen.insert(toLower(app.identifier)).second) {
                apps.push_back(std::move(app));
            }
        }
    }
    return apps;
}

} // namespace Broom
