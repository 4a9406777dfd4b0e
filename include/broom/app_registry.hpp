#ifndef BROOM_APP_REGISTRY_HPP
#define BROOM_APP_REGISTRY_HPP

#include "broom/models.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Broom {

/**
 * @class AppRegistry
 * @brief Source of the applications currently installed on the host.
 */
class AppRegistry
{
public:
    virtual ~AppRegistry() = default;

    /**
     * @return Installed applications. Identifiers are unique within the list.
     */
    virtual std::vector<InstalledApp> installedApps() const = 0;
};

/**
 * @class YamlAppRegistry
 * @brief Reads an "apps:" list from a YAML catalog.
 *
 * Each entry has name and identifier, and optionally path, version and size.
 */
class YamlAppRegistry : public AppRegistry
{
public:
    explicit YamlAppRegistry(const std::string& catalogPath);

    /**
     * @throws Broom::Error InvalidInput if the catalog is malformed.
     */
    std::vector<InstalledApp> installedApps() const override;

private:
    std::string catalogPath_;
};

/**
 * @class DesktopEntryRegistry
 * @brief Treats every XDG .desktop application as an installed app.
 *
 * The desktop-file ID is the identifier. Earlier directories win over later
 * ones for the same ID.
 */
class DesktopEntryRegistry : public AppRegistry
{
public:
    explicit DesktopEntryRegistry(const std::vector<std::string>& searchDirectories);

    /**
     * @brief $XDG_DATA_HOME/applications, each $XDG_DATA_DIRS/applications,
     *        then the flatpak export directories.
     */
    static std::vector<std::string> defaultSearchDirectories();

    /**
     * @brief Parses the [Desktop Entry] group of one file.
     *
     * @return The application, or std::nullopt for unreadable files,
     *         Hidden=true entries, non-Application types or entries without
     *         a Name.
     */
    static std::optional<InstalledApp> parseDesktopFile(const std::string& filePath);

    std::vector<InstalledApp> installedApps() const override;

private:
    std::vector<std::string> searchDirectories_;
};

/**
 * @class CompositeRegistry
 * @brief Concatenates registries, keeping the first app per identifier.
 */
class CompositeRegistry : public AppRegistry
{
public:
    void add(std::unique_ptr<AppRegistry> registry);

    bool empty() const { return registries_.empty(); }

    std::vector<InstalledApp> installedApps() const override;

private:
    std::vector<std::unique_ptr<AppRegistry>> registries_;
};

} // namespace Broom

#endif // BROOM_APP_REGISTRY_HPP
