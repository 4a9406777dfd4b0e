#ifndef BROOM_CONFIG_HPP
#define BROOM_CONFIG_HPP

#include "broom/app_registry.hpp"
#include "broom/models.hpp"
#include "broom/orphan_detector.hpp"
#include "broom/path_safety.hpp"

#include <memory>
#include <string>
#include <vector>

namespace Broom {

/**
 * @struct AppRegistrySettings
 * @brief Which installed-application sources to consult.
 */
struct AppRegistrySettings
{
    std::string catalog;        // YAML catalog path, empty for none
    bool desktopEntries = true; // scan XDG .desktop files
};

class Config
{
public:
    std::vector<CleanupPathDefinition> cleanupPaths;
    std::vector<LeftoverSearchRoot> leftoverRoots;
    std::vector<FolderAccessInfo> folders;

    /**
     * @brief Protected paths added on top of the built-in set.
     */
    std::vector<std::string> protectedPaths;

    /**
     * @brief Name fragments that mark a leftover candidate as a system item.
     */
    std::vector<std::string> ignoredNames;

    /**
     * @brief Identifiers of applications known to have been installed before.
     */
    std::vector<std::string> knownIdentifiers;

    AppRegistrySettings appRegistry;

    /**
     * @brief The built-in catalogs.
     */
    static Config defaults();

    /**
     * @brief Loads configuration from a YAML file on disk.
     *
     * Starts from defaults(). Sections present in the file replace the
     * defaults, except protected_paths and ignored_names, which add to them.
     * A missing file yields the defaults.
     *
     * @param path Path to the configuration file.
     * @return A fully populated Config instance.
     * @throws Broom::Error InvalidInput on malformed YAML or unknown keys.
     */
    static Config loadFromFile(const std::string& path);

    /**
     * @brief Parses configuration text; same rules as loadFromFile.
     *
     * @param yaml   The YAML document.
     * @param origin Name used in error messages.
     */
    static Config loadFromString(const std::string& yaml, const std::string& origin = "<string>");

    /**
     * @return $BROOM_CONFIG when set, otherwise /etc/broom/broom.yaml.
     */
    static std::string defaultPath();

    /**
     * @brief Saves the current configuration to a file.
     * @throws Broom::Error IoFailure if the file cannot be written.
     */
    void saveToFile(const std::string& path) const;

    /**
     * @brief Emits the configuration as a YAML document.
     */
    std::string toYaml() const;

    /**
     * @brief Prints a summary of the configuration to standard output.
     */
    void print() const;

    /**
     * @brief The safety policy for the given home, tightened by protectedPaths.
     */
    SafetyPolicy safetyPolicy(const std::string& home) const;

    /**
     * @brief Builds the registry described by appRegistry.
     */
    std::unique_ptr<AppRegistry> makeAppRegistry() const;
};

} // namespace Broom

#endif // BROOM_CONFIG_HPP
