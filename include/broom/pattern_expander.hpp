#ifndef BROOM_PATTERN_EXPANDER_HPP
#define BROOM_PATTERN_EXPANDER_HPP

#include "broom/models.hpp"

#include <string>
#include <vector>

namespace Broom {

/**
 * @struct ExpandedPath
 * @brief A concrete path produced from a CleanupPathDefinition, carrying
 *        the definition's tags.
 */
struct ExpandedPath
{
    std::string path;
    CleanupCategory category = CleanupCategory::UserCaches;
    std::string description;
    bool requiresRoot = false;
    bool safeToClean = true;
};

namespace PatternExpander {

/**
 * @brief Expands a path pattern into the paths that currently exist.
 *
 * A pattern without "*" is returned as-is if it exists (a dangling symlink
 * counts as existing). A pattern with "*" yields the immediate children of
 * the directory before the marker, sorted by name. Segments after the
 * marker are ignored: only the directory before the first "*" is listed,
 * one level deep. A missing or unreadable directory yields an empty list.
 *
 * @param pattern The pattern, optionally starting with "~".
 * @param home    Directory substituted for a leading "~".
 * @return The matching paths, sorted.
 */
std::vector<std::string> expandPattern(const std::string& pattern, const std::string& home);

/**
 * @brief Expands a definition and tags every result with its category
 *        and flags.
 */
std::vector<ExpandedPath> expandDefinition(const CleanupPathDefinition& definition,
                                           const std::string& home);

} // namespace PatternExpander
} // namespace Broom

#endif // BROOM_PATTERN_EXPANDER_HPP
