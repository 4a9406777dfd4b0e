#include "broom/pattern_expander.hpp"
#include "broom/utils.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace Broom {
namespace PatternExpander {

std::vector<std::string> expandPattern(const std::string& pattern, const std::string& home)
{
    std::vector<std::string> results;
    std::string expanded = expandHome(trimmed(pattern), home);
    if (expanded.empty()) {
        return results;
    }

    size_t star = expanded.find('*');
    if (star == std::string::npos) {
        std::error_code ec;
        fs::file_status st = fs::symlink_status(expanded, ec);
        if (!ec && fs::exists(st)) {
            results.push_back(expanded);
        }
        return results;
    }

    std::string prefix = expanded.substr(0, star);
    while (prefix.size() > 1 && prefix.back() == '/') {
        prefix.pop_back();
    }
    if (prefix.empty()) {
        return results;
    }

    std::error_code ec;
    fs::directory_iterator it(prefix, ec);
    if (ec) {
        log_debug("Cannot list " + prefix + ": " + ec.message());
        return results;
    }

    const std::string separator = prefix == "/" ? "" : "/";
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        results.push_back(prefix + separator + it->path().filename().string());
    }
    if (ec) {
        log_debug("Listing of " + prefix + " stopped early: " + ec.message());
    }

    std::sort(results.begin(), results.end());
    return results;
}

std::vector<ExpandedPath> expandDefinition(const CleanupPathDefinition& definition,
                                           const std::string& home)
{
    std::vector<ExpandedPath> results;
    for (const auto& path : expandPattern(definition.pattern, home)) {
        ExpandedPath entry;
        entry.path = path;
        entry.category = definition.category;
        entry.description = definition.description;
        entry.requiresRoot = definition.requiresRoot;
        entry.safeToClean = definition.safeToClean;
        results.push_back(std::move(entry));
    }
    return results;
}

} // namespace PatternExpander
} // namespace Broom
