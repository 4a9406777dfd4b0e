#include "broom/cleaner.hpp"
#include "broom/pattern_expander.hpp"
#include "broom/utils.hpp"
#include "broom/worker_pool.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <optional>
#include <unordered_set>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
    /**
     * @brief Expands one definition into measured, validated items.
     */
    std::vector<Broom::CleanableItem> collectDefinition(const Broom::CleanupPathDefinition& definition,
                                                        const Broom::SafetyPolicy& policy)
    {
        std::vector<Broom::CleanableItem> items;
        for (const auto& expanded : Broom::PatternExpander::expandDefinition(definition, policy.home())) {
            Broom::ValidationResult validation = Broom::PathSafety::validate(expanded.path, policy);
            if (!validation.isSafe()) {
                Broom::log_warning("Skipping " + expanded.path + ": " + validation.reason());
                continue;
            }

            Broom::CleanableItem item;
            try {
                item.sizeBytes = Broom::PathSafety::measureSize(expanded.path);
            } catch (const Broom::Error& e) {
                Broom::log_warning("Skipping " + expanded.path + ": " + e.what());
                continue;
            }
            item.id = Broom::generateId();
            item.path = expanded.path;
            item.name = fs::path(expanded.path).filename().string();
            item.category = expanded.category;
            item.isSelected = expanded.safeToClean;
            items.push_back(std::move(item));
        }
        return items;
    }

    bool hasCollectedAncestor(const std::string& path, const std::unordered_set<std::string>& paths)
    {
        fs::path current = fs::path(path).parent_path();
        while (!current.empty() && current != current.root_path()) {
            if (paths.count(current.string())) {
                return true;
            }
            current = current.parent_path();
        }
        return false;
    }
} // end anonymous namespace

namespace Broom {
namespace Cleaner {

bool runningAsRoot()
{
    return geteuid() == 0;
}

std::vector<CleanupGroup> scanCatalog(const std::vector<CleanupPathDefinition>& definitions,
                                      const SafetyPolicy& policy,
                                      const ScanOptions& options,
                                      const CancellationToken& token)
{
    const bool includeRoot = options.includeRootPaths || runningAsRoot();

    std::vector<const CleanupPathDefinition*> eligible;
    for (const auto& definition : definitions) {
        if (definition.requiresRoot && !includeRoot) {
            log_debug("Skipping " + definition.pattern + " (requires root)");
            continue;
        }
        if (!options.categories.empty() &&
            std::find(options.categories.begin(), options.categories.end(), definition.category) ==
                options.categories.end()) {
            continue;
        }
        eligible.push_back(&definition);
    }

    std::vector<CleanableItem> collected;
    std::unordered_set<std::string> seenPaths;
    size_t skipped = WorkerPool::run<std::vector<CleanableItem>>(eligible.size(), token,
        [&eligible, &policy](size_t index) -> std::optional<std::vector<CleanableItem>> {
            return collectDefinition(*eligible[index], policy);
        },
        [&](size_t index, std::optional<std::vector<CleanableItem>>& items) {
            if (!items) {
                return;
            }
            if (options.onDefinitionComplete) {
                options.onDefinitionComplete(*eligible[index], *items);
            }
            for (auto& item : *items) {
                if (seenPaths.insert(item.path).second) {
                    collected.push_back(std::move(item));
                }
            }
        });

    // An item inside another item is already covered by it.
    std::map<CleanupCategory, std::vector<CleanableItem>> byCategory;
    for (auto& item : collected) {
        if (hasCollectedAncestor(item.path, seenPaths)) {
            log_debug("Skipping " + item.path + " (inside another item)");
            continue;
        }
        byCategory[item.category].push_back(std::move(item));
    }

    if (skipped > 0) {
        log_warning("Scan cancelled; " + std::to_string(skipped) + " of " +
                    std::to_string(eligible.size()) + " catalog entries were not scanned.");
    }

    std::vector<CleanupGroup> groups;
    for (CleanupCategory category : allCleanupCategories()) {
        auto it = byCategory.find(category);
        if (it == byCategory.end() || it->second.empty()) {
            continue;
        }
        CleanupGroup group;
        group.category = category;
        group.items = std::move(it->second);
        groups.push_back(std::move(group));
    }
    return groups;
}

std::vector<DeletionCandidate> selectedCandidates(const std::vector<CleanupGroup>& groups)
{
    std::vector<DeletionCandidate> candidates;
    for (const auto& group : groups) {
        for (const auto& item : group.items) {
            if (item.isSelected) {
                candidates.push_back({item.path, item.sizeBytes});
            }
        }
    }
    return candidates;
}

void pruneTrashed(std::vector<CleanupGroup>& groups, const DeletionResult& result)
{
    std::unordered_set<std::string> trashed(result.trashedPaths.begin(), result.trashedPaths.end());
    for (auto& group : groups) {
        group.items.erase(std::remove_if(group.items.begin(), group.items.end(),
                                         [&trashed](const CleanableItem& item) {
                                             return trashed.count(item.path) > 0;
                                         }),
                          group.items.end());
    }
    groups.erase(std::remove_if(groups.begin(), groups.end(),
                                [](const CleanupGroup& group) { return group.items.empty(); }),
                 groups.end());
}

} // namespace Cleaner
} // namespace Broom
