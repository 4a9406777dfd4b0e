#ifndef BROOM_CLEANER_HPP
#define BROOM_CLEANER_HPP

#include "broom/cancellation.hpp"
#include "broom/models.hpp"
#include "broom/path_safety.hpp"

#include <functional>
#include <vector>

namespace Broom {

/**
 * @brief Invoked on the calling thread once per fully expanded definition,
 *        in catalog order, with the items it produced before deduplication.
 */
using DefinitionCompleteCallback =
    std::function<void(const CleanupPathDefinition&, const std::vector<CleanableItem>&)>;

/**
 * @struct ScanOptions
 * @brief Narrows a catalog scan.
 */
struct ScanOptions
{
    /**
     * @brief Also expand definitions that require root. Implied when the
     *        process runs with an effective UID of 0.
     */
    bool includeRootPaths = false;

    /**
     * @brief Categories to scan; empty means all.
     */
    std::vector<CleanupCategory> categories;

    DefinitionCompleteCallback onDefinitionComplete;
};

namespace Cleaner {

/**
 * @return True when the effective user is root.
 */
bool runningAsRoot();

/**
 * @brief Expands, validates and measures the cleanup catalog.
 *
 * Paths that are not safe under the policy are dropped with a warning, and
 * so are paths that cannot be measured. A path produced by more than one
 * definition is kept once, under the first, and a path inside another
 * item is dropped in favor of that item. Items start selected when
 * their definition is safe to clean.
 *
 * @param definitions The cleanup catalog.
 * @param policy      Policy every item must pass; its home expands "~".
 * @param options     Category and root filters.
 * @param token       Checked before each definition. Definitions not
 *                    started when it fires contribute nothing.
 * @return Non-empty groups in category order.
 */
std::vector<CleanupGroup> scanCatalog(const std::vector<CleanupPathDefinition>& definitions,
                                      const SafetyPolicy& policy,
                                      const ScanOptions& options = ScanOptions(),
                                      const CancellationToken& token = CancellationToken());

/**
 * @brief Turns the selected items of every group into deletion candidates.
 */
std::vector<DeletionCandidate> selectedCandidates(const std::vector<CleanupGroup>& groups);

/**
 * @brief Removes trashed items from the groups, then drops empty groups.
 */
void pruneTrashed(std::vector<CleanupGroup>& groups, const DeletionResult& result);

} // namespace Cleaner
} // namespace Broom

#endif // BROOM_CLEANER_HPP
