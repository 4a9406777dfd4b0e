#include "broom/deletion_executor.hpp"
#include "broom/utils.hpp"

namespace Broom {
namespace DeletionExecutor {

DeletionResult execute(const std::vector<DeletionCandidate>& candidates,
                       const SafetyPolicy& policy,
                       TrashService& trash,
                       const CancellationToken& token)
{
    DeletionResult result;
    if (token.isCancelled()) {
        log_warning("Deletion cancelled before it started.");
        return result;
    }

    for (const auto& candidate : candidates) {
        ValidationResult validation = PathSafety::validate(candidate.path, policy);
        if (!validation.isSafe()) {
            log_warning("Refusing to delete " + candidate.path + ": " + validation.reason());
            result.failedCount++;
            result.errors.push_back({candidate.path, validation.reason(), validation.errorKind()});
            continue;
        }

        TrashOutcome outcome = trash.moveToTrash(candidate.path);
        if (!outcome.ok) {
            log_error("Failed to move " + candidate.path + " to the trash: " + outcome.message);
            result.failedCount++;
            result.errors.push_back({candidate.path, outcome.message, outcome.kind});
            continue;
        }

        log_debug("Moved to trash: " + candidate.path);
        result.successCount++;
        result.freedBytes += candidate.sizeBytes;
        result.trashedPaths.push_back(candidate.path);
    }

    log_message("Deletion finished: " + std::to_string(result.successCount) + " moved to trash, " +
                std::to_string(result.failedCount) + " failed, " +
                formatBytes(result.freedBytes) + " freed.");
    return result;
}

} // namespace DeletionExecutor
} // namespace Broom
