#ifndef BROOM_DELETION_EXECUTOR_HPP
#define BROOM_DELETION_EXECUTOR_HPP

#include "broom/cancellation.hpp"
#include "broom/models.hpp"
#include "broom/path_safety.hpp"
#include "broom/trash.hpp"

#include <vector>

namespace Broom {
namespace DeletionExecutor {

/**
 * @brief Validates and trashes a batch of candidates, in order.
 *
 * Every candidate is validated first; anything not safe is recorded as a
 * failure and never touched. Safe candidates are moved to the trash.
 * One failure never stops the batch and nothing is retried. The token is
 * only consulted before the first candidate: a cancelled token yields an
 * empty result, a started batch runs to the end.
 *
 * @param candidates Paths with their pre-measured sizes.
 * @param policy     Safety policy to validate against.
 * @param trash      Where safe candidates are moved.
 * @param token      Cancellation token.
 * @return Aggregated counts, errors, freed bytes and trashed paths.
 */
DeletionResult execute(const std::vector<DeletionCandidate>& candidates,
                       const SafetyPolicy& policy,
                       TrashService& trash,
                       const CancellationToken& token = CancellationToken());

} // namespace DeletionExecutor
} // namespace Broom

#endif // BROOM_DELETION_EXECUTOR_HPP
