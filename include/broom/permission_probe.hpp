#ifndef BROOM_PERMISSION_PROBE_HPP
#define BROOM_PERMISSION_PROBE_HPP

#include "broom/cancellation.hpp"
#include "broom/models.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace Broom {

/**
 * @class AccessProber
 * @brief Decides readability of one path by attempting to read it.
 */
class AccessProber
{
public:
    virtual ~AccessProber() = default;

    /**
     * @return NotExists, Denied or Accessible. Never Checking.
     */
    virtual FolderAccessStatus probe(const std::string& path) const = 0;
};

/**
 * @class FilesystemAccessProber
 * @brief Lists directories and reads files in full; permission bits are
 *        never consulted.
 */
class FilesystemAccessProber : public AccessProber
{
public:
    /**
     * @param home Directory substituted for a leading "~" in probed paths.
     */
    explicit FilesystemAccessProber(const std::string& home);

    FolderAccessStatus probe(const std::string& path) const override;

private:
    std::string home_;
};

/**
 * @brief Called with the whole catalog every time statuses change.
 */
using AccessObserver = std::function<void(const std::vector<FolderAccessInfo>&)>;

/**
 * @struct AccessSummary
 * @brief Rolled-up status of a set of folders.
 */
struct AccessSummary
{
    FolderAccessStatus status = FolderAccessStatus::NotExists;
    std::size_t accessibleCount = 0;
    std::size_t existingCount = 0;
};

namespace PermissionProbe {

/**
 * @brief Probes every folder that cannot raise a consent dialog.
 *
 * Consent-triggering folders keep their status and lastChecked untouched,
 * so running this at startup never provokes an OS prompt. Probes run on a
 * bounded pool; the token is checked before each folder, and a folder
 * left unprobed by cancellation gets its previous status back.
 */
void runStartupPass(std::vector<FolderAccessInfo>& folders,
                    const AccessProber& prober,
                    const AccessObserver& observer = nullptr,
                    const CancellationToken& token = CancellationToken());

/**
 * @brief Probes every folder, including consent-triggering ones.
 */
void runFullPass(std::vector<FolderAccessInfo>& folders,
                 const AccessProber& prober,
                 const AccessObserver& observer = nullptr,
                 const CancellationToken& token = CancellationToken());

/**
 * @brief Rolls statuses up, ignoring NotExists entries.
 *
 * No existing entry gives NotExists, any Checking gives Checking, all
 * Accessible gives Accessible, anything else Denied.
 */
FolderAccessStatus rollup(const std::vector<FolderAccessInfo>& folders);

AccessSummary summarize(const std::vector<FolderAccessInfo>& folders);

AccessSummary summarizeGroup(const std::vector<FolderAccessInfo>& folders, PermissionGroup group);

} // namespace PermissionProbe
} // namespace Broom

#endif // BROOM_PERMISSION_PROBE_HPP
