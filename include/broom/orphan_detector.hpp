#ifndef BROOM_ORPHAN_DETECTOR_HPP
#define BROOM_ORPHAN_DETECTOR_HPP

#include "broom/cancellation.hpp"
#include "broom/models.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace Broom {

/**
 * @struct LeftoverSearchRoot
 * @brief A directory whose immediate children are orphan candidates.
 */
struct LeftoverSearchRoot
{
    std::string path;
    LeftoverCategory category = LeftoverCategory::Other;
};

/**
 * @struct OrphanDetectorInputs
 * @brief Everything the detector decides against.
 */
struct OrphanDetectorInputs
{
    std::string home;
    std::vector<InstalledApp> installedApps;
    std::vector<std::string> knownIdentifiers;
    std::vector<std::string> ignoredNames;
    std::vector<LeftoverSearchRoot> roots;
};

/**
 * @struct Classification
 * @brief Verdict for one candidate name.
 */
struct Classification
{
    MatchRule rule = MatchRule::NoSignal;
    std::optional<std::string> relatedIdentifier;

    /**
     * @return True when the rule marks the candidate as an orphan.
     */
    bool reported() const;

    /**
     * @return The confidence the rule carries, if any.
     */
    std::optional<LeftoverConfidence> confidence() const;
};

/**
 * @brief Confidence carried by a rule: IdentifierMatch is High,
 *        DeveloperMatch Medium, BundlePattern and DeveloperNameFuzzy Low.
 */
std::optional<LeftoverConfidence> confidenceForRule(MatchRule rule);

/**
 * @brief Confidence floor for a listing or a clean.
 *
 * An explicit request always wins. Without one, listing shows everything
 * and deleting keeps only Medium and High.
 */
LeftoverConfidence confidenceFloor(const std::optional<LeftoverConfidence>& requested, bool deleting);

/**
 * @return The leftovers at or above the floor, in their original order.
 */
std::vector<LeftoverFile> atLeast(const std::vector<LeftoverFile>& leftovers, LeftoverConfidence floor);

/**
 * @brief Invoked on the calling thread once per fully scanned root.
 */
using RootCompleteCallback = std::function<void(const LeftoverSearchRoot&, const std::vector<LeftoverFile>&)>;

/**
 * @class OrphanDetector
 * @brief Cross-references residue in the search roots against the
 *        installed-application registry.
 */
class OrphanDetector
{
public:
    explicit OrphanDetector(const OrphanDetectorInputs& inputs);

    /**
     * @brief Strips ".plist", ".savedState" and ".desktop" suffixes and a
     *        leading "group." prefix.
     */
    static std::string deriveToken(const std::string& name);

    /**
     * @return True for tokens such as "com.vendor.App": a known top-level
     *         first segment and at least three segments.
     */
    static bool isReverseDns(const std::string& token);

    /**
     * @brief Classifies a single child name. Rules are tried in order and
     *        the first that fires wins.
     */
    Classification classify(const std::string& name) const;

    /**
     * @brief Classifies the immediate, non-hidden children of one root.
     *        A missing or unreadable root yields nothing.
     */
    std::vector<LeftoverFile> scanRoot(const LeftoverSearchRoot& root) const;

    /**
     * @brief Scans the roots on a bounded pool of workers.
     *
     * Results reach the callback one complete root at a time, in root order.
     * The token is checked before each root and between the children of a
     * root. A root interrupted part way is dropped whole, so a cancelled
     * scan returns only the roots that finished.
     *
     * @return All reported leftovers, largest first.
     */
    std::vector<LeftoverFile> scan(const RootCompleteCallback& onRootComplete = nullptr,
                                   const CancellationToken& token = CancellationToken()) const;

private:
    /**
     * @return std::nullopt when the token fires before the root is done.
     */
    std::optional<std::vector<LeftoverFile>> scanRoot(const LeftoverSearchRoot& root,
                                                      const CancellationToken& token) const;

    std::string home_;
    std::vector<LeftoverSearchRoot> roots_;
    std::unordered_set<std::string> installedIdentifiers_;
    std::vector<std::string> installedNames_;
    std::vector<std::string> ignoredNames_;
    // developer segment -> first identifier seen with it
    std::map<std::string, std::string> knownDevelopers_;
};

} // namespace Broom

#endif // BROOM_ORPHAN_DETECTOR_HPP
