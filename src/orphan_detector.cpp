#include "broom/orphan_detector.hpp"
#include "broom/path_safety.hpp"
#include "broom/utils.hpp"
#include "broom/worker_pool.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <sys/stat.h>

namespace fs = std::filesystem;

// ============================================================================
// Anonymous Namespace - Token helpers
// ============================================================================
namespace {
    const std::unordered_set<std::string> reverseDnsPrefixes = {
        "com", "org", "net", "io", "co", "app", "me", "dev"
    };

    const size_t minimumNameLength = 3;

    bool endsWith(const std::string& s, const std::string& suffix)
    {
        return s.size() >= suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::vector<std::string> dotSegments(const std::string& token)
    {
        std::vector<std::string> segments;
        size_t start = 0;
        while (true) {
            size_t dot = token.find('.', start);
            segments.push_back(token.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
            if (dot == std::string::npos) {
                break;
            }
            start = dot + 1;
        }
        return segments;
    }

    /**
     * @brief "com.x.App" and "com.x.App.helper" belong to the same family.
     */
    bool sameFamily(const std::string& a, const std::string& b)
    {
        const std::string& shorter = a.size() <= b.size() ? a : b;
        const std::string& longer = a.size() <= b.size() ? b : a;
        if (shorter.find('.') == std::string::npos) {
            return false;
        }
        return longer.size() > shorter.size() &&
               longer.compare(0, shorter.size(), shorter) == 0 &&
               longer[shorter.size()] == '.';
    }

    std::optional<std::string> developerOf(const std::string& identifier)
    {
        auto segments = dotSegments(Broom::toLower(identifier));
        if (segments.size() < 2 || segments[1].empty()) {
            return std::nullopt;
        }
        return segments[1];
    }

    std::optional<std::chrono::system_clock::time_point> modificationTime(const std::string& path)
    {
        struct stat st;
        if (::lstat(path.c_str(), &st) != 0) {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(st.st_mtime);
    }
} // end anonymous namespace

namespace Broom {

// ============================================================================
// Rule confidence
// ============================================================================
std::optional<LeftoverConfidence> confidenceForRule(MatchRule rule)
{
    switch (rule) {
    case MatchRule::IdentifierMatch:
        return LeftoverConfidence::High;
    case MatchRule::DeveloperMatch:
        return LeftoverConfidence::Medium;
    case MatchRule::BundlePattern:
    case MatchRule::DeveloperNameFuzzy:
        return LeftoverConfidence::Low;
    default:
        return std::nullopt;
    }
}

LeftoverConfidence confidenceFloor(const std::optional<LeftoverConfidence>& requested, bool deleting)
{
    if (requested) {
        return *requested;
    }
    return deleting ? LeftoverConfidence::Medium : LeftoverConfidence::Low;
}

std::vector<LeftoverFile> atLeast(const std::vector<LeftoverFile>& leftovers, LeftoverConfidence floor)
{
    std::vector<LeftoverFile> kept;
    std::copy_if(leftovers.begin(), leftovers.end(), std::back_inserter(kept),
                 [floor](const LeftoverFile& leftover) { return leftover.confidence >= floor; });
    return kept;
}

bool Classification::reported() const
{
    return rule == MatchRule::DeveloperMatch ||
           rule == MatchRule::BundlePattern ||
           rule == MatchRule::DeveloperNameFuzzy;
}

std::optional<LeftoverConfidence> Classification::confidence() const
{
    return confidenceForRule(rule);
}

// ============================================================================
// OrphanDetector
// ============================================================================
OrphanDetector::OrphanDetector(const OrphanDetectorInputs& inputs)
    : home_(inputs.home),
      roots_(inputs.roots)
{
    auto learnDeveloper = [this](const std::string& identifier) {
        auto developer = developerOf(identifier);
        if (developer) {
            knownDevelopers_.emplace(*developer, identifier);
        }
    };

    for (const auto& app : inputs.installedApps) {
        installedIdentifiers_.insert(toLower(app.identifier));
        std::string name = normalizeName(app.name);
        if (name.size() >= minimumNameLength) {
            installedNames_.push_back(name);
        }
        learnDeveloper(app.identifier);
    }
    for (const auto& identifier : inputs.knownIdentifiers) {
        learnDeveloper(identifier);
    }
    for (const auto& pattern : inputs.ignoredNames) {
        std::string lowered = toLower(trimmed(pattern));
        if (!lowered.empty()) {
            ignoredNames_.push_back(lowered);
        }
    }
}

std::string OrphanDetector::deriveToken(const std::string& name)
{
    std::string token = name;
    for (const char* suffix : {".plist", ".savedState", ".desktop"}) {
        if (endsWith(token, suffix)) {
            token.erase(token.size() - std::char_traits<char>::length(suffix));
            break;
        }
    }
    if (token.rfind("group.", 0) == 0) {
        token.erase(0, 6);
    }
    return token;
}

bool OrphanDetector::isReverseDns(const std::string& token)
{
    auto segments = dotSegments(toLower(token));
    if (segments.size() < 3 || !reverseDnsPrefixes.count(segments[0])) {
        return false;
    }
    return std::none_of(segments.begin(), segments.end(),
                        [](const std::string& segment) { return segment.empty(); });
}

Classification OrphanDetector::classify(const std::string& name) const
{
    Classification result;
    const std::string token = toLower(deriveToken(name));
    const std::string lowerName = toLower(name);
    if (token.empty()) {
        return result;
    }

    if (installedIdentifiers_.count(token)) {
        result.rule = MatchRule::IdentifierMatch;
        result.relatedIdentifier = token;
        return result;
    }

    for (const auto& identifier : installedIdentifiers_) {
        if (sameFamily(token, identifier)) {
            result.rule = MatchRule::IdentifierFamily;
            result.relatedIdentifier = identifier;
            return result;
        }
    }

    const std::string squashed = normalizeName(name);
    for (const auto& installedName : installedNames_) {
        if (squashed.find(installedName) != std::string::npos) {
            result.rule = MatchRule::NameMatch;
            return result;
        }
    }

    for (const auto& pattern : ignoredNames_) {
        if (lowerName.find(pattern) != std::string::npos) {
            result.rule = MatchRule::SystemItem;
            return result;
        }
    }

    if (isReverseDns(token)) {
        auto developer = developerOf(token);
        if (developer && knownDevelopers_.count(*developer)) {
            result.rule = MatchRule::DeveloperMatch;
        } else {
            result.rule = MatchRule::BundlePattern;
        }
        result.relatedIdentifier = deriveToken(name);
        return result;
    }

    for (const auto& [developer, identifier] : knownDevelopers_) {
        if (developer.size() >= minimumNameLength && lowerName.find(developer) != std::string::npos) {
            result.rule = MatchRule::DeveloperNameFuzzy;
            result.relatedIdentifier = identifier;
            return result;
        }
    }

    result.rule = MatchRule::NoSignal;
    return result;
}

std::vector<LeftoverFile> OrphanDetector::scanRoot(const LeftoverSearchRoot& root) const
{
    return scanRoot(root, CancellationToken()).value_or(std::vector<LeftoverFile>());
}

std::optional<std::vector<LeftoverFile>> OrphanDetector::scanRoot(const LeftoverSearchRoot& root,
                                                                  const CancellationToken& token) const
{
    std::vector<LeftoverFile> leftovers;
    std::string rootPath = expandHome(root.path, home_);

    std::error_code ec;
    fs::directory_iterator it(rootPath, ec);
    if (ec) {
        log_debug("Skipping leftover root " + rootPath + ": " + ec.message());
        return leftovers;
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        if (token.isCancelled()) {
            log_debug("Abandoning partial scan of " + rootPath);
            return std::nullopt;
        }
        std::string name = it->path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;
        }

        Classification verdict = classify(name);
        if (!verdict.reported()) {
            continue;
        }

        LeftoverFile leftover;
        leftover.id = generateId();
        leftover.path = it->path().string();
        leftover.category = root.category;
        leftover.rule = verdict.rule;
        leftover.confidence = verdict.confidence().value_or(LeftoverConfidence::Low);
        leftover.relatedIdentifier = verdict.relatedIdentifier;
        leftover.modified = modificationTime(leftover.path);
        try {
            leftover.sizeBytes = PathSafety::measureSize(leftover.path);
        } catch (const Error& e) {
            log_debug("Could not measure " + leftover.path + ": " + e.what());
        }
        leftovers.push_back(std::move(leftover));
    }
    if (ec) {
        log_debug("Listing of " + rootPath + " stopped early: " + ec.message());
    }
    return leftovers;
}

std::vector<LeftoverFile> OrphanDetector::scan(const RootCompleteCallback& onRootComplete,
                                               const CancellationToken& token) const
{
    std::vector<LeftoverFile> all;
    size_t skipped = WorkerPool::run<std::vector<LeftoverFile>>(roots_.size(), token,
        [this, &token](size_t index) {
            return scanRoot(roots_[index], token);
        },
        [this, &all, &onRootComplete](size_t index, std::optional<std::vector<LeftoverFile>>& found) {
            if (!found) {
                return;
            }
            if (onRootComplete) {
                onRootComplete(roots_[index], *found);
            }
            all.insert(all.end(), found->begin(), found->end());
        });

    std::stable_sort(all.begin(), all.end(), [](const LeftoverFile& a, const LeftoverFile& b) {
        return a.sizeBytes > b.sizeBytes;
    });

    if (skipped > 0) {
        log_warning("Leftover scan cancelled; " + std::to_string(skipped) + " of " +
                    std::to_string(roots_.size()) + " roots were not scanned.");
    }
    return all;
}

} // namespace Broom
