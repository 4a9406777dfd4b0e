#include "broom/path_safety.hpp"
#include "broom/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <future>
#include <sstream>
#include <thread>
#include <unordered_set>

namespace fs = std::filesystem;

// ============================================================================
// Anonymous Namespace - Built-in catalogs and helpers
// ============================================================================
namespace {
    // Never deleted themselves, whatever else the rules say.
    const std::vector<std::string> systemProtectedPaths = {
        "/", "/System", "/Library", "/Users", "/Applications",
        "/bin", "/sbin", "/usr", "/var", "/private", "/etc", "/tmp",
        "/cores", "/dev", "/opt", "/Volumes",
        "/home", "/root", "/boot", "/lib", "/lib64", "/proc", "/sys",
        "/run", "/srv", "/mnt", "/media"
    };

    const std::vector<std::string> protectedHomeNames = {
        "Desktop", "Documents", "Downloads", "Movies", "Music", "Pictures", "Public"
    };

    // Relative to home unless absolute.
    const std::vector<std::string> defaultAllowedRoots = {
        "~/Library/Caches",
        "~/Library/Logs",
        "~/Library/Application Support",
        "~/Library/Containers",
        "~/Library/Saved Application State",
        "~/Library/Cookies",
        "~/Library/HTTPStorages",
        "~/Library/WebKit",
        "~/Library/Preferences",
        "~/Library/Group Containers",
        "~/Library/Application Scripts",
        "~/.Trash",

        "~/Library/Developer/Xcode/DerivedData",
        "~/Library/Developer/Xcode/Archives",
        "~/Library/Developer/Xcode/iOS DeviceSupport",
        "~/Library/Developer/CoreSimulator",

        "~/.npm",
        "~/.cache",
        "~/.local/share/Trash",

        "~/.config",
        "~/.local/share",
        "~/.local/state",
        "~/.var/app",

        "/Library/Caches",
        "/Library/Logs",
        "/Library/LaunchAgents",
        "/Library/LaunchDaemons",
        "/Library/Application Support",
        "/private/var/folders"
    };

    // An allow-listed root with one of these names may be deleted itself.
    const std::unordered_set<std::string> leafRootNames = {
        "DerivedData", ".Trash", "Trash"
    };

    // Symlink targets inside these subtrees are tolerated.
    const std::unordered_set<std::string> disposableSubtreeNames = {
        "Caches", ".cache", ".Trash", "Trash"
    };

    const size_t parallelBatchThreshold = 256;

    std::vector<std::string> splitSegments(const std::string& path)
    {
        std::vector<std::string> segments;
        std::istringstream iss(path);
        std::string token;
        while (std::getline(iss, token, '/')) {
            segments.push_back(token);
        }
        return segments;
    }

    std::string lastSegment(const std::string& normalized)
    {
        size_t pos = normalized.find_last_of('/');
        return pos == std::string::npos ? normalized : normalized.substr(pos + 1);
    }

    bool isInsideDisposableSubtree(const std::string& normalized)
    {
        auto segments = splitSegments(normalized);
        if (segments.empty()) {
            return false;
        }
        // The final segment is the target itself, not a containing subtree.
        for (size_t i = 0; i + 1 < segments.size(); ++i) {
            if (disposableSubtreeNames.count(segments[i])) {
                return true;
            }
        }
        return false;
    }

    bool isAllowed(const std::string& normalized, const std::vector<std::string>& roots)
    {
        for (const auto& root : roots) {
            if (Broom::PathSafety::isStrictDescendant(normalized, root)) {
                return true;
            }
            if (normalized == root && leafRootNames.count(lastSegment(root))) {
                return true;
            }
        }
        return false;
    }

    bool pointsIntoProtected(const std::string& resolved, const Broom::SafetyPolicy& policy)
    {
        if (isInsideDisposableSubtree(resolved)) {
            return false;
        }
        auto covers = [&resolved](const std::string& entry) {
            return resolved == entry || Broom::PathSafety::isStrictDescendant(resolved, entry);
        };
        return std::any_of(policy.protectedPaths().begin(), policy.protectedPaths().end(), covers) ||
               std::any_of(policy.protectedHomePaths().begin(), policy.protectedHomePaths().end(), covers);
    }

    /**
     * @brief Rewrites a fully resolved path under the real home directory
     *        back onto the policy's home, so a symlinked home still matches
     *        its own allow-list.
     */
    std::string underPolicyHome(const std::string& resolved, const Broom::SafetyPolicy& policy)
    {
        if (policy.home().empty()) {
            return resolved;
        }
        std::error_code ec;
        std::string realHome = Broom::PathSafety::normalizePath(fs::weakly_canonical(policy.home(), ec).string());
        if (ec || realHome == policy.home()) {
            return resolved;
        }
        if (resolved == realHome) {
            return policy.home();
        }
        if (Broom::PathSafety::isStrictDescendant(resolved, realHome)) {
            return policy.home() + resolved.substr(realHome.size());
        }
        return resolved;
    }
} // end anonymous namespace

namespace Broom {

// ============================================================================
// ValidationResult
// ============================================================================
std::string ValidationResult::reason() const
{
    switch (status) {
    case ValidationStatus::Safe:
        return "Path is safe to delete";
    case ValidationStatus::ProtectedPath:
        return "Protected system path: " + protectedPath;
    case ValidationStatus::OutsideAllowedPaths:
        return "Path is outside allowed deletion directories";
    case ValidationStatus::SymlinkToProtected:
        return "Symlink points to a protected location";
    case ValidationStatus::PathTraversal:
        return "Path contains traversal sequences (..)";
    case ValidationStatus::DoesNotExist:
        return "Path does not exist";
    case ValidationStatus::InvalidPath:
        return "Invalid or malformed path";
    }
    return "Invalid or malformed path";
}

ErrorKind ValidationResult::errorKind() const
{
    switch (status) {
    case ValidationStatus::InvalidPath:
        return ErrorKind::InvalidInput;
    case ValidationStatus::DoesNotExist:
        return ErrorKind::NotFound;
    default:
        return ErrorKind::PolicyViolation;
    }
}

// ============================================================================
// SafetyPolicy
// ============================================================================
SafetyPolicy::SafetyPolicy(const std::string& home,
                           const std::vector<std::string>& protectedPaths,
                           const std::vector<std::string>& protectedHomeNames,
                           const std::vector<std::string>& allowedRoots)
    : home_(PathSafety::normalizePath(home))
{
    for (const auto& entry : protectedPaths) {
        protectedPaths_.push_back(PathSafety::normalizePath(expandHome(entry, home_)));
    }
    if (!home_.empty()) {
        protectedPaths_.push_back(home_);
        for (const auto& name : protectedHomeNames) {
            protectedHomePaths_.push_back(PathSafety::normalizePath(home_ + "/" + name));
        }
    }
    for (const auto& root : allowedRoots) {
        std::string expanded = PathSafety::normalizePath(expandHome(root, home_));
        // A root that is itself protected would make its protection moot.
        if (std::find(protectedPaths_.begin(), protectedPaths_.end(), expanded) != protectedPaths_.end()) {
            log_warning("Ignoring allow-listed root that is also protected: " + expanded);
            continue;
        }
        allowedRoots_.push_back(expanded);
    }
}

SafetyPolicy SafetyPolicy::defaults(const std::string& home,
                                    const std::vector<std::string>& extraProtected)
{
    std::vector<std::string> protectedPaths = systemProtectedPaths;
    protectedPaths.insert(protectedPaths.end(), extraProtected.begin(), extraProtected.end());
    return SafetyPolicy(home, protectedPaths, protectedHomeNames, defaultAllowedRoots);
}

namespace PathSafety {

// ============================================================================
// Path helpers
// ============================================================================
std::string normalizePath(const std::string& path)
{
    if (path.empty()) {
        return path;
    }

    bool absolute = path[0] == '/';
    std::vector<std::string> kept;
    for (const auto& segment : splitSegments(path)) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!kept.empty() && kept.back() != "..") {
                kept.pop_back();
            } else if (!absolute) {
                kept.push_back(segment);
            }
            continue;
        }
        kept.push_back(segment);
    }

    std::string out = absolute ? "/" : "";
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) {
            out += "/";
        }
        out += kept[i];
    }
    return out.empty() ? "." : out;
}

bool hasTraversal(const std::string& path)
{
    for (const auto& segment : splitSegments(path)) {
        if (segment == "..") {
            return true;
        }
    }
    return false;
}

bool isStrictDescendant(const std::string& path, const std::string& root)
{
    if (root == "/") {
        return path.size() > 1 && path[0] == '/';
    }
    return path.size() > root.size() + 1 &&
           path.compare(0, root.size(), root) == 0 &&
           path[root.size()] == '/';
}

// ============================================================================
// Validation
// ============================================================================
ValidationResult validate(const std::string& path, const SafetyPolicy& policy)
{
    // 1) Empty or malformed
    std::string candidate = trimmed(path);
    if (candidate.empty() || candidate.find('\0') != std::string::npos) {
        return ValidationResult::of(ValidationStatus::InvalidPath);
    }
    candidate = expandHome(candidate, policy.home());

    // 2) Normalize without touching symlinks
    std::string normalized = normalizePath(candidate);

    // 3) Traversal is judged on the unnormalized form, which normalization would hide
    if (hasTraversal(candidate)) {
        return ValidationResult::of(ValidationStatus::PathTraversal);
    }
    if (normalized.empty() || normalized[0] != '/') {
        return ValidationResult::of(ValidationStatus::InvalidPath);
    }

    // 4) Protected system locations and the home directory itself
    for (const auto& entry : policy.protectedPaths()) {
        if (normalized == entry) {
            return ValidationResult::protectedBy(entry);
        }
    }

    // 5) Protected home folders
    for (const auto& entry : policy.protectedHomePaths()) {
        if (normalized == entry) {
            return ValidationResult::protectedBy(entry);
        }
    }

    // 6) Deny by default: only allow-listed subtrees
    if (!isAllowed(normalized, policy.allowedRoots())) {
        return ValidationResult::of(ValidationStatus::OutsideAllowedPaths);
    }

    // 7) Symlinks must not lead back into protected territory
    std::error_code ec;
    fs::file_status st = fs::symlink_status(normalized, ec);
    if (!ec && fs::is_symlink(st)) {
        fs::path target = fs::read_symlink(normalized, ec);
        if (ec) {
            // Unknown destination; refuse rather than guess.
            return ValidationResult::of(ValidationStatus::SymlinkToProtected);
        }
        if (target.is_relative()) {
            target = fs::path(normalized).parent_path() / target;
        }
        if (pointsIntoProtected(normalizePath(target.string()), policy)) {
            return ValidationResult::of(ValidationStatus::SymlinkToProtected);
        }
    }

    // 8) A symlinked parent must not carry the path out of the allow-list
    fs::path lexical(normalized);
    fs::path realParent = fs::weakly_canonical(lexical.parent_path(), ec);
    if (ec) {
        return ValidationResult::of(ValidationStatus::SymlinkToProtected);
    }
    std::string resolved = underPolicyHome(normalizePath((realParent / lexical.filename()).string()), policy);
    if (resolved != normalized &&
        (!isAllowed(resolved, policy.allowedRoots()) || pointsIntoProtected(resolved, policy))) {
        return ValidationResult::of(ValidationStatus::SymlinkToProtected);
    }

    // 9)
    return ValidationResult::safe();
}

std::vector<std::pair<std::string, ValidationResult>> validateBatch(const std::vector<std::string>& paths,
                                                                     const SafetyPolicy& policy)
{
    using Entry = std::pair<std::string, ValidationResult>;
    auto validateRange = [&paths, &policy](size_t begin, size_t end) {
        std::vector<Entry> out;
        out.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            out.emplace_back(paths[i], validate(paths[i], policy));
        }
        return out;
    };

    if (paths.size() < parallelBatchThreshold) {
        return validateRange(0, paths.size());
    }

    size_t workers = std::max<size_t>(2, std::thread::hardware_concurrency());
    size_t chunk = (paths.size() + workers - 1) / workers;

    std::vector<std::future<std::vector<Entry>>> futures;
    for (size_t begin = 0; begin < paths.size(); begin += chunk) {
        size_t end = std::min(paths.size(), begin + chunk);
        futures.push_back(std::async(std::launch::async, validateRange, begin, end));
    }

    std::vector<Entry> results;
    results.reserve(paths.size());
    for (auto& fut : futures) {
        auto part = fut.get();
        results.insert(results.end(),
                       std::make_move_iterator(part.begin()),
                       std::make_move_iterator(part.end()));
    }
    return results;
}

std::vector<std::string> filterSafePaths(const std::vector<std::string>& paths,
                                         const SafetyPolicy& policy)
{
    std::vector<std::string> safe;
    for (const auto& [path, result] : validateBatch(paths, policy)) {
        if (result.isSafe()) {
            safe.push_back(path);
        }
    }
    return safe;
}

// ============================================================================
// Size measurement
// ============================================================================
std::uint64_t measureSize(const std::string& path)
{
    std::error_code ec;
    fs::file_status st = fs::symlink_status(path, ec);
    if (st.type() == fs::file_type::not_found) {
        throw Error(ErrorKind::NotFound, "Path does not exist: " + path);
    }
    if (ec) {
        throw Error(errorKindFromCode(ec), "Cannot stat " + path + ": " + ec.message());
    }

    if (fs::is_symlink(st)) {
        return 0;
    }

    if (!fs::is_directory(st)) {
        if (!fs::is_regular_file(st)) {
            return 0;
        }
        std::uintmax_t size = fs::file_size(path, ec);
        if (ec) {
            throw Error(errorKindFromCode(ec), "Cannot stat " + path + ": " + ec.message());
        }
        return size;
    }

    // The top level must be listable; deeper unreadable folders are skipped.
    fs::directory_iterator probe(path, ec);
    if (ec) {
        throw Error(ErrorKind::EnumerationFailure,
                    "Cannot enumerate directory " + path + ": " + ec.message());
    }

    std::uint64_t total = 0;
    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    if (ec) {
        throw Error(ErrorKind::EnumerationFailure,
                    "Cannot enumerate directory " + path + ": " + ec.message());
    }

    while (it != end) {
        std::error_code entryEc;
        fs::file_status entryStatus = it->symlink_status(entryEc);
        if (!entryEc && fs::is_regular_file(entryStatus)) {
            std::uintmax_t size = it->file_size(entryEc);
            if (!entryEc) {
                total += size;
            }
        }

        it.increment(ec);
        if (ec) {
            throw Error(ErrorKind::EnumerationFailure,
                        "Enumeration of " + path + " failed: " + ec.message());
        }
    }
    return total;
}

} // namespace PathSafety
} // namespace Broom
