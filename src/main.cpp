#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "broom/cancellation.hpp"
#include "broom/cleaner.hpp"
#include "broom/config.hpp"
#include "broom/deletion_executor.hpp"
#include "broom/orphan_detector.hpp"
#include "broom/path_safety.hpp"
#include "broom/permission_probe.hpp"
#include "broom/trash.hpp"
#include "broom/utils.hpp"

namespace {
    Broom::CancellationToken interruptToken;

    void handleInterrupt(int)
    {
        interruptToken.cancel();
        // A second Ctrl-C terminates immediately.
        std::signal(SIGINT, SIG_DFL);
    }

    struct GlobalOptions
    {
        std::string configPath;
        bool verbose = false;
    };
} // end anonymous namespace

void printHelp()
{
    std::cout << "broom 0.1.0\n"
              << "Usage: broom [--config <file>] [--verbose] command [options]\n\n"
              << "broom finds caches, logs and application leftovers that can be\n"
              << "reclaimed, and moves the ones you choose to the trash.\n"
              << "Nothing is ever erased: every deletion is a move to the trash.\n\n"
              << "Useful commands:\n"
              << "  scan         - List cleanable items by category [--system]\n"
              << "  clean        - Move selected items to the trash\n"
              << "                 [--category <key>]... [--dry-run] [--yes] [--system]\n"
              << "  validate     - Check whether paths may be deleted <path>...\n"
              << "  orphans      - List leftovers of removed applications\n"
              << "                 [--min-confidence low|medium|high] [--clean] [--yes]\n"
              << "                 --clean keeps medium confidence and up unless\n"
              << "                 --min-confidence is given\n"
              << "  permissions  - Show which folders can be read [--full]\n"
              << "  trash        - Show the size of the trash\n"
              << "  config       - Show the effective configuration [--dump]\n\n"
              << "The configuration is read from --config, $BROOM_CONFIG or\n"
              << Broom::Config::defaultPath() << ".\n";
}

/**
 * @brief Prompts the user to confirm; an empty answer means yes.
 */
bool getConfirmation(const std::string& question)
{
    std::cout << question << " [Y/n]: ";

    std::string response;
    if (!std::getline(std::cin, response)) {
        std::cout << std::endl;
        return false;
    }

    std::string processed = Broom::toLower(Broom::trimmed(response));
    return processed.empty() || processed == "y" || processed == "yes";
}

void logDefinition(const Broom::CleanupPathDefinition& definition, const std::vector<Broom::CleanableItem>& items)
{
    Broom::log_debug("Expanded " + definition.pattern + ": " + std::to_string(items.size()) + " items");
}

void printDeletionSummary(const Broom::DeletionResult& result)
{
    std::cout << "--- Cleanup Summary ---\n"
              << "Moved to trash: " << result.successCount << "\n"
              << "Failed:         " << result.failedCount << "\n"
              << "Space freed:    " << Broom::formatBytes(result.freedBytes) << "\n";
    for (const auto& error : result.errors) {
        std::cout << "  ! " << error.path << ": " << error.reason
                  << " (" << Broom::errorKindName(error.kind) << ")\n";
    }
}

void printGroups(const std::vector<Broom::CleanupGroup>& groups)
{
    std::uint64_t total = 0;
    std::uint64_t selected = 0;
    for (const auto& group : groups) {
        std::cout << Broom::cleanupCategoryName(group.category)
                  << " (" << group.items.size() << " items, "
                  << Broom::formatBytes(group.totalSize()) << ")\n";
        for (const auto& item : group.items) {
            std::cout << "  [" << (item.isSelected ? "x" : " ") << "] "
                      << std::setw(10) << Broom::formatBytes(item.sizeBytes) << "  "
                      << item.path << "\n";
        }
        total += group.totalSize();
        selected += group.selectedSize();
    }
    std::cout << "\nTotal: " << Broom::formatBytes(total)
              << ", selected: " << Broom::formatBytes(selected) << std::endl;
}

int main(int argc, char* argv[])
{
    GlobalOptions global;
    const char* verboseEnv = std::getenv("BROOM_VERBOSE");
    global.verbose = verboseEnv && *verboseEnv && std::string(verboseEnv) != "0";

    // Global options may appear anywhere; everything else is positional.
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires a file argument.\n";
                return 1;
            }
            global.configPath = argv[++i];
        }
        else if (arg == "--verbose" || arg == "-v") {
            global.verbose = true;
        }
        else {
            args.push_back(arg);
        }
    }

    if (args.empty() || args[0] == "help" || args[0] == "--help" || args[0] == "-h") {
        printHelp();
        return 0;
    }

    Broom::setVerbose(global.verbose);
    std::signal(SIGINT, handleInterrupt);

    const std::string command = args[0];
    const std::string home = Broom::homeDirectory();
    if (home.empty()) {
        Broom::log_error("Cannot determine the home directory.");
        return 1;
    }

    Broom::Config config;
    try {
        config = Broom::Config::loadFromFile(global.configPath.empty() ? Broom::Config::defaultPath()
                                                                       : global.configPath);
    } catch (const Broom::Error& e) {
        Broom::log_error(e.what());
        return 1;
    }
    const Broom::SafetyPolicy policy = config.safetyPolicy(home);

    // -------------------------------------------------------------
    // Scan Command
    // -------------------------------------------------------------
    if (command == "scan") {
        Broom::ScanOptions options;
        options.onDefinitionComplete = logDefinition;
        for (size_t i = 1; i < args.size(); i++) {
            if (args[i] == "--system") {
                options.includeRootPaths = true;
            }
            else {
                std::cerr << "Usage: broom scan [--system]\n";
                return 1;
            }
        }

        auto groups = Broom::Cleaner::scanCatalog(config.cleanupPaths, policy, options, interruptToken);
        if (groups.empty()) {
            std::cout << "Nothing to clean." << std::endl;
            return 0;
        }
        printGroups(groups);
    }
    // -------------------------------------------------------------
    // Clean Command
    // -------------------------------------------------------------
    else if (command == "clean") {
        Broom::ScanOptions options;
        options.onDefinitionComplete = logDefinition;
        bool dryRun = false;
        bool assumeYes = false;

        for (size_t i = 1; i < args.size(); i++) {
            const std::string& arg = args[i];
            if (arg == "--category") {
                if (i + 1 >= args.size()) {
                    std::cerr << "Error: --category requires a category key.\n";
                    return 1;
                }
                auto category = Broom::parseCleanupCategory(args[++i]);
                if (!category) {
                    std::cerr << "Error: Unknown category '" << args[i] << "'. Known categories:";
                    for (auto known : Broom::allCleanupCategories()) {
                        std::cerr << " " << Broom::cleanupCategoryKey(known);
                    }
                    std::cerr << "\n";
                    return 1;
                }
                options.categories.push_back(*category);
            }
            else if (arg == "--dry-run") {
                dryRun = true;
            }
            else if (arg == "--yes" || arg == "-y") {
                assumeYes = true;
            }
            else if (arg == "--system") {
                options.includeRootPaths = true;
            }
            else {
                std::cerr << "Usage: broom clean [--category <key>]... [--dry-run] [--yes] [--system]\n";
                return 1;
            }
        }

        auto groups = Broom::Cleaner::scanCatalog(config.cleanupPaths, policy, options, interruptToken);
        auto candidates = Broom::Cleaner::selectedCandidates(groups);
        if (candidates.empty()) {
            std::cout << "Nothing to clean." << std::endl;
            return 0;
        }

        printGroups(groups);
        if (dryRun) {
            std::cout << "Dry run: " << candidates.size() << " items would be moved to the trash." << std::endl;
            return 0;
        }
        if (!assumeYes && !getConfirmation("Move " + std::to_string(candidates.size()) + " items to the trash?")) {
            std::cout << "Aborted." << std::endl;
            return 0;
        }

        Broom::XdgTrash trash(Broom::XdgTrash::defaultLocation());
        auto result = Broom::DeletionExecutor::execute(candidates, policy, trash, interruptToken);
        Broom::Cleaner::pruneTrashed(groups, result);
        printDeletionSummary(result);
        return result.failedCount > 0 ? 1 : 0;
    }
    // -------------------------------------------------------------
    // Validate Command
    // -------------------------------------------------------------
    else if (command == "validate") {
        if (args.size() < 2) {
            std::cerr << "Usage: broom validate <path> [path ...]\n";
            return 1;
        }

        std::vector<std::string> paths(args.begin() + 1, args.end());
        for (const auto& [path, result] : Broom::PathSafety::validateBatch(paths, policy)) {
            std::cout << (result.isSafe() ? "SAFE     " : "REFUSED  ") << path;
            if (!result.isSafe()) {
                std::cout << "  (" << result.reason() << ")";
            }
            std::cout << "\n";
        }
    }
    // -------------------------------------------------------------
    // Orphans Command
    // -------------------------------------------------------------
    else if (command == "orphans") {
        std::optional<Broom::LeftoverConfidence> requestedConfidence;
        bool clean = false;
        bool assumeYes = false;

        for (size_t i = 1; i < args.size(); i++) {
            const std::string& arg = args[i];
            if (arg == "--min-confidence") {
                if (i + 1 >= args.size()) {
                    std::cerr << "Error: --min-confidence requires low, medium or high.\n";
                    return 1;
                }
                auto parsed = Broom::parseConfidence(args[++i]);
                if (!parsed) {
                    std::cerr << "Error: Unknown confidence '" << args[i] << "'.\n";
                    return 1;
                }
                requestedConfidence = *parsed;
            }
            else if (arg == "--clean") {
                clean = true;
            }
            else if (arg == "--yes" || arg == "-y") {
                assumeYes = true;
            }
            else {
                std::cerr << "Usage: broom orphans [--min-confidence low|medium|high] [--clean] [--yes]\n";
                return 1;
            }
        }

        Broom::OrphanDetectorInputs inputs;
        inputs.home = home;
        try {
            inputs.installedApps = config.makeAppRegistry()->installedApps();
        } catch (const Broom::Error& e) {
            Broom::log_error(e.what());
            return 1;
        }
        inputs.knownIdentifiers = config.knownIdentifiers;
        inputs.ignoredNames = config.ignoredNames;
        inputs.roots = config.leftoverRoots;
        Broom::log_message("Checking leftovers against " + std::to_string(inputs.installedApps.size()) +
                           " installed applications...");

        Broom::OrphanDetector detector(inputs);
        auto leftovers = detector.scan(
            [](const Broom::LeftoverSearchRoot& root, const std::vector<Broom::LeftoverFile>& found) {
                Broom::log_debug("Scanned " + root.path + ": " + std::to_string(found.size()) + " leftovers");
            },
            interruptToken);

        Broom::LeftoverConfidence minimum = Broom::confidenceFloor(requestedConfidence, clean);
        if (clean && !requestedConfidence) {
            Broom::log_message("Cleaning " + Broom::confidenceName(minimum) +
                               " confidence leftovers and up; pass --min-confidence low to include the rest.");
        }
        leftovers = Broom::atLeast(leftovers, minimum);
        if (leftovers.empty()) {
            std::cout << "No leftovers found." << std::endl;
            return 0;
        }

        std::map<Broom::LeftoverCategory, std::vector<const Broom::LeftoverFile*>> byCategory;
        std::uint64_t total = 0;
        for (const auto& leftover : leftovers) {
            byCategory[leftover.category].push_back(&leftover);
            total += leftover.sizeBytes;
        }
        for (const auto& [category, files] : byCategory) {
            std::cout << Broom::leftoverCategoryName(category) << " (" << files.size() << ")\n";
            for (const auto* leftover : files) {
                std::cout << "  " << std::setw(10) << Broom::formatBytes(leftover->sizeBytes) << "  "
                          << std::setw(6) << Broom::confidenceName(leftover->confidence) << "  "
                          << leftover->path;
                if (leftover->relatedIdentifier) {
                    std::cout << "  <" << *leftover->relatedIdentifier << ">";
                }
                if (Broom::isVerbose()) {
                    std::cout << "  [" << Broom::matchRuleName(leftover->rule) << "]";
                }
                std::cout << "\n";
            }
        }
        std::cout << "\nTotal: " << leftovers.size() << " leftovers, " << Broom::formatBytes(total) << std::endl;

        if (!clean) {
            return 0;
        }
        if (!assumeYes && !getConfirmation("Move " + std::to_string(leftovers.size()) + " leftovers to the trash?")) {
            std::cout << "Aborted." << std::endl;
            return 0;
        }

        std::vector<Broom::DeletionCandidate> candidates;
        for (const auto& leftover : leftovers) {
            candidates.push_back({leftover.path, leftover.sizeBytes});
        }
        Broom::XdgTrash trash(Broom::XdgTrash::defaultLocation());
        auto result = Broom::DeletionExecutor::execute(candidates, policy, trash, interruptToken);
        printDeletionSummary(result);
        return result.failedCount > 0 ? 1 : 0;
    }
    // -------------------------------------------------------------
    // Permissions Command
    // -------------------------------------------------------------
    else if (command == "permissions") {
        bool full = false;
        for (size_t i = 1; i < args.size(); i++) {
            if (args[i] == "--full") {
                full = true;
            }
            else {
                std::cerr << "Usage: broom permissions [--full]\n";
                return 1;
            }
        }

        std::vector<Broom::FolderAccessInfo> folders = config.folders;
        Broom::FilesystemAccessProber prober(home);
        if (full) {
            Broom::PermissionProbe::runFullPass(folders, prober, nullptr, interruptToken);
        }
        else {
            Broom::PermissionProbe::runStartupPass(folders, prober, nullptr, interruptToken);
        }

        for (auto group : Broom::allPermissionGroups()) {
            auto summary = Broom::PermissionProbe::summarizeGroup(folders, group);
            std::cout << Broom::permissionGroupName(group) << ": "
                      << Broom::folderAccessStatusName(summary.status)
                      << " (" << summary.accessibleCount << "/" << summary.existingCount << " accessible)\n";
            for (const auto& folder : folders) {
                if (folder.group != group) {
                    continue;
                }
                std::string status = folder.lastChecked ? Broom::folderAccessStatusName(folder.status)
                                                        : "not checked";
                std::cout << "  " << std::left << std::setw(12) << status << std::right
                          << folder.displayName << "  " << folder.path << "\n";
            }
        }

        auto overall = Broom::PermissionProbe::summarize(folders);
        std::cout << "\nOverall: " << Broom::folderAccessStatusName(overall.status)
                  << " (" << overall.accessibleCount << "/" << overall.existingCount << " accessible)" << std::endl;
        if (!full) {
            std::cout << "Folders that may prompt for consent were skipped; use --full to check them." << std::endl;
        }
    }
    // -------------------------------------------------------------
    // Trash Command
    // -------------------------------------------------------------
    else if (command == "trash") {
        Broom::XdgTrash trash(Broom::XdgTrash::defaultLocation());
        try {
            std::cout << "Trash at " << trash.location() << ": "
                      << Broom::formatBytes(trash.size()) << std::endl;
        } catch (const Broom::Error& e) {
            Broom::log_error(e.what());
            return 1;
        }
    }
    // -------------------------------------------------------------
    // Config Command
    // -------------------------------------------------------------
    else if (command == "config") {
        if (args.size() == 2 && args[1] == "--dump") {
            std::cout << config.toYaml();
        }
        else if (args.size() == 1) {
            config.print();
        }
        else {
            std::cerr << "Usage: broom config [--dump]\n";
            return 1;
        }
    }
    // -------------------------------------------------------------
    // Unknown Command
    // -------------------------------------------------------------
    else {
        std::cerr << "Unknown command or insufficient arguments.\n";
        printHelp();
        return 1;
    }

    return 0;
}
