#include "broom/permission_probe.hpp"
#include "broom/utils.hpp"
#include "broom/worker_pool.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// ============================================================================
// Anonymous Namespace - Pass driver
// ============================================================================
namespace {
    void runPass(std::vector<Broom::FolderAccessInfo>& folders,
                 const Broom::AccessProber& prober,
                 const Broom::AccessObserver& observer,
                 const Broom::CancellationToken& token,
                 bool includeConsentFolders)
    {
        using Broom::FolderAccessStatus;

        if (token.isCancelled()) {
            Broom::log_debug("Permission pass cancelled before it started.");
            return;
        }

        std::vector<size_t> eligible;
        for (size_t i = 0; i < folders.size(); ++i) {
            if (includeConsentFolders || !folders[i].canTriggerConsentDialog) {
                eligible.push_back(i);
            }
        }
        if (eligible.empty()) {
            return;
        }

        // Publish the Checking state before the first probe starts.
        std::vector<std::string> paths;
        std::vector<FolderAccessStatus> previous;
        for (size_t index : eligible) {
            paths.push_back(folders[index].path);
            previous.push_back(folders[index].status);
            folders[index].status = FolderAccessStatus::Checking;
        }
        if (observer) {
            observer(folders);
        }

        size_t skipped = Broom::WorkerPool::run<FolderAccessStatus>(eligible.size(), token,
            [&prober, &paths](size_t k) -> std::optional<FolderAccessStatus> {
                try {
                    return prober.probe(paths[k]);
                } catch (const std::exception& e) {
                    Broom::log_warning("Probe of " + paths[k] + " failed: " + e.what());
                    return FolderAccessStatus::Denied;
                }
            },
            [&](size_t k, std::optional<FolderAccessStatus>& status) {
                Broom::FolderAccessInfo& folder = folders[eligible[k]];
                if (!status) {
                    folder.status = previous[k];
                    return;
                }
                folder.status = *status;
                folder.lastChecked = std::chrono::system_clock::now();
                Broom::log_debug(folder.path + ": " + Broom::folderAccessStatusName(folder.status));
            });
        if (skipped > 0) {
            Broom::log_debug("Permission pass cancelled; " + std::to_string(skipped) + " folders left unchecked.");
        }

        if (observer) {
            observer(folders);
        }
    }

    Broom::AccessSummary summarizeIf(const std::vector<Broom::FolderAccessInfo>& folders,
                                     const std::function<bool(const Broom::FolderAccessInfo&)>& include)
    {
        using Broom::FolderAccessStatus;

        Broom::AccessSummary summary;
        bool anyChecking = false;
        for (const auto& folder : folders) {
            if (!include(folder) || folder.status == FolderAccessStatus::NotExists) {
                continue;
            }
            summary.existingCount++;
            if (folder.status == FolderAccessStatus::Accessible) {
                summary.accessibleCount++;
            } else if (folder.status == FolderAccessStatus::Checking) {
                anyChecking = true;
            }
        }

        if (summary.existingCount == 0) {
            summary.status = FolderAccessStatus::NotExists;
        } else if (anyChecking) {
            summary.status = FolderAccessStatus::Checking;
        } else if (summary.accessibleCount == summary.existingCount) {
            summary.status = FolderAccessStatus::Accessible;
        } else {
            summary.status = FolderAccessStatus::Denied;
        }
        return summary;
    }
} // end anonymous namespace

namespace Broom {

// ============================================================================
// FilesystemAccessProber
// ============================================================================
FilesystemAccessProber::FilesystemAccessProber(const std::string& home)
    : home_(home)
{
}

FolderAccessStatus FilesystemAccessProber::probe(const std::string& path) const
{
    std::string target = expandHome(path, home_);

    std::error_code ec;
    fs::file_status st = fs::status(target, ec);
    if (st.type() == fs::file_type::not_found) {
        return FolderAccessStatus::NotExists;
    }
    if (ec) {
        return FolderAccessStatus::Denied;
    }

    if (fs::is_directory(st)) {
        fs::directory_iterator it(target, ec);
        return ec ? FolderAccessStatus::Denied : FolderAccessStatus::Accessible;
    }

    std::ifstream file(target, std::ios::binary);
    if (!file) {
        return FolderAccessStatus::Denied;
    }
    char buffer[8192];
    while (file.read(buffer, sizeof(buffer))) {
    }
    return file.bad() ? FolderAccessStatus::Denied : FolderAccessStatus::Accessible;
}

namespace PermissionProbe {

// ============================================================================
// Passes
// ============================================================================
void runStartupPass(std::vector<FolderAccessInfo>& folders,
                    const AccessProber& prober,
                    const AccessObserver& observer,
                    const CancellationToken& token)
{
    runPass(folders, prober, observer, token, false);
}

void runFullPass(std::vector<FolderAccessInfo>& folders,
                 const AccessProber& prober,
                 const AccessObserver& observer,
                 const CancellationToken& token)
{
    runPass(folders, prober, observer, token, true);
}

// ============================================================================
// Rollups
// ============================================================================
FolderAccessStatus rollup(const std::vector<FolderAccessInfo>& folders)
{
    return summarize(folders).status;
}

AccessSummary summarize(const std::vector<FolderAccessInfo>& folders)
{
    return summarizeIf(folders, [](const FolderAccessInfo&) { return true; });
}

AccessSummary summarizeGroup(const std::vector<FolderAccessInfo>& folders, PermissionGroup group)
{
    return summarizeIf(folders, [group](const FolderAccessInfo& folder) { return folder.group == group; });
}

} // namespace PermissionProbe
} // namespace Broom
