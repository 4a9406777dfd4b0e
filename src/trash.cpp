#include "broom/trash.hpp"
#include "broom/path_safety.hpp"
#include "broom/utils.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

// ============================================================================
// Anonymous Namespace - Helpers
// ============================================================================
namespace {
    const int maxNameAttempts = 10000;

    bool isUnreserved(unsigned char c)
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
               c == '-' || c == '.' || c == '_' || c == '~' || c == '/';
    }

    bool writeAll(int fd, const std::string& data)
    {
        size_t written = 0;
        while (written < data.size()) {
            ssize_t n = ::write(fd, data.data() + written, data.size() - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            written += static_cast<size_t>(n);
        }
        return true;
    }

    std::error_code lastError()
    {
        return std::error_code(errno, std::generic_category());
    }
} // end anonymous namespace

namespace Broom {

// ============================================================================
// Trash helpers
// ============================================================================
namespace Trash {

std::string encodePath(const std::string& path)
{
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(path.size());
    for (unsigned char c : path) {
        if (isUnreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string deletionDate()
{
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local);
    return buffer;
}

} // namespace Trash

// ============================================================================
// XdgTrash
// ============================================================================
XdgTrash::XdgTrash(const std::string& location)
    : location_(PathSafety::normalizePath(location))
{
}

std::string XdgTrash::defaultLocation()
{
    const char* dataHome = std::getenv("XDG_DATA_HOME");
    if (dataHome && *dataHome && dataHome[0] == '/') {
        return std::string(dataHome) + "/Trash";
    }
    return homeDirectory() + "/.local/share/Trash";
}

std::string XdgTrash::filesDirectory() const
{
    return location_ + "/files";
}

std::string XdgTrash::infoDirectory() const
{
    return location_ + "/info";
}

void XdgTrash::ensureLayout() const
{
    for (const auto& dir : {filesDirectory(), infoDirectory()}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw Error(errorKindFromCode(ec), "Cannot create trash directory " + dir + ": " + ec.message());
        }
    }
}

std::string XdgTrash::reserveName(const std::string& baseName, const std::string& originalPath) const
{
    const std::string contents = "[Trash Info]\nPath=" + Trash::encodePath(originalPath) +
                                 "\nDeletionDate=" + Trash::deletionDate() + "\n";

    for (int attempt = 1; attempt <= maxNameAttempts; ++attempt) {
        std::string name = attempt == 1 ? baseName : baseName + "." + std::to_string(attempt);

        std::error_code ec;
        if (fs::exists(fs::symlink_status(filesDirectory() + "/" + name, ec))) {
            continue;
        }

        std::string infoPath = infoDirectory() + "/" + name + ".trashinfo";
        int fd = ::open(infoPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (fd < 0) {
            if (errno == EEXIST) {
                continue;
            }
            std::error_code openEc = lastError();
            throw Error(errorKindFromCode(openEc), "Cannot create " + infoPath + ": " + openEc.message());
        }

        bool written = writeAll(fd, contents);
        std::error_code writeEc = lastError();
        ::close(fd);
        if (!written) {
            ::unlink(infoPath.c_str());
            throw Error(ErrorKind::IoFailure, "Cannot write " + infoPath + ": " + writeEc.message());
        }
        return name;
    }
    throw Error(ErrorKind::IoFailure, "No free trash name for " + baseName);
}

TrashOutcome XdgTrash::moveToTrash(const std::string& path)
{
    std::string source = PathSafety::normalizePath(path);
    if (source.empty() || source[0] != '/') {
        return TrashOutcome::failure(ErrorKind::InvalidInput, "Not an absolute path: " + path);
    }
    if (source == location_ || PathSafety::isStrictDescendant(source, location_)) {
        return TrashOutcome::failure(ErrorKind::PolicyViolation, "Already in the trash: " + source);
    }

    std::error_code ec;
    fs::file_status st = fs::symlink_status(source, ec);
    if (st.type() == fs::file_type::not_found) {
        return TrashOutcome::failure(ErrorKind::NotFound, "No such file or directory: " + source);
    }
    if (ec) {
        return TrashOutcome::failure(errorKindFromCode(ec), "Cannot stat " + source + ": " + ec.message());
    }

    std::string name;
    try {
        ensureLayout();
        name = reserveName(fs::path(source).filename().string(), source);
    } catch (const Error& e) {
        return TrashOutcome::failure(e.kind(), e.what());
    }

    std::string target = filesDirectory() + "/" + name;
    if (::rename(source.c_str(), target.c_str()) != 0) {
        std::error_code renameEc = lastError();
        std::string infoPath = infoDirectory() + "/" + name + ".trashinfo";
        if (::unlink(infoPath.c_str()) != 0) {
            log_warning("Could not remove stale trash record " + infoPath);
        }
        if (renameEc.value() == EXDEV) {
            return TrashOutcome::failure(ErrorKind::IoFailure,
                                         source + " is on another filesystem than the trash");
        }
        return TrashOutcome::failure(errorKindFromCode(renameEc),
                                     "Cannot move " + source + " to the trash: " + renameEc.message());
    }

    log_debug("Trashed " + source + " as " + target);
    return TrashOutcome::success();
}

std::uint64_t XdgTrash::size() const
{
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(filesDirectory(), ec))) {
        return 0;
    }
    return PathSafety::measureSize(filesDirectory());
}

} // namespace Broom
