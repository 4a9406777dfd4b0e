#ifndef BROOM_TRASH_HPP
#define BROOM_TRASH_HPP

#include "broom/error.hpp"

#include <cstdint>
#include <string>

namespace Broom {

/**
 * @struct TrashOutcome
 * @brief Result of one move-to-trash attempt.
 */
struct TrashOutcome
{
    bool ok = false;
    ErrorKind kind = ErrorKind::IoFailure;
    std::string message;

    static TrashOutcome success() { return {true, ErrorKind::IoFailure, ""}; }
    static TrashOutcome failure(ErrorKind kind, const std::string& message) { return {false, kind, message}; }
};

/**
 * @class TrashService
 * @brief Host trash collaborator. Items moved here stay recoverable.
 */
class TrashService
{
public:
    virtual ~TrashService() = default;

    /**
     * @brief Moves one file or directory into the trash.
     *
     * @param path Absolute path of the item.
     * @return The outcome; never throws for per-item failures.
     */
    virtual TrashOutcome moveToTrash(const std::string& path) = 0;
};

/**
 * @class XdgTrash
 * @brief The freedesktop.org home trash.
 *
 * Items land in <trash>/files/<name> with a matching
 * <trash>/info/<name>.trashinfo record. Moves are rename(2) only; an item
 * on another filesystem fails with IoFailure instead of being copied.
 */
class XdgTrash : public TrashService
{
public:
    /**
     * @param location The trash directory, e.g. "~/.local/share/Trash".
     */
    explicit XdgTrash(const std::string& location);

    /**
     * @return $XDG_DATA_HOME/Trash, or ~/.local/share/Trash when unset.
     */
    static std::string defaultLocation();

    TrashOutcome moveToTrash(const std::string& path) override;

    /**
     * @brief Total bytes held in files/. A missing trash is 0 bytes.
     * @throws Broom::Error if files/ cannot be enumerated.
     */
    std::uint64_t size() const;

    const std::string& location() const { return location_; }
    std::string filesDirectory() const;
    std::string infoDirectory() const;

private:
    /**
     * @brief Creates files/ and info/ if needed.
     * @throws Broom::Error if either cannot be created.
     */
    void ensureLayout() const;

    /**
     * @brief Picks a free name and atomically creates its .trashinfo file.
     *
     * @param baseName     The item's own file name.
     * @param originalPath Path written into the Path= key.
     * @return The reserved name inside files/.
     * @throws Broom::Error when no info file can be created.
     */
    std::string reserveName(const std::string& baseName, const std::string& originalPath) const;

    std::string location_;
};

namespace Trash {

/**
 * @brief Percent-encodes a path for a .trashinfo Path= value.
 *        Unreserved characters and "/" pass through.
 */
std::string encodePath(const std::string& path);

/**
 * @brief Local time in the YYYY-MM-DDThh:mm:ss form used by DeletionDate=.
 */
std::string deletionDate();

} // namespace Trash
} // namespace Broom

#endif // BROOM_TRASH_HPP
