#ifndef FILE_MIRROR_HPP
#define FILE_MIRROR_HPP

#include "config.hpp"
#include "errors.hpp"
#include "file_walker.hpp"
#include "vcs.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Dotsync {

/**
 * @brief Why a single file could not be mirrored.
 */
struct FileFailure
{
    ErrorKind kind;     // FileUnreadable or FileUnwritable
    std::string reason;
};

/**
 * @brief Outcome of one synchronisation run.
 *
 * Keys of `copied` and `skipped` are relative paths. Keys of `failed` are the
 * path that failed, relative to its root when it is a file of the walked tree.
 * Version-control outcomes are appended in the order they were attempted.
 */
struct SyncResult
{
    std::set<std::filesystem::path> copied;
    std::set<std::filesystem::path> skipped;
    std::map<std::filesystem::path, FileFailure> failed;
    std::vector<VcsOutcome> vcs;

    /**
     * @return True when nothing was copied and nothing failed.
     */
    bool isNoop() const { return copied.empty() && failed.empty(); }

    /**
     * @return True when no file failed and every version-control step either
     *         succeeded or merely reported nothing to commit.
     */
    bool succeeded() const;

    /**
     * @brief Folds another result into this one.
     */
    void merge(const SyncResult& other);
};

/**
 * @class FileMirror
 * @brief Copies the regular files of a source tree into one or more
 *        destination trees, preserving relative paths.
 *
 * Destination files are always overwritten. A failure on one file is
 * recorded and the batch carries on.
 */
class FileMirror
{
public:
    FileMirror() = default;
    explicit FileMirror(LineEnding lineEnding);

    /**
     * @brief Mirrors every file under `source` into each destination.
     *
     * @param source       Root directory to walk.
     * @param destinations Destination roots, processed in order.
     * @param only         When set, only these relative paths are copied;
     *                     listed paths missing under `source` are reported
     *                     in SyncResult::skipped.
     */
    SyncResult copyAll(const std::filesystem::path& source,
                       const std::vector<std::filesystem::path>& destinations,
                       const std::optional<std::set<std::filesystem::path>>& only = std::nullopt) const;

    /**
     * @brief Copies the given relative paths from `source` into `destination`
     *        without walking `source`.
     *
     * Each `source / path` is looked up directly, so files reached through
     * symlinked directories are found. Paths that are not a regular file
     * under `source` are reported in SyncResult::skipped.
     */
    SyncResult copyTracked(const std::filesystem::path& source,
                           const std::set<std::filesystem::path>& tracked,
                           const std::filesystem::path& destination) const;

    LineEnding lineEnding() const { return lineEnding_; }

    /**
     * @brief Applies line ending normalisation to a buffer.
     */
    static std::string normalise(const std::string& content, LineEnding ending);

private:
    /**
     * @brief Copies one file, returning the failure if any.
     */
    std::optional<FileFailure> copyFile(const std::filesystem::path& from,
                                        const std::filesystem::path& to) const;

    LineEnding lineEnding_ = LineEnding::None;
};

} // namespace Dotsync

#endif // FILE_MIRROR_HPP
