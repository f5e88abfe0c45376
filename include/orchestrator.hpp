#ifndef ORCHESTRATOR_HPP
#define ORCHESTRATOR_HPP

#include "config.hpp"
#include "file_mirror.hpp"
#include "vcs.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace Dotsync {

/**
 * @brief Where a `repo` run stopped.
 */
enum class RepoState
{
    Idle,
    FilesCopied,
    Committed,
    Pushed,
    Failed
};

const char* toString(RepoState state);

/**
 * @class SyncOrchestrator
 * @brief Runs the `local` and `repo` pipelines for one invocation.
 *
 * The configuration is copied in at construction and never written back.
 */
class SyncOrchestrator
{
public:
    /**
     * @param config      Configuration for this invocation.
     * @param installRoot Directory a relative repoDotFilesDir is resolved against.
     * @param vcs         Version-control capability; must outlive the orchestrator.
     *
     * @throws SyncError(ConfigMissing) if no local path is configured.
     */
    SyncOrchestrator(Config config, std::filesystem::path installRoot, VersionControl& vcs);

    /**
     * @brief Restricts the run to a single tracked file.
     */
    void setFileName(const std::optional<std::filesystem::path>& fileName) { fileName_ = fileName; }

    /**
     * @brief Mirrors the repository into every local path, optionally pulling
     *        first. A failed pull leaves every local file untouched.
     */
    SyncResult runLocal(bool pull);

    /**
     * @brief Mirrors each local path, in configured order, into the
     *        repository, then commits and optionally pushes.
     *
     * Only files already tracked by the repository directory are copied,
     * looked up by path in each local directory; later local paths
     * overwrite earlier ones. `commitOnly` wins over `push`.
     */
    SyncResult runRepo(bool push, bool commitOnly);

    RepoState lastRepoState() const { return repoState_; }

    const std::filesystem::path& repoDir() const { return repoDir_; }

    /**
     * @brief Builds "[dotsync] Updating dot files: 'a', 'b'".
     */
    static std::string commitMessage(const SyncResult& result);

private:
    /**
     * @brief The relative paths to synchronise, honouring the file name filter.
     * @throws SyncError(FileUnreadable) if the filtered file is not tracked.
     */
    std::optional<std::set<std::filesystem::path>> selectFiles() const;

    void report(const SyncResult& result, const std::string& destinationLabel) const;

    Config config_;
    std::filesystem::path repoDir_;
    VersionControl& vcs_;
    std::optional<std::filesystem::path> fileName_;
    RepoState repoState_ = RepoState::Idle;
};

} // namespace Dotsync

#endif // ORCHESTRATOR_HPP
