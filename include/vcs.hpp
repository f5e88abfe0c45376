#ifndef VCS_HPP
#define VCS_HPP

#include "errors.hpp"
#include "process.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace Dotsync {

enum class VcsOperation
{
    Pull,
    Commit,
    Push
};

const char* toString(VcsOperation operation);

/**
 * @brief Result of a single version-control operation.
 */
struct VcsOutcome
{
    VcsOperation operation = VcsOperation::Pull;
    bool succeeded = false;
    ErrorKind error = ErrorKind::VcsFailed; // meaningful only when !succeeded
    std::string message;

    static VcsOutcome success(VcsOperation operation, const std::string& message);
    static VcsOutcome failure(VcsOperation operation, ErrorKind error, const std::string& message);
};

/**
 * @class VersionControl
 * @brief The three repository operations dotsync sequences around a copy.
 */
class VersionControl
{
public:
    virtual ~VersionControl() = default;

    virtual VcsOutcome pull(const std::filesystem::path& repoDir) = 0;

    /**
     * @brief Stages every change under repoDir and commits it.
     *
     * Reports VcsNothingToCommit, without failing the run, when the
     * working tree is clean.
     */
    virtual VcsOutcome commit(const std::filesystem::path& repoDir, const std::string& message) = 0;

    virtual VcsOutcome push(const std::filesystem::path& repoDir) = 0;
};

/**
 * @class GitBridge
 * @brief VersionControl backed by the git command line tool.
 */
class GitBridge : public VersionControl
{
public:
    explicit GitBridge(std::string gitExecutable = "git");

    VcsOutcome pull(const std::filesystem::path& repoDir) override;
    VcsOutcome commit(const std::filesystem::path& repoDir, const std::string& message) override;
    VcsOutcome push(const std::filesystem::path& repoDir) override;

    /**
     * @brief Maps a failed git invocation to an error kind by its exit code
     *        and output.
     */
    static ErrorKind classifyFailure(const Process::Result& result);

private:
    Process::Result git(const std::filesystem::path& repoDir, const std::vector<std::string>& args) const;

    VcsOutcome toOutcome(VcsOperation operation, const Process::Result& result) const;

    std::string gitExecutable_;
};

} // namespace Dotsync

#endif // VCS_HPP
