#include "vcs.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace Dotsync {

namespace
{
    bool containsAny(const std::string& haystack, const std::vector<std::string>& needles)
    {
        return std::any_of(needles.begin(), needles.end(), [&](const std::string& needle) {
            return haystack.find(needle) != std::string::npos;
        });
    }

    std::string lowercase(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }
}

const char* toString(VcsOperation operation)
{
    switch (operation) {
        case VcsOperation::Pull:   return "pull";
        case VcsOperation::Commit: return "commit";
        case VcsOperation::Push:   return "push";
    }
    return "unknown";
}

VcsOutcome VcsOutcome::success(VcsOperation operation, const std::string& message)
{
    VcsOutcome outcome;
    outcome.operation = operation;
    outcome.succeeded = true;
    outcome.message   = message;
    return outcome;
}

VcsOutcome VcsOutcome::failure(VcsOperation operation, ErrorKind error, const std::string& message)
{
    VcsOutcome outcome;
    outcome.operation = operation;
    outcome.succeeded = false;
    outcome.error     = error;
    outcome.message   = message;
    return outcome;
}

GitBridge::GitBridge(std::string gitExecutable)
    : gitExecutable_(std::move(gitExecutable))
{
}

ErrorKind GitBridge::classifyFailure(const Process::Result& result)
{
    if (result.exitCode == Process::kExecFailed) {
        return ErrorKind::VcsUnavailable;
    }

    const std::string output = lowercase(result.output);

    if (containsAny(output, {"not a git repository", "command not found"})) {
        return ErrorKind::VcsUnavailable;
    }
    if (containsAny(output, {"could not resolve host", "unable to access",
                             "could not read from remote repository", "connection refused",
                             "connection timed out", "network is unreachable",
                             "operation timed out"})) {
        return ErrorKind::VcsNetwork;
    }
    if (containsAny(output, {"conflict", "automatic merge failed", "not possible to fast-forward",
                             "divergent branches", "[rejected]", "non-fast-forward",
                             "would be overwritten by merge", "fetch first"})) {
        return ErrorKind::VcsConflict;
    }
    return ErrorKind::VcsFailed;
}

Process::Result GitBridge::git(const fs::path& repoDir, const std::vector<std::string>& args) const
{
    std::vector<std::string> argv = {gitExecutable_};
    argv.insert(argv.end(), args.begin(), args.end());

    try {
        return Process::run(argv, repoDir.string());
    } catch (const std::system_error& e) {
        Process::Result result;
        result.exitCode = Process::kExecFailed;
        result.output   = e.what();
        return result;
    }
}

VcsOutcome GitBridge::toOutcome(VcsOperation operation, const Process::Result& result) const
{
    std::string message = trim(result.output);
    if (result.exitCode == 0) {
        return VcsOutcome::success(operation, message);
    }
    if (message.empty()) {
        message = "git " + std::string(toString(operation)) +
                  " exited with status " + std::to_string(result.exitCode);
    }
    return VcsOutcome::failure(operation, classifyFailure(result), message);
}

VcsOutcome GitBridge::pull(const fs::path& repoDir)
{
    return toOutcome(VcsOperation::Pull, git(repoDir, {"pull"}));
}

VcsOutcome GitBridge::commit(const fs::path& repoDir, const std::string& message)
{
    Process::Result added = git(repoDir, {"add", "-A", "--", "."});
    if (added.exitCode != 0) {
        return toOutcome(VcsOperation::Commit, added);
    }

    // Exit status 0 means the index matches HEAD
    Process::Result staged = git(repoDir, {"diff", "--cached", "--quiet"});
    if (staged.exitCode == 0) {
        return VcsOutcome::failure(VcsOperation::Commit, ErrorKind::VcsNothingToCommit, "No changes to commit");
    }
    if (staged.exitCode != 1) {
        return toOutcome(VcsOperation::Commit, staged);
    }

    Process::Result committed = git(repoDir, {"commit", "-m", message});
    if (committed.exitCode == 0) {
        return VcsOutcome::success(VcsOperation::Commit, message);
    }
    return toOutcome(VcsOperation::Commit, committed);
}

VcsOutcome GitBridge::push(const fs::path& repoDir)
{
    return toOutcome(VcsOperation::Push, git(repoDir, {"push"}));
}

} // namespace Dotsync
