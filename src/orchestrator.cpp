#include "orchestrator.hpp"
#include "errors.hpp"
#include "file_walker.hpp"
#include "utils.hpp"

#include <iostream>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace Dotsync {

const char* toString(RepoState state)
{
    switch (state) {
        case RepoState::Idle:        return "Idle";
        case RepoState::FilesCopied: return "FilesCopied";
        case RepoState::Committed:   return "Committed";
        case RepoState::Pushed:      return "Pushed";
        case RepoState::Failed:      return "Failed";
    }
    return "Unknown";
}

SyncOrchestrator::SyncOrchestrator(Config config, fs::path installRoot, VersionControl& vcs)
    : config_(std::move(config)), vcs_(vcs)
{
    if (config_.localPaths.empty()) {
        throw SyncError(ErrorKind::ConfigMissing,
                        "No local paths configured (run 'dotsync config --localPaths <paths>')");
    }
    repoDir_ = config_.resolvedRepoDir(installRoot);
}

std::string SyncOrchestrator::commitMessage(const SyncResult& result)
{
    std::vector<std::string> names;
    for (const auto& path : result.copied) {
        names.push_back(path.generic_string());
    }
    return "[dotsync] Updating dot files: " + joinQuoted(names);
}

std::optional<std::set<fs::path>> SyncOrchestrator::selectFiles() const
{
    if (!fileName_) {
        return std::nullopt;
    }

    fs::path wanted = fileName_->lexically_normal();
    for (const FileEntry& entry : FileWalker(repoDir_)) {
        if (entry.relativePath == wanted) {
            return std::set<fs::path>{wanted};
        }
    }
    throw SyncError(ErrorKind::FileUnreadable,
                    "No stored file matches the name '" + fileName_->string() + "'");
}

void SyncOrchestrator::report(const SyncResult& result, const std::string& destinationLabel) const
{
    for (const auto& path : result.copied) {
        std::cout << " - Updated " << destinationLabel << " '" << path.generic_string() << "'" << std::endl;
    }
    for (const auto& path : result.skipped) {
        log_warning("Skipped '" + path.generic_string() + "' (not present in every source)");
    }
    for (const auto& [path, failure] : result.failed) {
        log_error(std::string(toString(failure.kind)) + ": " + failure.reason);
    }
}

SyncResult SyncOrchestrator::runLocal(bool pull)
{
    SyncResult result;

    if (pull) {
        std::cout << " - Pulling changes from remote ... " << std::flush;
        VcsOutcome outcome = vcs_.pull(repoDir_);
        result.vcs.push_back(outcome);
        if (!outcome.succeeded) {
            std::cout << "failed" << std::endl;
            log_error(std::string(toString(outcome.error)) + ": " + outcome.message);
            log_error("Aborting: local files were left untouched");
            return result;
        }
        std::cout << "done" << std::endl;
        if (!outcome.message.empty()) {
            std::cout << outcome.message << std::endl;
        }
    }

    std::optional<std::set<fs::path>> only = selectFiles();

    FileMirror mirror;
    result.merge(mirror.copyAll(repoDir_, config_.localPaths, only));

    if (result.isNoop()) {
        log_message("No files found in " + repoDir_.string() + " to update");
    }
    report(result, "local");
    return result;
}

SyncResult SyncOrchestrator::runRepo(bool push, bool commitOnly)
{
    SyncResult result;
    repoState_ = RepoState::Idle;

    // The repository decides which files are tracked
    std::set<fs::path> tracked;
    if (std::optional<std::set<fs::path>> only = selectFiles()) {
        tracked = *only;
    } else {
        for (const FileEntry& entry : FileWalker(repoDir_)) {
            tracked.insert(entry.relativePath);
        }
    }

    if (tracked.empty()) {
        log_message("No files tracked in " + repoDir_.string() + ", nothing to do");
        return result;
    }

    FileMirror mirror(config_.lineEnding);
    std::set<fs::path> provided;

    // Later local paths overwrite what earlier ones wrote
    for (const auto& localPath : config_.localPaths) {
        SyncResult pass = mirror.copyTracked(localPath, tracked, repoDir_);
        for (const auto& path : tracked) {
            if (pass.skipped.count(path) == 0) {
                provided.insert(path);
            }
        }
        result.merge(pass);
    }

    for (const auto& path : tracked) {
        if (provided.count(path) == 0) {
            result.skipped.erase(path);
            result.failed[path] = {ErrorKind::FileUnreadable,
                                   "Could not find local file matching '" + path.generic_string() + "'"};
        }
    }

    report(result, "repo");

    if (result.copied.empty()) {
        log_message("No files were copied, skipping commit");
        return result;
    }
    repoState_ = RepoState::FilesCopied;

    std::cout << " - Committing changes ... " << std::flush;
    VcsOutcome committed = vcs_.commit(repoDir_, commitMessage(result));
    result.vcs.push_back(committed);

    if (!committed.succeeded) {
        if (committed.error == ErrorKind::VcsNothingToCommit) {
            std::cout << committed.message << std::endl;
            return result;
        }
        std::cout << "failed" << std::endl;
        log_error(std::string(toString(committed.error)) + ": " + committed.message);
        repoState_ = RepoState::Failed;
        return result;
    }
    std::cout << "done" << std::endl;
    repoState_ = RepoState::Committed;

    if (!push) {
        return result;
    }
    if (commitOnly) {
        log_message("--commitOnly given, not pushing");
        return result;
    }

    std::cout << " - Pushing to remote ... " << std::flush;
    VcsOutcome pushed = vcs_.push(repoDir_);
    result.vcs.push_back(pushed);

    if (!pushed.succeeded) {
        std::cout << "failed" << std::endl;
        log_error(std::string(toString(pushed.error)) + ": " + pushed.message);
        repoState_ = RepoState::Failed;
        return result;
    }
    std::cout << "done" << std::endl;
    repoState_ = RepoState::Pushed;
    return result;
}

} // namespace Dotsync
