#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Dotsync {

/**
 * @brief Every failure kind dotsync can report.
 *
 * Configuration kinds abort the invocation, file kinds are collected per
 * file, version-control kinds abort the remaining pipeline steps
 * (except VcsNothingToCommit, which is informational).
 */
enum class ErrorKind
{
    ConfigMissing,
    ConfigCorrupt,
    FileUnreadable,
    FileUnwritable,
    VcsUnavailable,
    VcsConflict,
    VcsNetwork,
    VcsNothingToCommit,
    VcsFailed
};

/**
 * @return A stable, human readable name such as "ConfigMissing".
 */
const char* toString(ErrorKind kind);

/**
 * @class SyncError
 * @brief Exception thrown for errors that abort the current invocation.
 */
class SyncError : public std::runtime_error
{
public:
    SyncError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace Dotsync

#endif // ERRORS_HPP
