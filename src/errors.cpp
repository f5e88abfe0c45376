#include "errors.hpp"

namespace Dotsync {

const char* toString(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::ConfigMissing:      return "ConfigMissing";
        case ErrorKind::ConfigCorrupt:      return "ConfigCorrupt";
        case ErrorKind::FileUnreadable:     return "FileUnreadable";
        case ErrorKind::FileUnwritable:     return "FileUnwritable";
        case ErrorKind::VcsUnavailable:     return "VcsUnavailable";
        case ErrorKind::VcsConflict:        return "VcsConflict";
        case ErrorKind::VcsNetwork:         return "VcsNetwork";
        case ErrorKind::VcsNothingToCommit: return "VcsNothingToCommit";
        case ErrorKind::VcsFailed:          return "VcsFailed";
    }
    return "Unknown";
}

SyncError::SyncError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind)
{
}

} // namespace Dotsync
