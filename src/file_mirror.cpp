#include "file_mirror.hpp"
#include "utils.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace Dotsync {

bool SyncResult::succeeded() const
{
    if (!failed.empty()) {
        return false;
    }
    for (const auto& outcome : vcs) {
        if (!outcome.succeeded && outcome.error != ErrorKind::VcsNothingToCommit) {
            return false;
        }
    }
    return true;
}

void SyncResult::merge(const SyncResult& other)
{
    copied.insert(other.copied.begin(), other.copied.end());
    skipped.insert(other.skipped.begin(), other.skipped.end());
    for (const auto& [path, failure] : other.failed) {
        failed[path] = failure;
    }
    vcs.insert(vcs.end(), other.vcs.begin(), other.vcs.end());
}

FileMirror::FileMirror(LineEnding lineEnding)
    : lineEnding_(lineEnding)
{
}

std::string FileMirror::normalise(const std::string& content, LineEnding ending)
{
    if (ending == LineEnding::None) {
        return content;
    }

    std::string out;
    out.reserve(content.size());

    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (ending == LineEnding::LF) {
            if (c == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
                continue;
            }
            out += c;
        } else {
            if (c == '\n' && (i == 0 || content[i - 1] != '\r')) {
                out += '\r';
            }
            out += c;
        }
    }
    return out;
}

SyncResult FileMirror::copyAll(const fs::path& source,
                               const std::vector<fs::path>& destinations,
                               const std::optional<std::set<fs::path>>& only) const
{
    SyncResult result;

    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        result.failed[source] = {ErrorKind::FileUnreadable,
                                 "Source directory does not exist: " + source.string()};
        if (only) {
            result.skipped = *only;
        }
        return result;
    }

    std::set<fs::path> found;
    for (const FileEntry& entry : FileWalker(source)) {
        if (only && only->count(entry.relativePath) == 0) {
            continue;
        }
        found.insert(entry.relativePath);

        bool copiedEverywhere = true;
        for (const auto& destination : destinations) {
            fs::path target = destination / entry.relativePath;
            std::optional<FileFailure> failure = copyFile(entry.absolutePath, target);
            if (failure) {
                // Keyed by target so one failing destination does not hide another
                result.failed[target] = *failure;
                copiedEverywhere = false;
            }
        }

        if (copiedEverywhere && !destinations.empty()) {
            result.copied.insert(entry.relativePath);
        }
    }

    if (only) {
        for (const auto& wanted : *only) {
            if (found.count(wanted) == 0) {
                result.skipped.insert(wanted);
            }
        }
    }

    return result;
}

SyncResult FileMirror::copyTracked(const fs::path& source,
                                   const std::set<fs::path>& tracked,
                                   const fs::path& destination) const
{
    SyncResult result;

    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        result.failed[source] = {ErrorKind::FileUnreadable,
                                 "Source directory does not exist: " + source.string()};
        result.skipped = tracked;
        return result;
    }

    for (const auto& relative : tracked) {
        fs::path from = source / relative;
        if (!fs::is_regular_file(from, ec)) {
            result.skipped.insert(relative);
            continue;
        }

        fs::path target = destination / relative;
        std::optional<FileFailure> failure = copyFile(from, target);
        if (failure) {
            result.failed[target] = *failure;
        } else {
            result.copied.insert(relative);
        }
    }
    return result;
}

std::optional<FileFailure> FileMirror::copyFile(const fs::path& from, const fs::path& to) const
{
    std::string content;
    {
        std::ifstream in(from, std::ios::binary);
        if (!in.is_open()) {
            return FileFailure{ErrorKind::FileUnreadable, "Unable to open " + from.string() + " for reading"};
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad()) {
            return FileFailure{ErrorKind::FileUnreadable, "Failed reading " + from.string()};
        }
        content = buffer.str();
    }

    std::error_code ec;
    if (to.has_parent_path()) {
        fs::create_directories(to.parent_path(), ec);
        if (ec) {
            return FileFailure{ErrorKind::FileUnwritable,
                               "Unable to create directory " + to.parent_path().string() + ": " + ec.message()};
        }
    }

    if (fs::is_directory(to, ec)) {
        return FileFailure{ErrorKind::FileUnwritable, to.string() + " is a directory"};
    }

    std::ofstream out(to, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return FileFailure{ErrorKind::FileUnwritable, "Unable to open " + to.string() + " for writing"};
    }

    const std::string normalised = normalise(content, lineEnding_);
    out.write(normalised.data(), static_cast<std::streamsize>(normalised.size()));
    out.flush();
    if (!out) {
        return FileFailure{ErrorKind::FileUnwritable, "Failed writing " + to.string()};
    }
    return std::nullopt;
}

} // namespace Dotsync
