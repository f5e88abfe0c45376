#include "file_walker.hpp"
#include "utils.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace Dotsync {

FileWalker::FileWalker(fs::path root)
    : root_(std::move(root))
{
}

FileWalker::iterator FileWalker::begin() const
{
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return end();
    }

    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        log_warning("Unable to walk " + root_.string() + ": " + ec.message());
        return end();
    }
    return iterator(root_, std::move(it));
}

std::vector<FileEntry> FileWalker::collect() const
{
    std::vector<FileEntry> entries(begin(), end());
    std::sort(entries.begin(), entries.end());
    return entries;
}

FileWalker::iterator::iterator(const fs::path& root, fs::recursive_directory_iterator it)
    : root_(root), it_(std::move(it))
{
    settle();
}

FileWalker::iterator& FileWalker::iterator::operator++()
{
    std::error_code ec;
    it_.increment(ec);
    if (ec) {
        log_warning("Stopped walking " + root_.string() + ": " + ec.message());
        it_ = fs::recursive_directory_iterator();
        return *this;
    }
    settle();
    return *this;
}

void FileWalker::iterator::settle()
{
    const fs::recursive_directory_iterator endIt;

    while (it_ != endIt) {
        const fs::directory_entry& entry = *it_;
        std::error_code ec;

        if (entry.path().filename() == ".git") {
            if (entry.is_directory(ec)) {
                it_.disable_recursion_pending();
            }
        } else if (entry.is_regular_file(ec)) {
            current_.absolutePath = entry.path();
            current_.relativePath = entry.path().lexically_relative(root_);
            return;
        }

        it_.increment(ec);
        if (ec) {
            log_warning("Stopped walking " + root_.string() + ": " + ec.message());
            it_ = fs::recursive_directory_iterator();
        }
    }
}

} // namespace Dotsync
