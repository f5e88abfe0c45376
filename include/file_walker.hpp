#ifndef FILE_WALKER_HPP
#define FILE_WALKER_HPP

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <string>
#include <vector>

namespace Dotsync {

/**
 * @brief A regular file discovered under a walked root.
 */
struct FileEntry
{
    std::filesystem::path relativePath; // e.g. ".config/app/settings.ini"
    std::filesystem::path absolutePath;

    bool operator<(const FileEntry& other) const { return relativePath < other.relativePath; }
    bool operator==(const FileEntry& other) const { return relativePath == other.relativePath; }
};

/**
 * @class FileWalker
 * @brief Lazy, finite and restartable sequence of the regular files under a
 *        root directory, recursing into subdirectories.
 *
 * Every call to begin() starts a fresh walk. A missing root yields an empty
 * sequence. The ".git" directory is never entered.
 */
class FileWalker
{
public:
    class iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = FileEntry;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const FileEntry*;
        using reference         = const FileEntry&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++();

        bool operator==(const iterator& other) const { return it_ == other.it_; }
        bool operator!=(const iterator& other) const { return it_ != other.it_; }

    private:
        friend class FileWalker;

        iterator(const std::filesystem::path& root, std::filesystem::recursive_directory_iterator it);

        // Moves forward until a regular file or the end is reached
        void settle();

        std::filesystem::path root_;
        std::filesystem::recursive_directory_iterator it_;
        FileEntry current_;
    };

    explicit FileWalker(std::filesystem::path root);

    iterator begin() const;
    iterator end() const { return iterator(); }

    const std::filesystem::path& root() const { return root_; }

    /**
     * @brief Walks the root once and returns the entries sorted by relative path.
     */
    std::vector<FileEntry> collect() const;

private:
    std::filesystem::path root_;
};

} // namespace Dotsync

#endif // FILE_WALKER_HPP
