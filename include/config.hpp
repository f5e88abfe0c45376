#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Dotsync {

/**
 * @brief Line ending normalisation applied to files written into the repository.
 */
enum class LineEnding
{
    None,
    LF,
    CRLF
};

const char* toString(LineEnding ending);

/**
 * @brief Parses "none", "lf" or "crlf" (case-insensitive).
 * @return std::nullopt for any other value.
 */
std::optional<LineEnding> parseLineEnding(const std::string& value);

class Config
{
public:
    /**
     * @brief Directory holding the tracked dot files. Relative paths are
     *        resolved against the install root.
     */
    std::filesystem::path repoDotFilesDir = "DotFiles";

    /**
     * @brief Ordered list of home-directory-like locations to synchronise.
     */
    std::vector<std::filesystem::path> localPaths;

    LineEnding lineEnding = LineEnding::None;

    /**
     * @brief Prints the configuration to standard output.
     */
    void print() const;

    /**
     * @brief Appends a local path unless it is already configured.
     * @return False if the path was already present.
     */
    bool addLocalPath(const std::filesystem::path& path);

    /**
     * @brief Removes a local path if it is configured.
     * @return False if the path was not present.
     */
    bool removeLocalPath(const std::filesystem::path& path);

    /**
     * @brief Replaces the local path list, dropping duplicates.
     */
    void setLocalPaths(const std::vector<std::filesystem::path>& paths);

    void setRepoDir(const std::filesystem::path& path);

    void setLineEnding(LineEnding ending);

    /**
     * @brief Resolves repoDotFilesDir against the given install root.
     */
    std::filesystem::path resolvedRepoDir(const std::filesystem::path& installRoot) const;

    bool operator==(const Config& other) const;
    bool operator!=(const Config& other) const { return !(*this == other); }
};

/**
 * @class SettingsStore
 * @brief Owns the persisted YAML settings file.
 */
class SettingsStore
{
public:
    static constexpr const char* kDefaultFileName = "dotsync.yaml";

    explicit SettingsStore(std::filesystem::path path);

    const std::filesystem::path& path() const { return path_; }

    bool exists() const;

    /**
     * @brief Loads configuration from the settings file.
     * @throws SyncError(ConfigMissing) if the file does not exist.
     * @throws SyncError(ConfigCorrupt) if the file cannot be parsed.
     */
    Config load() const;

    /**
     * @brief Loads configuration, falling back to defaults on first run.
     */
    Config loadOrDefault() const;

    /**
     * @brief Writes the configuration to a temporary file next to the
     *        settings file and renames it into place.
     * @throws SyncError(FileUnwritable) if writing or renaming fails.
     */
    void save(const Config& config) const;

private:
    std::filesystem::path path_;
};

} // namespace Dotsync

#endif // CONFIG_HPP
