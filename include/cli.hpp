#ifndef CLI_HPP
#define CLI_HPP

#include "config.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#define DOTSYNC_VERSION "1.0.0"

namespace Dotsync {

enum class Command
{
    None,
    Config,
    Local,
    Repo
};

/**
 * @brief Everything parsed from the command line.
 */
struct Options
{
    Command command = Command::None;
    std::filesystem::path installRoot = ".";
    bool showHelp = false;
    bool showVersion = false;

    // config
    bool list = false;
    std::optional<std::string> localPaths;
    std::optional<std::string> addPath;
    std::optional<std::string> removePath;
    std::optional<std::string> repoDir;
    std::optional<std::string> lineEnding;

    // local / repo
    std::optional<std::string> fileName;
    bool pull = false;
    bool push = false;
    bool commitOnly = false;
};

/**
 * @brief Thrown for malformed command lines; the message is shown with the usage.
 */
class UsageError : public std::runtime_error
{
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Parses argv (excluding argv[0]).
 * @throws UsageError on unknown options, missing values or conflicting config options.
 */
Options parseArguments(const std::vector<std::string>& args);

void printHelp();
void printUsage(Command command);

/**
 * @brief Applies a `config` invocation to the store.
 * @return The process exit code.
 */
int runConfigCommand(const Options& options, const SettingsStore& store);

/**
 * @brief Runs `local` or `repo` against the real git tool.
 * @return The process exit code.
 */
int runSyncCommand(const Options& options, const SettingsStore& store);

} // namespace Dotsync

#endif // CLI_HPP
