#include "cli.hpp"
#include "errors.hpp"
#include "orchestrator.hpp"
#include "utils.hpp"
#include "vcs.hpp"

#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace Dotsync {

namespace
{
    // Reads the value following an option, advancing the index
    std::string takeValue(const std::vector<std::string>& args, size_t& i)
    {
        if (i + 1 >= args.size()) {
            throw UsageError(args[i] + " requires a value");
        }
        return args[++i];
    }

    fs::path absolutePath(const std::string& raw)
    {
        std::error_code ec;
        fs::path path = fs::absolute(raw, ec);
        if (ec) {
            throw SyncError(ErrorKind::ConfigCorrupt, "Unable to resolve path '" + raw + "': " + ec.message());
        }
        return path.lexically_normal();
    }

    // Existing non-directories are rejected, missing paths are creatable
    fs::path validatedDirectory(const std::string& raw)
    {
        fs::path path = absolutePath(raw);
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            log_warning("Location '" + path.string() + "' does not exist yet, it will be created on sync");
        } else if (!fs::is_directory(path, ec)) {
            throw SyncError(ErrorKind::ConfigCorrupt, "Provided location '" + path.string() + "' is not a directory");
        }
        return path;
    }

    void printSummary(const SyncResult& result)
    {
        std::cout << "Summary: " << result.copied.size() << " copied, "
                  << result.skipped.size() << " skipped, "
                  << result.failed.size() << " failed" << std::endl;
        for (const auto& outcome : result.vcs) {
            std::cout << "  git " << toString(outcome.operation) << ": "
                      << (outcome.succeeded ? "ok" : toString(outcome.error)) << std::endl;
        }
    }
}

Options parseArguments(const std::vector<std::string>& args)
{
    Options options;
    size_t i = 0;

    // Global options come before the command
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "-v" || arg == "--version") {
            options.showVersion = true;
        } else if (arg == "--root") {
            options.installRoot = takeValue(args, i);
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("Unknown option '" + arg + "'");
        } else {
            break;
        }
    }

    if (i >= args.size()) {
        return options;
    }

    const std::string& command = args[i++];
    if (command == "config") {
        options.command = Command::Config;
    } else if (command == "local") {
        options.command = Command::Local;
    } else if (command == "repo") {
        options.command = Command::Repo;
    } else {
        throw UsageError("Unknown command '" + command + "'");
    }

    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (options.command == Command::Config && arg == "--list") {
            options.list = true;
        } else if (options.command == Command::Config && arg == "--localPaths") {
            options.localPaths = takeValue(args, i);
        } else if (options.command == Command::Config && arg == "--addPath") {
            options.addPath = takeValue(args, i);
        } else if (options.command == Command::Config && arg == "--removePath") {
            options.removePath = takeValue(args, i);
        } else if (options.command == Command::Config && arg == "--repoDir") {
            options.repoDir = takeValue(args, i);
        } else if (options.command == Command::Config && arg == "--lineEnding") {
            options.lineEnding = takeValue(args, i);
        } else if (options.command != Command::Config && arg == "--fileName") {
            options.fileName = takeValue(args, i);
        } else if (options.command == Command::Local && arg == "--pull") {
            options.pull = true;
        } else if (options.command == Command::Repo && arg == "--push") {
            options.push = true;
        } else if (options.command == Command::Repo && arg == "--commitOnly") {
            options.commitOnly = true;
        } else {
            throw UsageError("Unknown argument '" + arg + "' for command '" + command + "'");
        }
    }

    if (options.command == Command::Config && !options.showHelp) {
        int selected = (options.list ? 1 : 0) +
                       (options.localPaths ? 1 : 0) +
                       (options.addPath ? 1 : 0) +
                       (options.removePath ? 1 : 0) +
                       (options.repoDir ? 1 : 0) +
                       (options.lineEnding ? 1 : 0);
        if (selected != 1) {
            throw UsageError("config requires exactly one of --list, --localPaths, --addPath, "
                             "--removePath, --repoDir, --lineEnding");
        }
    }

    return options;
}

void printHelp()
{
    std::cout << "dotsync " << DOTSYNC_VERSION << "\n"
              << "Usage: dotsync [--root DIR] [--version] [--help] <command> [<args>]\n\n"
              << "Keeps dot files in a home directory and a git repository in step.\n\n"
              << "File synchronization commands:\n"
              << "  config       Set the configuration of dotsync\n"
              << "  local        Update local dot files from the repository\n"
              << "  repo         Update repository files from the local dot files\n\n"
              << "Global options:\n"
              << "  --root DIR   Install root holding dotsync.yaml and the DotFiles directory\n"
              << "               <default: current directory>\n";
}

void printUsage(Command command)
{
    switch (command) {
        case Command::Config:
            std::cerr << "Usage: dotsync config [--list] [--localPaths PATHS] [--addPath PATH]\n"
                      << "                      [--removePath PATH] [--repoDir PATH] [--lineEnding ENDING]\n"
                      << "  --list               Display the current configuration\n"
                      << "  --localPaths PATHS   Comma separated local directories, in sync order\n"
                      << "  --addPath PATH       Append a local directory\n"
                      << "  --removePath PATH    Remove a local directory\n"
                      << "  --repoDir PATH       Repository dot files directory <default: DotFiles>\n"
                      << "  --lineEnding ENDING  Normalise repo files with: none, lf, crlf\n";
            break;
        case Command::Local:
            std::cerr << "Usage: dotsync local [--fileName FILENAME] [--pull]\n"
                      << "  --fileName FILENAME  Only synchronize the dot file of this name\n"
                      << "  --pull               Pull changes from the remote before synchronizing\n";
            break;
        case Command::Repo:
            std::cerr << "Usage: dotsync repo [--fileName FILENAME] [--push] [--commitOnly]\n"
                      << "  --fileName FILENAME  Only synchronize the dot file of this name\n"
                      << "  --push               Push changes to the remote after committing\n"
                      << "  --commitOnly         Commit but never push (overrides --push)\n";
            break;
        case Command::None:
            std::cerr << "Usage: dotsync [--root DIR] [--version] [--help] <command> [<args>]\n";
            break;
    }
}

int runConfigCommand(const Options& options, const SettingsStore& store)
{
    if (options.list) {
        if (!store.exists()) {
            std::cout << "<EMPTY CONFIG>" << std::endl;
            return 0;
        }
        store.load().print();
        return 0;
    }

    Config config = store.loadOrDefault();

    if (options.localPaths) {
        std::vector<fs::path> paths;
        for (const auto& raw : splitCommaList(*options.localPaths)) {
            paths.push_back(validatedDirectory(raw));
        }
        if (paths.empty()) {
            throw UsageError("--localPaths requires at least one path");
        }
        config.setLocalPaths(paths);
    } else if (options.addPath) {
        fs::path path = validatedDirectory(*options.addPath);
        if (!config.addLocalPath(path)) {
            log_warning("Local path already configured: " + path.string());
            return 0;
        }
    } else if (options.removePath) {
        fs::path path = absolutePath(*options.removePath);
        if (!config.removeLocalPath(path)) {
            log_error("Local path not configured: " + path.string());
            return 1;
        }
    } else if (options.repoDir) {
        config.setRepoDir(fs::path(*options.repoDir).lexically_normal());
    } else if (options.lineEnding) {
        std::optional<LineEnding> ending = parseLineEnding(*options.lineEnding);
        if (!ending) {
            throw UsageError("--lineEnding must be one of: none, lf, crlf");
        }
        config.setLineEnding(*ending);
    }

    store.save(config);
    log_message("Configuration saved to " + store.path().string());
    return 0;
}

int runSyncCommand(const Options& options, const SettingsStore& store)
{
    Config config = store.load();

    GitBridge git;
    SyncOrchestrator orchestrator(config, fs::absolute(options.installRoot), git);
    if (options.fileName) {
        orchestrator.setFileName(fs::path(*options.fileName));
    }

    SyncResult result = options.command == Command::Local
        ? orchestrator.runLocal(options.pull)
        : orchestrator.runRepo(options.push, options.commitOnly);

    printSummary(result);
    return result.succeeded() ? 0 : 1;
}

} // namespace Dotsync
