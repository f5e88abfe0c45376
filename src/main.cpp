#include <iostream>
#include <string>
#include <vector>

#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"

int main(int argc, char* argv[])
{
    // If no command is supplied, show the help message
    if (argc < 2) {
        Dotsync::printHelp();
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);

    Dotsync::Options options;
    try {
        options = Dotsync::parseArguments(args);
    } catch (const Dotsync::UsageError& e) {
        Dotsync::printUsage(Dotsync::Command::None);
        Dotsync::log_error(e.what());
        return 2;
    }

    if (options.showVersion) {
        std::cout << "dotsync " << DOTSYNC_VERSION << std::endl;
        return 0;
    }
    if (options.command == Dotsync::Command::None) {
        Dotsync::printHelp();
        return options.showHelp ? 0 : 1;
    }
    if (options.showHelp) {
        Dotsync::printUsage(options.command);
        return 0;
    }

    Dotsync::SettingsStore store(options.installRoot / Dotsync::SettingsStore::kDefaultFileName);

    try {
        if (options.command == Dotsync::Command::Config) {
            return Dotsync::runConfigCommand(options, store);
        }
        return Dotsync::runSyncCommand(options, store);
    } catch (const Dotsync::UsageError& e) {
        Dotsync::printUsage(options.command);
        Dotsync::log_error(e.what());
        return 2;
    } catch (const Dotsync::SyncError& e) {
        Dotsync::log_error(std::string(Dotsync::toString(e.kind())) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        Dotsync::log_error(e.what());
        return 1;
    }
}
