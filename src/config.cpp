#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

namespace Dotsync {

    const char* toString(LineEnding ending) {
        switch (ending) {
            case LineEnding::None: return "none";
            case LineEnding::LF:   return "lf";
            case LineEnding::CRLF: return "crlf";
        }
        return "none";
    }

    std::optional<LineEnding> parseLineEnding(const std::string& value) {
        std::string lower = trim(value);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "none") return LineEnding::None;
        if (lower == "lf")   return LineEnding::LF;
        if (lower == "crlf") return LineEnding::CRLF;
        return std::nullopt;
    }

    void Config::print() const {
        std::cout << "repoDotFilesDir = " << repoDotFilesDir.string() << std::endl;
        std::cout << "lineEnding      = " << toString(lineEnding) << std::endl;
        std::cout << "localPaths:" << std::endl;
        if (localPaths.empty()) {
            std::cout << "  <none>" << std::endl;
        }
        for (const auto& path : localPaths) {
            std::cout << "  - " << path.string() << std::endl;
        }
    }

    bool Config::addLocalPath(const fs::path& path) {
        if (std::find(localPaths.begin(), localPaths.end(), path) != localPaths.end()) {
            return false;
        }
        localPaths.push_back(path);
        return true;
    }

    bool Config::removeLocalPath(const fs::path& path) {
        auto it = std::find(localPaths.begin(), localPaths.end(), path);
        if (it == localPaths.end()) {
            return false;
        }
        localPaths.erase(it);
        return true;
    }

    void Config::setLocalPaths(const std::vector<fs::path>& paths) {
        localPaths.clear();
        for (const auto& path : paths) {
            addLocalPath(path);
        }
    }

    void Config::setRepoDir(const fs::path& path) {
        repoDotFilesDir = path;
    }

    void Config::setLineEnding(LineEnding ending) {
        lineEnding = ending;
    }

    fs::path Config::resolvedRepoDir(const fs::path& installRoot) const {
        if (repoDotFilesDir.is_absolute()) {
            return repoDotFilesDir.lexically_normal();
        }
        return (installRoot / repoDotFilesDir).lexically_normal();
    }

    bool Config::operator==(const Config& other) const {
        return repoDotFilesDir == other.repoDotFilesDir &&
               localPaths == other.localPaths &&
               lineEnding == other.lineEnding;
    }

    // -----------------------------------------------------------------------
    // SettingsStore
    // -----------------------------------------------------------------------

    SettingsStore::SettingsStore(fs::path path)
        : path_(std::move(path)) {
    }

    bool SettingsStore::exists() const {
        std::error_code ec;
        return fs::is_regular_file(path_, ec);
    }

    Config SettingsStore::load() const {
        if (!exists()) {
            throw SyncError(ErrorKind::ConfigMissing,
                            "Configuration file not found: " + path_.string() +
                            " (run 'dotsync config' first)");
        }

        YAML::Node root;
        try {
            root = YAML::LoadFile(path_.string());
        } catch (const YAML::Exception& e) {
            throw SyncError(ErrorKind::ConfigCorrupt,
                            "Unable to parse configuration file " + path_.string() + ": " + e.what());
        }

        if (root.IsNull()) {
            throw SyncError(ErrorKind::ConfigCorrupt,
                            "Configuration file " + path_.string() + " is empty");
        }
        if (!root.IsMap()) {
            throw SyncError(ErrorKind::ConfigCorrupt,
                            "Configuration file " + path_.string() + " is not a key-value map");
        }

        Config config;
        try {
            if (root["repoDotFilesDir"]) {
                config.repoDotFilesDir = root["repoDotFilesDir"].as<std::string>();
            }

            const YAML::Node paths = root["localPaths"];
            if (!paths) {
                throw SyncError(ErrorKind::ConfigCorrupt,
                                "Missing 'localPaths' in " + path_.string());
            }
            if (paths.IsSequence()) {
                for (const auto& item : paths) {
                    config.addLocalPath(item.as<std::string>());
                }
            } else if (paths.IsScalar()) {
                // Older files store the list as a single comma separated scalar
                for (const auto& item : splitCommaList(paths.as<std::string>())) {
                    config.addLocalPath(item);
                }
            } else if (!paths.IsNull()) {
                throw SyncError(ErrorKind::ConfigCorrupt,
                                "'localPaths' must be a list in " + path_.string());
            }

            if (root["lineEnding"]) {
                std::string value = root["lineEnding"].as<std::string>();
                std::optional<LineEnding> ending = parseLineEnding(value);
                if (!ending) {
                    throw SyncError(ErrorKind::ConfigCorrupt,
                                    "Unknown lineEnding '" + value + "' in " + path_.string());
                }
                config.lineEnding = *ending;
            }
        } catch (const YAML::Exception& e) {
            throw SyncError(ErrorKind::ConfigCorrupt,
                            "Invalid value in configuration file " + path_.string() + ": " + e.what());
        }

        return config;
    }

    Config SettingsStore::loadOrDefault() const {
        if (!exists()) {
            return Config{};
        }
        return load();
    }

    void SettingsStore::save(const Config& config) const {
        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << "repoDotFilesDir" << YAML::Value << config.repoDotFilesDir.string();
        out << YAML::Key << "lineEnding" << YAML::Value << toString(config.lineEnding);
        out << YAML::Key << "localPaths" << YAML::Value << YAML::BeginSeq;
        for (const auto& path : config.localPaths) {
            out << path.string();
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;

        if (!out.good()) {
            throw SyncError(ErrorKind::ConfigCorrupt,
                            "Unable to serialise configuration: " + out.GetLastError());
        }

        std::error_code ec;
        if (path_.has_parent_path()) {
            fs::create_directories(path_.parent_path(), ec);
            if (ec) {
                throw SyncError(ErrorKind::FileUnwritable,
                                "Unable to create directory " + path_.parent_path().string() +
                                ": " + ec.message());
            }
        }

        fs::path tempPath = path_;
        tempPath += ".tmp." + std::to_string(::getpid());

        {
            std::ofstream file(tempPath, std::ios::trunc);
            if (!file.is_open()) {
                throw SyncError(ErrorKind::FileUnwritable,
                                "Unable to open configuration file for writing: " + tempPath.string());
            }

            file << "# dotsync configuration\n";
            file << out.c_str() << "\n";
            file.flush();

            if (!file) {
                file.close();
                fs::remove(tempPath, ec);
                throw SyncError(ErrorKind::FileUnwritable,
                                "Failed writing configuration file: " + tempPath.string());
            }
        }

        fs::rename(tempPath, path_, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw SyncError(ErrorKind::FileUnwritable,
                            "Unable to replace configuration file " + path_.string() + ": " + ec.message());
        }
    }
}
