/**
 * @file backup_config.hpp
 * @brief Configuration management for the HomeVault backup tool.
 *
 * Settings come from an optional JSON file and are then overridden by command-line
 * flags. Every flag has a matching JSON key.
 *
 * @note Use platform-appropriate paths in the configuration file (forward slashes work
 * everywhere).
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include <expected>
#include <string>
#include <vector>
#include <json/json.h>
#include "archive_format.hpp"
#include "remote_transfer.hpp"

/**
 * @brief Configuration of one backup run.
 */
class BackupConfig {
public:
    /**
     * @brief Constructs a configuration with built-in defaults.
     */
    BackupConfig() = default;

    /**
     * @brief Constructs a configuration from a JSON file.
     *
     * Keys missing from the file keep their defaults.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is unreadable or not valid JSON.
     */
    explicit BackupConfig(const std::string& configFile);

    /**
     * @brief Applies the keys present in a JSON object.
     *
     * @param json Parsed configuration object.
     * @throws std::runtime_error If a key has the wrong type.
     */
    void apply(const Json::Value& json);

    /**
     * @brief Checks that the selected upload mode has what it needs.
     *
     * @return std::expected<void, std::string> Success or the missing setting.
     */
    std::expected<void, std::string> validate() const;

    /**
     * @brief Returns true if the run ends with an upload.
     */
    bool uploadEnabled() const { return !skipUpload && !backupOnly; }

    std::string source;                       ///< Directory to back up; empty means the home directory.
    std::string destination;                  ///< Sync-tool destination (e.g. "gdrive:backup/home").
    std::string backupPath;                   ///< Local archive path; empty means <tmp>/<user>.<ext>.
    int compression = kDefaultCompressionLevel; ///< Compression level 0-9.
    bool verbose = false;                     ///< Emit debug lines.
    bool preview = false;                     ///< Describe the run without doing it.
    bool skipErrors = true;                   ///< Skip unreadable files instead of failing.
    bool skipUpload = false;                  ///< Do not upload.
    bool keepBackup = false;                  ///< Keep the local archive after a successful upload.
    bool ignoreExcludes = false;              ///< Back up everything.
    bool backupOnly = false;                  ///< Create the archive only.
    unsigned workers = 0;                     ///< Archive worker threads; 0 uses every processor.
    unsigned compressionThreads = 0;          ///< Compression threads; 0 uses every processor.
    std::string logFile;                      ///< Optional file receiving a copy of the log.
    std::string syncCommand = SyncConfig{}.command; ///< Sync tool command line.
    std::vector<std::string> excludePatterns; ///< Patterns added to the platform defaults.
    bool useSSH = false;                      ///< Upload over SFTP instead of the sync tool.
    SFTPConfig ssh;                           ///< SFTP settings.
};

/**
 * @brief Result of parsing the command line.
 */
struct CommandLine {
    BackupConfig config;      ///< Effective configuration.
    std::string configFile;   ///< Configuration file given with --config, if any.
    bool showHelp = false;    ///< --help was given.
    bool showVersion = false; ///< --version was given.
};

/**
 * @brief Parses command-line arguments (without the program name).
 *
 * A --config file is loaded first; the remaining flags override its values.
 *
 * @param args Arguments in order.
 * @return std::expected<CommandLine, std::string> Parsed request or an error message.
 */
std::expected<CommandLine, std::string> parseCommandLine(const std::vector<std::string>& args);

/**
 * @brief Returns the usage text.
 */
std::string usage(const std::string& program);

#endif // BACKUP_CONFIG_HPP
