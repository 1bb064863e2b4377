/**
 * @file backup.hpp
 * @brief Defines the backup orchestration for HomeVault.
 *
 * A run has two phases: the archive phase builds one compressed archive of the source
 * directory, and the upload phase hands the closed archive to the configured remote
 * transfer strategy. The local archive is removed only after a confirmed upload.
 *
 * @note Tar.gz archives are produced on Linux and macOS, zip archives on Windows.
 */

#ifndef BACKUP_HPP
#define BACKUP_HPP

#include <expected>
#include <memory>
#include <string>
#include "archive_format.hpp"
#include "backup_config.hpp"
#include "exclusion_rules.hpp"
#include "file_system.hpp"
#include "logger.hpp"
#include "platform.hpp"
#include "remote_transfer.hpp"

/**
 * @brief Main backup orchestration class.
 *
 * Chooses the archive format, exclusion rules and transfer strategy once at
 * construction and runs the phases in order.
 */
class Backup {
public:
    /**
     * @brief Constructs a backup run for the current platform.
     *
     * @param config Effective configuration.
     * @param logger Destination of all diagnostics.
     */
    Backup(BackupConfig config, Logger& logger);

    /**
     * @brief Constructs a backup run for an explicit platform.
     *
     * @param config Effective configuration.
     * @param logger Destination of all diagnostics.
     * @param platform Platform whose archive format and default exclusions are used.
     */
    Backup(BackupConfig config, Logger& logger, PlatformKind platform);

    /**
     * @brief Runs the archive phase, then the upload phase unless disabled.
     *
     * @return std::expected<void, std::string> Success, or an error prefixed with the
     * failing phase ("failed to create backup: ..." or "failed to upload backup: ...").
     */
    std::expected<void, std::string> execute();

    /**
     * @brief Builds the archive, or reuses one that already exists at the target path.
     *
     * @return std::expected<std::string, std::string> Archive path or an error message.
     */
    std::expected<std::string, std::string> createArchive();

    /**
     * @brief Uploads a closed archive with the configured strategy.
     *
     * @param archivePath Local archive.
     * @return std::expected<void, std::string> Success or an error message.
     */
    std::expected<void, std::string> upload(const std::string& archivePath);

    /**
     * @brief Describes what execute() would do without touching anything.
     *
     * @return std::expected<std::string, std::string> Multi-line description or an error message.
     */
    std::expected<std::string, std::string> preview() const;

    /**
     * @brief Returns the archive path used when none is configured: <tmp>/<user>.<ext>.
     */
    std::expected<std::string, std::string> defaultBackupPath() const;

    /**
     * @brief Returns the exclusion rules in effect for this run.
     */
    const ExclusionRules& exclusionRules() const { return rules; }

    /**
     * @brief Returns the archive format selected for this run.
     */
    const ArchiveFormat& archiveFormat() const { return *format; }

private:
    std::string sourceDirectory() const;
    std::expected<std::string, std::string> archivePath() const;

    BackupConfig config; ///< Backup configuration.
    Logger& logger; ///< Diagnostics sink.
    std::expected<std::string, std::string> username; ///< Current user, or why it is unknown.
    std::unique_ptr<ArchiveFormat> format; ///< Archive container format.
    ExclusionRules rules; ///< Exclusion patterns for the run.
    std::unique_ptr<RemoteTransferStrategy> transferStrategy; ///< Remote transfer strategy.
    LocalFileSystem fileSystem; ///< Source filesystem.
};

#endif // BACKUP_HPP
