#include "backup.hpp"
#include <filesystem>
#include <format>
#include <sstream>
#include "file_backup.hpp"

namespace fs = std::filesystem;

namespace {

ExclusionRules selectRules(const BackupConfig& config,
                           PlatformKind platform,
                           const std::expected<std::string, std::string>& username) {
    if (config.ignoreExcludes) {
        return ExclusionRules::none();
    }
    std::string user = username.value_or("");
    auto rules = ExclusionRules::forPlatform(platform, user);
    rules.addPatterns(config.excludePatterns, user);
    return rules;
}

std::unique_ptr<RemoteTransferStrategy> selectTransfer(const BackupConfig& config,
                                                       const std::expected<std::string, std::string>& username,
                                                       Logger& logger) {
    if (config.useSSH) {
        SFTPConfig sshConfig = config.ssh;
        if (sshConfig.user.empty() && username) {
            sshConfig.user = *username;
        }
        return std::make_unique<SFTPTransferStrategy>(std::move(sshConfig), logger);
    }
    return std::make_unique<SyncTransferStrategy>(SyncConfig{config.destination, config.syncCommand}, logger);
}

std::string joinPatterns(const std::vector<std::string>& patterns) {
    std::string joined;
    for (const auto& pattern : patterns) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += pattern;
    }
    return joined;
}

} // namespace

Backup::Backup(BackupConfig config, Logger& logger)
    : Backup(std::move(config), logger, currentPlatform()) {
}

Backup::Backup(BackupConfig config, Logger& logger, PlatformKind platform)
    : config(std::move(config)),
      logger(logger),
      username(currentUsername()),
      format(selectArchiveFormat(platform)),
      rules(selectRules(this->config, platform, username)),
      transferStrategy(selectTransfer(this->config, username, logger)) {
}

std::string Backup::sourceDirectory() const {
    if (!config.source.empty()) {
        return config.source;
    }
    return homeDirectory().value_or("");
}

std::expected<std::string, std::string> Backup::defaultBackupPath() const {
    if (!username) {
        return std::unexpected(std::format("failed to get username: {}", username.error()));
    }
    return (fs::path(tempDirectory()) / std::format("{}.{}", *username, format->extension())).string();
}

std::expected<std::string, std::string> Backup::archivePath() const {
    if (!config.backupPath.empty()) {
        return config.backupPath;
    }
    return defaultBackupPath();
}

std::expected<std::string, std::string> Backup::createArchive() {
    std::string source = sourceDirectory();
    if (source.empty()) {
        auto home = homeDirectory();
        return std::unexpected(std::format("could not determine home directory: {}",
                                           home ? std::string("empty path") : home.error()));
    }
    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        return std::unexpected(std::format("source directory does not exist: {}", source));
    }

    auto path = archivePath();
    if (!path) {
        return std::unexpected(path.error());
    }

    if (fs::exists(*path, ec)) {
        logger.info("Backup file already exists: {}", *path);
        logger.info("Skipping backup creation and using existing file");
        return *path;
    }

    int level = clampCompressionLevel(config.compression);
    if (level != config.compression) {
        logger.warn("Compression level {} is out of range, using {}", config.compression, level);
    }

    logger.info("Creating backup of: {}", source);
    logger.info("Backup file: {}", *path);
    logger.info("Using compression level: {}", level);
    if (config.ignoreExcludes) {
        logger.info("Ignoring exclude patterns - backing up everything");
    } else {
        logger.debug("Using {} exclude patterns: {}", rules.platform(), joinPatterns(rules.patterns()));
    }

    ExclusionMatcher matcher(rules, logger);
    ArchiveOptions options;
    options.compressionLevel = level;
    options.workers = config.workers;
    options.compressionThreads = config.compressionThreads;
    options.skipOnError = config.skipErrors;

    ArchiveBuilder builder(*format, matcher, fileSystem, logger, options);
    auto stats = builder.execute(source, *path);
    if (!stats) {
        return std::unexpected(std::format("failed to create archive: {}", stats.error()));
    }
    return *path;
}

std::expected<void, std::string> Backup::upload(const std::string& archivePath) {
    logger.debug("Uploading {} with {}", archivePath, transferStrategy->describe());
    return transferStrategy->transfer(archivePath);
}

std::expected<void, std::string> Backup::execute() {
    auto archive = createArchive();
    if (!archive) {
        return std::unexpected(std::format("failed to create backup: {}", archive.error()));
    }

    if (config.backupOnly) {
        logger.info("Backup-only mode. Backup file is available at: {}", *archive);
        return {};
    }
    if (config.skipUpload) {
        logger.info("Upload skipped. Backup file is available at: {}", *archive);
        return {};
    }

    auto uploaded = upload(*archive);
    if (!uploaded) {
        logger.error("Upload failed, backup file preserved at: {}", *archive);
        return std::unexpected(std::format("failed to upload backup: {}", uploaded.error()));
    }

    if (config.keepBackup) {
        logger.info("Keeping backup file at: {}", *archive);
        return {};
    }
    std::error_code ec;
    if (!fs::remove(*archive, ec)) {
        logger.warn("Failed to cleanup backup file: {} ({})", *archive, ec ? ec.message() : "not found");
    } else {
        logger.debug("Removed backup file: {}", *archive);
    }
    return {};
}

std::expected<std::string, std::string> Backup::preview() const {
    std::string source = sourceDirectory();
    if (source.empty()) {
        return std::unexpected("could not determine home directory");
    }
    auto path = archivePath();

    std::ostringstream out;
    out << "Preview summary:\n";
    out << "---------------\n";
    out << std::format("Source: {}\n", source);
    out << std::format("Backup file: {}\n", path ? *path : std::format("(unavailable: {})", path.error()));
    out << std::format("Archive format: {}\n", format->name());
    if (config.uploadEnabled()) {
        if (config.useSSH) {
            out << std::format("SSH Destination: {}[hostname]/Users/[date]/\n", transferStrategy->describe());
        } else {
            out << std::format("Destination: {}\n", transferStrategy->describe());
        }
    }
    out << std::format("Compression level: {}\n", clampCompressionLevel(config.compression));
    if (config.ignoreExcludes) {
        out << "Ignore excludes: Yes (backing up everything)\n";
    } else {
        out << std::format("Exclude patterns: {}\n", rules.patterns().size());
    }
    out << "\nThis would:\n";
    out << std::format("1. Create backup archive of: {}\n", source);
    if (config.backupOnly) {
        out << "2. Keep backup file locally (backup-only mode)\n";
    } else if (!config.skipUpload) {
        out << std::format("2. Upload to: {}\n", transferStrategy->describe());
        if (!config.keepBackup) {
            out << "3. Clean up temporary files\n";
        } else {
            out << "3. Keep backup file after upload\n";
        }
    } else {
        out << "2. Skip upload (backup file will be preserved)\n";
    }
    return out.str();
}
