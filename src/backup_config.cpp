#include "backup_config.hpp"
#include <format>
#include <fstream>
#include <stdexcept>

namespace {

std::string getString(const Json::Value& json, const char* key, const std::string& fallback) {
    if (!json.isMember(key)) {
        return fallback;
    }
    const auto& value = json[key];
    if (!value.isString()) {
        throw std::runtime_error(std::format("Config key '{}' must be a string", key));
    }
    return value.asString();
}

bool getBool(const Json::Value& json, const char* key, bool fallback) {
    if (!json.isMember(key)) {
        return fallback;
    }
    const auto& value = json[key];
    if (!value.isBool()) {
        throw std::runtime_error(std::format("Config key '{}' must be a boolean", key));
    }
    return value.asBool();
}

int getInt(const Json::Value& json, const char* key, int fallback) {
    if (!json.isMember(key)) {
        return fallback;
    }
    const auto& value = json[key];
    if (!value.isInt()) {
        throw std::runtime_error(std::format("Config key '{}' must be an integer", key));
    }
    return value.asInt();
}

unsigned getUnsigned(const Json::Value& json, const char* key, unsigned fallback) {
    int value = getInt(json, key, static_cast<int>(fallback));
    if (value < 0) {
        throw std::runtime_error(std::format("Config key '{}' must not be negative", key));
    }
    return static_cast<unsigned>(value);
}

std::expected<int, std::string> parseInt(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) {
            return std::unexpected(std::format("invalid value for {}: {}", flag, text));
        }
        return value;
    } catch (const std::exception&) {
        return std::unexpected(std::format("invalid value for {}: {}", flag, text));
    }
}

} // namespace

BackupConfig::BackupConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
        throw std::runtime_error(std::format("Failed to parse config file: {}: {}", configFile, errors));
    }
    if (!configJson.isObject()) {
        throw std::runtime_error(std::format("Config file must contain a JSON object: {}", configFile));
    }
    apply(configJson);
}

void BackupConfig::apply(const Json::Value& json) {
    source = getString(json, "source", source);
    destination = getString(json, "destination", destination);
    backupPath = getString(json, "backup_path", backupPath);
    compression = getInt(json, "compression", compression);
    verbose = getBool(json, "verbose", verbose);
    skipErrors = getBool(json, "skip_errors", skipErrors);
    skipUpload = getBool(json, "skip_upload", skipUpload);
    keepBackup = getBool(json, "keep_backup", keepBackup);
    ignoreExcludes = getBool(json, "ignore_excludes", ignoreExcludes);
    backupOnly = getBool(json, "backup_only", backupOnly);
    workers = getUnsigned(json, "workers", workers);
    compressionThreads = getUnsigned(json, "compression_threads", compressionThreads);
    logFile = getString(json, "log_file", logFile);
    syncCommand = getString(json, "sync_command", syncCommand);

    if (json.isMember("exclude_patterns")) {
        const auto& patterns = json["exclude_patterns"];
        if (!patterns.isArray()) {
            throw std::runtime_error("Config key 'exclude_patterns' must be an array");
        }
        for (const auto& pattern : patterns) {
            if (!pattern.isString()) {
                throw std::runtime_error("Config key 'exclude_patterns' must contain strings");
            }
            excludePatterns.push_back(pattern.asString());
        }
    }

    if (json.isMember("ssh")) {
        const auto& sshJson = json["ssh"];
        if (!sshJson.isObject()) {
            throw std::runtime_error("Config key 'ssh' must be an object");
        }
        useSSH = getBool(sshJson, "use", useSSH);
        ssh.host = getString(sshJson, "host", ssh.host);
        ssh.port = getInt(sshJson, "port", ssh.port);
        ssh.user = getString(sshJson, "user", ssh.user);
        ssh.password = getString(sshJson, "password", ssh.password);
        ssh.keyFile = getString(sshJson, "key_file", ssh.keyFile);
        ssh.remotePath = getString(sshJson, "remote_path", ssh.remotePath);
        ssh.strictHostKey = getBool(sshJson, "strict_host_key", ssh.strictHostKey);
    }
}

std::expected<void, std::string> BackupConfig::validate() const {
    if (!uploadEnabled()) {
        return {};
    }
    if (useSSH) {
        if (ssh.host.empty()) {
            return std::unexpected("SSH host is required when using SSH upload");
        }
        if (ssh.port <= 0 || ssh.port > 65535) {
            return std::unexpected(std::format("invalid SSH port: {}", ssh.port));
        }
        return {};
    }
    if (destination.empty()) {
        return std::unexpected(
            "required flag \"destination\" not set (use --ssh for SSH upload or --backup-only for local backup)");
    }
    return {};
}

std::expected<CommandLine, std::string> parseCommandLine(const std::vector<std::string>& args) {
    CommandLine result;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                return std::unexpected("--config requires a value");
            }
            result.configFile = args[i + 1];
        }
    }
    if (!result.configFile.empty()) {
        try {
            result.config = BackupConfig(result.configFile);
        } catch (const std::exception& e) {
            return std::unexpected(std::format("Failed to load config: {}", e.what()));
        }
    }

    BackupConfig& config = result.config;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> std::expected<std::string, std::string> {
            if (i + 1 >= args.size()) {
                return std::unexpected(std::format("{} requires a value", arg));
            }
            return args[++i];
        };
        auto assign = [&](std::string& target) -> std::expected<void, std::string> {
            auto v = value();
            if (!v) {
                return std::unexpected(v.error());
            }
            target = *v;
            return {};
        };
        auto assignInt = [&](int& target) -> std::expected<void, std::string> {
            auto v = value();
            if (!v) {
                return std::unexpected(v.error());
            }
            auto parsed = parseInt(arg, *v);
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            target = *parsed;
            return {};
        };

        std::expected<void, std::string> status;
        if (arg == "--config") {
            ++i;
        } else if (arg == "-h" || arg == "--help") {
            result.showHelp = true;
        } else if (arg == "--version") {
            result.showVersion = true;
        } else if (arg == "-s" || arg == "--source") {
            status = assign(config.source);
        } else if (arg == "-d" || arg == "--destination") {
            status = assign(config.destination);
        } else if (arg == "--backup-path") {
            status = assign(config.backupPath);
        } else if (arg == "-c" || arg == "--compression") {
            status = assignInt(config.compression);
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--preview") {
            config.preview = true;
        } else if (arg == "--skip-errors") {
            config.skipErrors = true;
        } else if (arg == "--no-skip-errors") {
            config.skipErrors = false;
        } else if (arg == "--skip-upload") {
            config.skipUpload = true;
        } else if (arg == "--keep-backup") {
            config.keepBackup = true;
        } else if (arg == "--ignore-excludes") {
            config.ignoreExcludes = true;
        } else if (arg == "--backup-only") {
            config.backupOnly = true;
        } else if (arg == "--workers") {
            int workers = 0;
            status = assignInt(workers);
            if (status && workers < 0) {
                status = std::unexpected(std::format("invalid value for --workers: {}", workers));
            }
            config.workers = static_cast<unsigned>(workers < 0 ? 0 : workers);
        } else if (arg == "--log-file") {
            status = assign(config.logFile);
        } else if (arg == "--ssh") {
            config.useSSH = true;
        } else if (arg == "--ssh-host") {
            status = assign(config.ssh.host);
        } else if (arg == "--ssh-port") {
            status = assignInt(config.ssh.port);
        } else if (arg == "--ssh-user") {
            status = assign(config.ssh.user);
        } else if (arg == "--ssh-password") {
            status = assign(config.ssh.password);
        } else if (arg == "--ssh-key") {
            status = assign(config.ssh.keyFile);
        } else if (arg == "--ssh-remote-path") {
            status = assign(config.ssh.remotePath);
        } else if (arg == "--strict-host-key") {
            config.ssh.strictHostKey = true;
        } else {
            status = std::unexpected(std::format("unknown argument: {}", arg));
        }
        if (!status) {
            return std::unexpected(status.error());
        }
    }
    return result;
}

std::string usage(const std::string& program) {
    return std::format(
        "Usage: {} [options]\n"
        "Back up the home directory into one archive and upload it.\n"
        "\n"
        "  --config <file>          JSON configuration file\n"
        "  -s, --source <dir>       directory to back up (default: home directory)\n"
        "  -d, --destination <id>   sync destination (e.g. \"gdrive:backup/home\")\n"
        "  --backup-path <file>     local archive path (default: temp directory)\n"
        "  -c, --compression <0-9>  compression level (default: 6)\n"
        "  -v, --verbose            verbose output\n"
        "  --preview                show what would be done and exit\n"
        "  --skip-errors            skip unreadable files (default)\n"
        "  --no-skip-errors         fail on the first unreadable file\n"
        "  --skip-upload            do not upload the archive\n"
        "  --keep-backup            keep the archive after uploading\n"
        "  --ignore-excludes        ignore exclude patterns and back up everything\n"
        "  --backup-only            create the archive only, skip all uploads\n"
        "  --workers <n>            archive worker threads (default: all processors)\n"
        "  --log-file <file>        append log lines to this file\n"
        "  --ssh                    upload over SFTP instead of the sync tool\n"
        "  --ssh-host <host>        SSH host\n"
        "  --ssh-port <port>        SSH port (default: 22)\n"
        "  --ssh-user <user>        SSH user (default: current user)\n"
        "  --ssh-password <pw>      SSH password (prefer a key file)\n"
        "  --ssh-key <file>         SSH private key file\n"
        "  --ssh-remote-path <dir>  remote base directory for backups\n"
        "  --strict-host-key        verify the server key against known_hosts\n"
        "  --version                print the version\n"
        "  -h, --help               print this help\n",
        program);
}
