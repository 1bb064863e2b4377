#include "remote_transfer.hpp"
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <system_error>
#include <type_traits>
#include <vector>
#include <fcntl.h>
#ifndef _WIN32
#include <sys/wait.h>
#endif
#include "platform.hpp"
#include "progress_reader.hpp"

namespace fs = std::filesystem;

namespace {

constexpr double kMegabyte = 1024.0 * 1024.0;

std::string shellQuote(const std::string& value) {
#ifdef _WIN32
    return std::format("\"{}\"", value);
#else
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
#endif
}

struct SessionDeleter {
    void operator()(ssh_session session) const {
        ssh_disconnect(session);
        ssh_free(session);
    }
};

struct SftpDeleter {
    void operator()(sftp_session sftp) const { sftp_free(sftp); }
};

struct SftpFileDeleter {
    void operator()(sftp_file file) const { sftp_close(file); }
};

struct AioDeleter {
    void operator()(sftp_aio aio) const { sftp_aio_free(aio); }
};

struct KeyDeleter {
    void operator()(ssh_key key) const { ssh_key_free(key); }
};

using SessionPtr = std::unique_ptr<std::remove_pointer_t<ssh_session>, SessionDeleter>;
using SftpPtr = std::unique_ptr<std::remove_pointer_t<sftp_session>, SftpDeleter>;
using SftpFilePtr = std::unique_ptr<std::remove_pointer_t<sftp_file>, SftpFileDeleter>;
using AioPtr = std::unique_ptr<std::remove_pointer_t<sftp_aio>, AioDeleter>;
using KeyPtr = std::unique_ptr<std::remove_pointer_t<ssh_key>, KeyDeleter>;

/**
 * @brief Authenticates with one private key file.
 */
std::expected<void, std::string> authenticateWithKeyFile(ssh_session session, const std::string& keyFile) {
    ssh_key rawKey = nullptr;
    if (ssh_pki_import_privkey_file(keyFile.c_str(), nullptr, nullptr, nullptr, &rawKey) != SSH_OK) {
        return std::unexpected(std::format("failed to read SSH key file: {}", keyFile));
    }
    KeyPtr key(rawKey);
    if (ssh_userauth_publickey(session, nullptr, key.get()) != SSH_AUTH_SUCCESS) {
        return std::unexpected(std::format("SSH key {} was rejected: {}", keyFile, ssh_get_error(session)));
    }
    return {};
}

/**
 * @brief Tries key file, password, then the default key locations, in that order.
 */
std::expected<void, std::string> authenticate(ssh_session session, const SFTPConfig& config, Logger& logger) {
    if (!config.keyFile.empty()) {
        logger.debug("Using SSH key from: {}", config.keyFile);
        auto result = authenticateWithKeyFile(session, config.keyFile);
        if (!result) {
            return std::unexpected(std::format("SSH authentication failed: {}", result.error()));
        }
        return {};
    }

    if (!config.password.empty()) {
        logger.debug("Using password authentication");
        if (ssh_userauth_password(session, nullptr, config.password.c_str()) != SSH_AUTH_SUCCESS) {
            return std::unexpected(std::format("SSH password authentication failed: {}", ssh_get_error(session)));
        }
        return {};
    }

    logger.debug("Checking for SSH keys in default locations");
    auto home = homeDirectory();
    if (!home) {
        return std::unexpected(std::format("SSH authentication failed: {}", home.error()));
    }
    for (const char* name : {"id_ed25519", "id_rsa", "id_ecdsa"}) {
        auto keyPath = (fs::path(*home) / ".ssh" / name).string();
        std::error_code ec;
        if (!fs::exists(keyPath, ec)) {
            continue;
        }
        auto result = authenticateWithKeyFile(session, keyPath);
        if (result) {
            logger.debug("Using SSH key: {}", keyPath);
            return {};
        }
        logger.debug("Skipping SSH key: {}", result.error());
    }
    return std::unexpected("SSH authentication failed: no usable SSH keys found in default locations");
}

std::expected<void, std::string> verifyHostKey(ssh_session session, const SFTPConfig& config, Logger& logger) {
    if (!config.strictHostKey) {
        logger.warn("Host key verification is disabled for {}", config.host);
        return {};
    }
    switch (ssh_session_is_known_server(session)) {
    case SSH_KNOWN_HOSTS_OK:
        return {};
    case SSH_KNOWN_HOSTS_CHANGED:
        return std::unexpected(std::format("host key for {} has changed", config.host));
    case SSH_KNOWN_HOSTS_OTHER:
        return std::unexpected(std::format("host key type for {} has changed", config.host));
    case SSH_KNOWN_HOSTS_NOT_FOUND:
    case SSH_KNOWN_HOSTS_UNKNOWN:
        return std::unexpected(std::format("host {} is not in known_hosts", config.host));
    case SSH_KNOWN_HOSTS_ERROR:
        break;
    }
    return std::unexpected(std::format("failed to verify host key: {}", ssh_get_error(session)));
}

/**
 * @brief Creates every missing component of an absolute or relative remote path.
 */
std::expected<void, std::string> makeRemoteDirectories(sftp_session sftp, const std::string& path) {
    std::string current;
    if (!path.empty() && path.front() == '/') {
        current = "/";
    }
    size_t start = 0;
    while (start < path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (end > start) {
            if (!current.empty() && current.back() != '/') {
                current += '/';
            }
            current += path.substr(start, end - start);

            if (sftp_mkdir(sftp, current.c_str(), 0755) != 0 && sftp_get_error(sftp) != SSH_FX_FILE_ALREADY_EXISTS) {
                // Many servers answer a plain failure for existing directories.
                sftp_attributes attributes = sftp_stat(sftp, current.c_str());
                bool isDirectory = attributes && attributes->type == SSH_FILEXFER_TYPE_DIRECTORY;
                if (attributes) {
                    sftp_attributes_free(attributes);
                }
                if (!isDirectory) {
                    return std::unexpected(std::format("failed to create remote directory: {} (sftp error {})",
                                                       current, sftp_get_error(sftp)));
                }
            }
        }
        start = end + 1;
    }
    return {};
}

} // namespace

SyncTransferStrategy::SyncTransferStrategy(SyncConfig config, Logger& logger)
    : config(std::move(config)), logger(logger) {}

std::string SyncTransferStrategy::remoteTarget(const std::string& destination, const std::string& fileName) {
    if (destination.empty()) {
        return fileName;
    }
    char last = destination.back();
    if (last == ':' || last == '/') {
        return destination + fileName;
    }
    return destination + "/" + fileName;
}

std::string SyncTransferStrategy::buildCommand(const std::string& target) const {
    static constexpr std::string_view placeholder = "{dest}";
    std::string command = config.command;
    std::string quoted = shellQuote(target);
    size_t pos = command.find(placeholder);
    if (pos == std::string::npos) {
        return command + " " + quoted;
    }
    while (pos != std::string::npos) {
        command.replace(pos, placeholder.size(), quoted);
        pos = command.find(placeholder, pos + quoted.size());
    }
    return command;
}

std::string SyncTransferStrategy::describe() const {
    return config.destination;
}

std::expected<void, std::string> SyncTransferStrategy::transfer(const std::string& localFile) {
    auto startTime = std::chrono::steady_clock::now();
    std::error_code ec;
    auto fileSize = fs::file_size(localFile, ec);
    if (ec) {
        return std::unexpected(std::format("failed to get file info: {} ({})", localFile, ec.message()));
    }
    std::ifstream input(localFile, std::ios::binary);
    if (!input) {
        return std::unexpected(std::format("failed to open local file: {} (error: {})", localFile, std::generic_category().message(errno)));
    }

    std::string target = remoteTarget(config.destination, fs::path(localFile).filename().string());
    std::string command = buildCommand(target);
    logger.info("Uploading backup to: {}", target);
    logger.debug("Running: {}", command);

#ifdef _WIN32
    FILE* pipe = _popen(command.c_str(), "wb");
#else
    FILE* pipe = popen(command.c_str(), "w");
#endif
    if (!pipe) {
        return std::unexpected(std::format("failed to start sync command: {} (error: {})", command, std::generic_category().message(errno)));
    }

    ProgressReader reader(input, fileSize, logger, "Upload");
    std::vector<char> buffer(64 * 1024);
    std::string streamError;
    while (std::size_t n = reader.read(buffer.data(), buffer.size())) {
        if (std::fwrite(buffer.data(), 1, n, pipe) != n) {
            streamError = std::format("failed to stream archive to sync command (error: {})", std::generic_category().message(errno));
            break;
        }
    }
    if (streamError.empty() && reader.bad()) {
        streamError = std::format("failed to read local file: {}", localFile);
    }

#ifdef _WIN32
    int status = _pclose(pipe);
    bool succeeded = status == 0;
    int exitCode = status;
#else
    int status = pclose(pipe);
    bool succeeded = status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
    int exitCode = status != -1 && WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#endif
    if (!succeeded) {
        return std::unexpected(std::format("sync copy failed with status {}", exitCode));
    }
    if (!streamError.empty()) {
        return std::unexpected(streamError);
    }

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    double sizeMB = static_cast<double>(fileSize) / kMegabyte;
    logger.info("Upload completed: {:.2f} MB transferred ({:.2f} MB/s)", sizeMB, elapsed > 0 ? sizeMB / elapsed : 0.0);
    return {};
}

SFTPTransferStrategy::SFTPTransferStrategy(SFTPConfig config, Logger& logger)
    : config(std::move(config)), logger(logger) {}

std::string SFTPTransferStrategy::describe() const {
    return std::format("{}@{}:{}", config.user, config.host, config.remotePath);
}

std::string SFTPTransferStrategy::remoteDirectory(const std::string& remoteBase,
                                                  const std::string& host,
                                                  const std::string& date) {
    std::string base = remoteBase;
    while (base.size() > 1 && base.back() == '/') {
        base.pop_back();
    }
    std::string suffix = std::format("{}/Users/{}", host, date);
    if (base.empty()) {
        return suffix;
    }
    if (base == "/") {
        return "/" + suffix;
    }
    return base + "/" + suffix;
}

std::string SFTPTransferStrategy::currentDate() {
    auto timeT = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &timeT);
#else
    localtime_r(&timeT, &tm);
#endif
    char dateBuf[16];
    std::strftime(dateBuf, sizeof(dateBuf), "%Y-%m-%d", &tm);
    return dateBuf;
}

std::expected<void, std::string> SFTPTransferStrategy::transfer(const std::string& localFile) {
    logger.info("Starting SSH upload to {}@{}:{}", config.user, config.host, config.port);
    auto startTime = std::chrono::steady_clock::now();

    std::error_code ec;
    auto fileSize = fs::file_size(localFile, ec);
    if (ec) {
        return std::unexpected(std::format("failed to stat local file: {} ({})", localFile, ec.message()));
    }
    std::ifstream input(localFile, std::ios::binary);
    if (!input) {
        return std::unexpected(std::format("failed to open local file: {} (error: {})", localFile, std::generic_category().message(errno)));
    }

    SessionPtr session(ssh_new());
    if (!session) {
        return std::unexpected("Failed to create SSH session");
    }
    long timeout = static_cast<long>(config.timeout.count());
    if (ssh_options_set(session.get(), SSH_OPTIONS_HOST, config.host.c_str()) < 0 ||
        ssh_options_set(session.get(), SSH_OPTIONS_PORT, &config.port) < 0 ||
        ssh_options_set(session.get(), SSH_OPTIONS_TIMEOUT, &timeout) < 0 ||
        (!config.user.empty() && ssh_options_set(session.get(), SSH_OPTIONS_USER, config.user.c_str()) < 0)) {
        return std::unexpected(std::format("invalid SSH options: {}", ssh_get_error(session.get())));
    }

    if (ssh_connect(session.get()) != SSH_OK) {
        return std::unexpected(std::format("failed to connect to SSH server {}:{}: {}",
                                           config.host, config.port, ssh_get_error(session.get())));
    }

    auto verified = verifyHostKey(session.get(), config, logger);
    if (!verified) {
        return std::unexpected(verified.error());
    }

    auto authenticated = authenticate(session.get(), config, logger);
    if (!authenticated) {
        return std::unexpected(authenticated.error());
    }

    SftpPtr sftp(sftp_new(session.get()));
    if (!sftp || sftp_init(sftp.get()) != SSH_OK) {
        return std::unexpected(std::format("SFTP initialization failed: {}", ssh_get_error(session.get())));
    }

    std::string remoteDir = remoteDirectory(config.remotePath, hostName(), currentDate());
    logger.debug("Creating remote directory: {}", remoteDir);
    auto created = makeRemoteDirectories(sftp.get(), remoteDir);
    if (!created) {
        return std::unexpected(created.error());
    }

    std::string remoteFile = remoteDir + "/" + fs::path(localFile).filename().string();
    logger.info("Uploading to: {}", remoteFile);
    SftpFilePtr file(sftp_open(sftp.get(), remoteFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
    if (!file) {
        return std::unexpected(std::format("failed to create remote file: {} ({})",
                                           remoteFile, ssh_get_error(session.get())));
    }

    // Each request carries its own copy of the packet, so one buffer is reused.
    auto completeWrite = [&](std::pair<AioPtr, std::size_t>& request) -> std::expected<void, std::string> {
        sftp_aio aio = request.first.release();
        ssize_t written = sftp_aio_wait_write(&aio);
        if (written < 0 || static_cast<std::size_t>(written) != request.second) {
            return std::unexpected(std::format("failed to copy file: write to {} failed ({})",
                                               remoteFile, ssh_get_error(session.get())));
        }
        return {};
    };
    RequestWindow<std::pair<AioPtr, std::size_t>, decltype(completeWrite)> window(kMaxRequestsInFlight,
                                                                                   completeWrite);

    ProgressReader reader(input, fileSize, logger, "Upload");
    std::vector<char> buffer(kPacketSize);
    while (std::size_t n = reader.read(buffer.data(), buffer.size())) {
        auto submitted = window.submit([&]() -> std::expected<std::pair<AioPtr, std::size_t>, std::string> {
            sftp_aio aio = nullptr;
            if (sftp_aio_begin_write(file.get(), buffer.data(), n, &aio) == SSH_ERROR) {
                return std::unexpected(std::format("failed to copy file: write to {} failed ({})",
                                                   remoteFile, ssh_get_error(session.get())));
            }
            return std::pair<AioPtr, std::size_t>(AioPtr(aio), n);
        });
        if (!submitted) {
            return std::unexpected(submitted.error());
        }
    }
    if (auto drained = window.drain(); !drained) {
        return std::unexpected(drained.error());
    }
    if (reader.bad()) {
        return std::unexpected(std::format("failed to copy file: cannot read {}", localFile));
    }

    if (sftp_close(file.release()) != SSH_NO_ERROR) {
        return std::unexpected(std::format("failed to close remote file: {} ({})",
                                           remoteFile, ssh_get_error(session.get())));
    }

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    double sizeMB = static_cast<double>(fileSize) / kMegabyte;
    logger.info("SSH upload completed: {:.2f} MB transferred ({:.2f} MB/s)", sizeMB, elapsed > 0 ? sizeMB / elapsed : 0.0);
    logger.info("Remote file: {}", remoteFile);
    return {};
}
