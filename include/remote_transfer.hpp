/**
 * @file remote_transfer.hpp
 * @brief Defines remote transfer strategies for HomeVault.
 *
 * A finished archive is copied to its destination either by an external sync tool
 * (rclone by default) that receives the bytes on its standard input, or over SFTP.
 * Both strategies stream the file through a ProgressReader.
 *
 * @note Requires libssh for SFTP transfers. Install via vcpkg on Windows, Homebrew on
 * macOS, or apt on Linux.
 */

#ifndef REMOTE_TRANSFER_HPP
#define REMOTE_TRANSFER_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <expected>
#include <string>
#include <utility>
#include "logger.hpp"

/**
 * @brief Interface for remote transfer strategies.
 *
 * Defines the contract for transferring backup files to remote destinations.
 */
class RemoteTransferStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~RemoteTransferStrategy() = default;

    /**
     * @brief Transfers a local file to the configured destination.
     *
     * No retry is performed and a failed transfer may leave a partial file remotely.
     *
     * @param localFile Path to the closed archive.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> transfer(const std::string& localFile) = 0;

    /**
     * @brief Describes the destination for log and preview output.
     */
    virtual std::string describe() const = 0;
};

/**
 * @brief Settings of the sync-tool strategy.
 */
struct SyncConfig {
    std::string destination; ///< Remote identifier, e.g. "gdrive:backup/home".
    std::string command = "rclone rcat {dest}"; ///< Command reading the file from stdin; {dest} is replaced.
};

/**
 * @brief Transfer through an external sync tool.
 *
 * The archive is piped into the configured command. The destination file is the
 * destination identifier joined with the archive's file name.
 */
class SyncTransferStrategy : public RemoteTransferStrategy {
public:
    SyncTransferStrategy(SyncConfig config, Logger& logger);

    std::expected<void, std::string> transfer(const std::string& localFile) override;
    std::string describe() const override;

    /**
     * @brief Joins a destination identifier and a file name ("remote:" + "a.tar.gz").
     */
    static std::string remoteTarget(const std::string& destination, const std::string& fileName);

    /**
     * @brief Builds the shell command for a target, quoting the target.
     */
    std::string buildCommand(const std::string& target) const;

private:
    SyncConfig config;
    Logger& logger;
};

/**
 * @brief Settings of the SFTP strategy.
 */
struct SFTPConfig {
    std::string host;            ///< SFTP host address.
    int port = 22;               ///< SFTP port.
    std::string user;            ///< Remote user name.
    std::string password;        ///< Password; used when no key file is given.
    std::string keyFile;         ///< Private key file; takes precedence over the password.
    std::string remotePath;      ///< Remote base directory for backups.
    bool strictHostKey = false;  ///< Verify the server key against known_hosts.
    std::chrono::seconds timeout = std::chrono::seconds(30); ///< Connect timeout.
};

/**
 * @brief Bounded FIFO of in-flight write requests.
 *
 * submit() starts a request; when `limit` requests are already pending it first waits
 * for the oldest one. Requests complete in submission order. After a failed wait the
 * remaining requests are dropped by the destructor without being waited for.
 *
 * @tparam Request Handle of one started request.
 * @tparam Wait Callable `std::expected<void, std::string>(Request&)` completing a request.
 */
template <typename Request, typename Wait>
class RequestWindow {
public:
    RequestWindow(std::size_t limit, Wait wait) : limit(limit > 0 ? limit : 1), wait(std::move(wait)) {}

    /**
     * @brief Starts one request.
     *
     * @param begin Callable returning `std::expected<Request, std::string>`.
     * @return std::expected<void, std::string> Success or the first error from a wait or from begin.
     */
    template <typename Begin>
    std::expected<void, std::string> submit(Begin&& begin) {
        if (pending.size() >= limit) {
            auto done = completeOldest();
            if (!done) {
                return done;
            }
        }
        auto request = begin();
        if (!request) {
            return std::unexpected(request.error());
        }
        pending.push_back(std::move(*request));
        return {};
    }

    /**
     * @brief Waits for every pending request.
     */
    std::expected<void, std::string> drain() {
        while (!pending.empty()) {
            auto done = completeOldest();
            if (!done) {
                return done;
            }
        }
        return {};
    }

    std::size_t inFlight() const { return pending.size(); }

private:
    std::expected<void, std::string> completeOldest() {
        Request request = std::move(pending.front());
        pending.pop_front();
        return wait(request);
    }

    std::size_t limit;
    Wait wait;
    std::deque<Request> pending;
};

/**
 * @brief SFTP remote transfer strategy.
 *
 * Uploads into <remotePath>/<hostname>/Users/<YYYY-MM-DD>/, creating the directories
 * as needed. Authentication tries the key file, then the password, then the default
 * keys in ~/.ssh. Up to kMaxRequestsInFlight writes of kPacketSize bytes are kept
 * outstanding on the connection.
 *
 * @note Requires libssh 0.11 or newer for asynchronous SFTP writes.
 */
class SFTPTransferStrategy : public RemoteTransferStrategy {
public:
    static constexpr std::size_t kPacketSize = 32 * 1024;
    static constexpr std::size_t kMaxRequestsInFlight = 32;

    SFTPTransferStrategy(SFTPConfig config, Logger& logger);

    std::expected<void, std::string> transfer(const std::string& localFile) override;
    std::string describe() const override;

    /**
     * @brief Returns the dated remote directory for the given host and day.
     *
     * @param remoteBase Remote base directory.
     * @param host Local host name.
     * @param date Day in YYYY-MM-DD form.
     */
    static std::string remoteDirectory(const std::string& remoteBase, const std::string& host, const std::string& date);

    /**
     * @brief Returns today's date as YYYY-MM-DD in local time.
     */
    static std::string currentDate();

private:
    SFTPConfig config;
    Logger& logger;
};

#endif // REMOTE_TRANSFER_HPP
