/**
 * @file platform.hpp
 * @brief Host environment queries for HomeVault.
 *
 * Wraps the few platform-specific lookups the backup needs: who the user is, where
 * their home directory lives, the machine's host name and the temporary directory.
 */

#ifndef PLATFORM_HPP
#define PLATFORM_HPP

#include <expected>
#include <string>

/**
 * @brief Target operating system families with distinct backup conventions.
 */
enum class PlatformKind {
    Linux,
    MacOS,
    Windows
};

/**
 * @brief Returns the platform this binary was built for.
 */
PlatformKind currentPlatform();

/**
 * @brief Resolves the current user name.
 *
 * Reads USER (USERNAME on Windows), then falls back to the account database and
 * finally to the last component of the home directory.
 *
 * @return std::expected<std::string, std::string> User name or an error message.
 */
std::expected<std::string, std::string> currentUsername();

/**
 * @brief Resolves the current user's home directory.
 *
 * @return std::expected<std::string, std::string> Home directory or an error message.
 */
std::expected<std::string, std::string> homeDirectory();

/**
 * @brief Returns the local host name, or "localhost" if it cannot be determined.
 */
std::string hostName();

/**
 * @brief Returns the system temporary directory.
 */
std::string tempDirectory();

#endif // PLATFORM_HPP
