#include "platform.hpp"
#include <cstdlib>
#include <filesystem>
#include <format>
#include <system_error>
#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#else
#include <windows.h>
#endif

namespace fs = std::filesystem;

PlatformKind currentPlatform() {
#ifdef _WIN32
    return PlatformKind::Windows;
#elif __APPLE__
    return PlatformKind::MacOS;
#else
    return PlatformKind::Linux;
#endif
}

std::expected<std::string, std::string> homeDirectory() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (home && *home) {
        return std::string(home);
    }
#ifndef _WIN32
    struct passwd* pwd = getpwuid(geteuid());
    if (pwd && pwd->pw_dir) {
        return std::string(pwd->pw_dir);
    }
#endif
    return std::unexpected("could not determine home directory");
}

std::expected<std::string, std::string> currentUsername() {
#ifdef _WIN32
    const char* user = std::getenv("USERNAME");
#else
    const char* user = std::getenv("USER");
#endif
    if (user && *user) {
        return std::string(user);
    }
#ifndef _WIN32
    struct passwd* pwd = getpwuid(geteuid());
    if (pwd && pwd->pw_name) {
        return std::string(pwd->pw_name);
    }
#endif
    auto home = homeDirectory();
    if (!home) {
        return std::unexpected(std::format("failed to get username: {}", home.error()));
    }
    auto name = fs::path(*home).filename().string();
    if (name.empty()) {
        return std::unexpected("failed to get username: home directory has no name");
    }
    return name;
}

std::string hostName() {
#ifdef _WIN32
    char buf[MAX_COMPUTERNAME_LENGTH + 1];
    DWORD size = sizeof(buf);
    if (GetComputerNameA(buf, &size)) {
        return std::string(buf, size);
    }
#else
    char buf[256];
    if (gethostname(buf, sizeof(buf)) == 0) {
        buf[sizeof(buf) - 1] = '\0';
        return buf;
    }
#endif
    return "localhost";
}

std::string tempDirectory() {
    std::error_code ec;
    auto dir = fs::temp_directory_path(ec);
    if (ec) {
        return ".";
    }
    return dir.string();
}
