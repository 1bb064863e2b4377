#include "file_system.hpp"
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <system_error>
#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace fs = std::filesystem;

std::expected<DirectoryListing, std::string> LocalFileSystem::listDirectory(const std::string& path) {
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        return std::unexpected(std::format("cannot list {}: {}", path, ec.message()));
    }

    DirectoryListing listing;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        listing.names.push_back(it->path().filename().string());
    }
    if (ec) {
        listing.error = std::format("cannot list {}: {}", path, ec.message());
    }
    return listing;
}

std::expected<SourceEntry, std::string> LocalFileSystem::statEntry(const std::string& path) {
    SourceEntry entry;
    entry.absolutePath = path;

#ifndef _WIN32
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0) {
        return std::unexpected(std::format("cannot stat {}: {}", path, std::generic_category().message(errno)));
    }
    if (S_ISREG(st.st_mode)) {
        entry.type = EntryType::RegularFile;
    } else if (S_ISDIR(st.st_mode)) {
        entry.type = EntryType::Directory;
    } else if (S_ISLNK(st.st_mode)) {
        entry.type = EntryType::Symlink;
    } else {
        entry.type = EntryType::Other;
    }
    entry.size = entry.type == EntryType::RegularFile ? static_cast<std::uint64_t>(st.st_size) : 0;
    entry.mode = static_cast<unsigned int>(st.st_mode & 07777);
    entry.mtimeSeconds = static_cast<std::int64_t>(st.st_mtime);
#ifdef __APPLE__
    entry.mtimeNanoseconds = st.st_mtimespec.tv_nsec;
#else
    entry.mtimeNanoseconds = st.st_mtim.tv_nsec;
#endif
#else
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec) {
        return std::unexpected(std::format("cannot stat {}: {}", path, ec.message()));
    }
    switch (status.type()) {
    case fs::file_type::regular:
        entry.type = EntryType::RegularFile;
        break;
    case fs::file_type::directory:
        entry.type = EntryType::Directory;
        break;
    case fs::file_type::symlink:
        entry.type = EntryType::Symlink;
        break;
    default:
        entry.type = EntryType::Other;
        break;
    }
    if (entry.type == EntryType::RegularFile) {
        entry.size = fs::file_size(path, ec);
        if (ec) {
            return std::unexpected(std::format("cannot stat {}: {}", path, ec.message()));
        }
    }
    entry.mode = static_cast<unsigned int>(status.permissions()) & 07777;
    auto lastWrite = fs::last_write_time(path, ec);
    if (!ec) {
        auto sys = std::chrono::clock_cast<std::chrono::system_clock>(lastWrite);
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(sys.time_since_epoch()).count();
        entry.mtimeSeconds = ns / 1000000000;
        entry.mtimeNanoseconds = static_cast<long>(ns % 1000000000);
    }
#endif
    return entry;
}

std::expected<std::string, std::string> LocalFileSystem::readSymlink(const std::string& path) {
    std::error_code ec;
    auto target = fs::read_symlink(path, ec);
    if (ec) {
        return std::unexpected(std::format("cannot read symlink {}: {}", path, ec.message()));
    }
    return target.string();
}

std::expected<std::unique_ptr<std::istream>, std::string> LocalFileSystem::openFile(const std::string& path) {
    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!file->is_open()) {
        int error = errno;
        return std::unexpected(std::format("Failed to open file: {} (error: {})", path, std::generic_category().message(error)));
    }
    return std::unique_ptr<std::istream>(std::move(file));
}
