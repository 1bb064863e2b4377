/**
 * @file test_support.hpp
 * @brief Shared fixtures for the HomeVault unit tests.
 *
 * Provides a capturing logger, a scratch directory that removes itself, filesystem
 * decorators that count or fail calls, and a libarchive based archive reader used to
 * inspect what the pipeline produced.
 */

#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <istream>
#include <iterator>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <thread>
#include <vector>
#include "file_system.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

/**
 * @brief Logger that keeps every line in memory.
 */
class MemoryLogger : public Logger {
public:
    void log(LogLevel level, std::string_view message) override {
        std::lock_guard<std::mutex> lock(mutex);
        lines.push_back({level, std::string(message)});
    }

    bool debugEnabled() const override { return true; }

    /**
     * @brief Returns true if any line at the given level contains text.
     */
    bool contains(LogLevel level, std::string_view text) const {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& [lineLevel, message] : lines) {
            if (lineLevel == level && message.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::size_t count(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (const auto& line : lines) {
            if (line.first == level) {
                ++n;
            }
        }
        return n;
    }

private:
    mutable std::mutex mutex;
    std::vector<std::pair<LogLevel, std::string>> lines;
};

/**
 * @brief Scratch directory under the system temp directory, removed on destruction.
 */
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        for (int attempt = 0; attempt < 16; ++attempt) {
            auto candidate = fs::temp_directory_path() / std::format("homevault-test-{:016x}", gen());
            if (fs::create_directory(candidate)) {
                root = candidate;
                return;
            }
        }
        throw std::runtime_error("Failed to create scratch directory");
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return root; }

    /**
     * @brief Writes a file below the scratch root, creating parent directories.
     */
    fs::path write(const std::string& relative, const std::string& content) const {
        auto target = root / relative;
        fs::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << content;
        return target;
    }

    fs::path mkdir(const std::string& relative) const {
        auto target = root / relative;
        fs::create_directories(target);
        return target;
    }

private:
    fs::path root;
};

/**
 * @brief Filesystem decorator that counts directory listings per path.
 */
class CountingFileSystem : public FileSystem {
public:
    std::expected<DirectoryListing, std::string> listDirectory(const std::string& path) override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            listed.push_back(fs::path(path).lexically_normal().string());
        }
        return local.listDirectory(path);
    }

    std::expected<SourceEntry, std::string> statEntry(const std::string& path) override {
        return local.statEntry(path);
    }

    std::expected<std::string, std::string> readSymlink(const std::string& path) override {
        return local.readSymlink(path);
    }

    std::expected<std::unique_ptr<std::istream>, std::string> openFile(const std::string& path) override {
        ++opened;
        return local.openFile(path);
    }

    /**
     * @brief Returns how many listed directories contain the given path component.
     */
    std::size_t listingsContaining(const std::string& component) const {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (const auto& path : listed) {
            for (const auto& part : fs::path(path)) {
                if (part == component) {
                    ++n;
                    break;
                }
            }
        }
        return n;
    }

    std::atomic<std::size_t> opened{0};

private:
    LocalFileSystem local;
    mutable std::mutex mutex;
    std::vector<std::string> listed;
};

/**
 * @brief Stream buffer serving fixed content, then failing like a disk read error.
 */
class TruncatedReadBuffer : public std::streambuf {
public:
    explicit TruncatedReadBuffer(std::string data) : data(std::move(data)) {
        setg(this->data.data(), this->data.data(), this->data.data() + this->data.size());
    }

protected:
    int_type underflow() override { throw std::ios_base::failure("Input/output error"); }

private:
    std::string data;
};

class TruncatedReadStream : public std::istream {
public:
    explicit TruncatedReadStream(std::string data) : std::istream(nullptr), buffer(std::move(data)) {
        rdbuf(&buffer);
    }

private:
    TruncatedReadBuffer buffer;
};

/**
 * @brief Filesystem decorator injecting failures for chosen file names.
 *
 * The constructor argument names files whose openFile fails. The public sets add
 * stat failures, listing failures, listings that stop after the first child, and
 * reads that fail once readLimit bytes were served.
 */
class FailingFileSystem : public FileSystem {
public:
    explicit FailingFileSystem(std::set<std::string> failingNames) : failingNames(std::move(failingNames)) {}

    std::expected<DirectoryListing, std::string> listDirectory(const std::string& path) override {
        std::string name = fs::path(path).filename().string();
        if (listFailures.contains(name)) {
            return std::unexpected(std::format("cannot list {}: Permission denied", path));
        }
        auto listing = local.listDirectory(path);
        if (listing && partialListings.contains(name) && listing->names.size() > 1) {
            listing->names.resize(1);
            listing->error = std::format("cannot list {}: Input/output error", path);
        }
        return listing;
    }

    std::expected<SourceEntry, std::string> statEntry(const std::string& path) override {
        if (statFailures.contains(fs::path(path).filename().string())) {
            return std::unexpected(std::format("cannot stat {}: Permission denied", path));
        }
        return local.statEntry(path);
    }

    std::expected<std::string, std::string> readSymlink(const std::string& path) override {
        return local.readSymlink(path);
    }

    std::expected<std::unique_ptr<std::istream>, std::string> openFile(const std::string& path) override {
        if (openDelay.count() > 0) {
            std::this_thread::sleep_for(openDelay);
        }
        std::string name = fs::path(path).filename().string();
        if (failingNames.contains(name)) {
            return std::unexpected(std::format("Failed to open file: {} (error: Permission denied)", path));
        }
        if (truncatedReads.contains(name)) {
            std::ifstream in(path, std::ios::binary);
            std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            content.resize(std::min(content.size(), readLimit));
            return std::unique_ptr<std::istream>(std::make_unique<TruncatedReadStream>(std::move(content)));
        }
        return local.openFile(path);
    }

    std::set<std::string> statFailures;
    std::set<std::string> listFailures;
    std::set<std::string> partialListings;
    std::set<std::string> truncatedReads;
    std::size_t readLimit = 32 * 1024;
    std::chrono::milliseconds openDelay{0};

private:
    std::set<std::string> failingNames;
    LocalFileSystem local;
};

/**
 * @brief One entry read back from an archive.
 */
struct ArchivedEntry {
    EntryType type = EntryType::Other;
    std::string content;
    std::string linkTarget;
    unsigned mode = 0;
    std::int64_t mtimeSeconds = 0;
};

/**
 * @brief Reads an archive of any supported format into a path-keyed map.
 *
 * Directory names are stored without a trailing slash.
 */
inline std::map<std::string, ArchivedEntry> readArchive(const fs::path& file) {
    std::map<std::string, ArchivedEntry> entries;
    struct archive* a = archive_read_new();
    archive_read_support_filter_all(a);
    archive_read_support_format_all(a);
    if (archive_read_open_filename(a, file.string().c_str(), 10240) != ARCHIVE_OK) {
        std::string message = archive_error_string(a) ? archive_error_string(a) : "unknown error";
        archive_read_free(a);
        throw std::runtime_error(std::format("Failed to open archive {}: {}", file.string(), message));
    }

    struct archive_entry* entry = nullptr;
    int status = ARCHIVE_OK;
    while ((status = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        std::string name = archive_entry_pathname(entry);
        while (!name.empty() && name.back() == '/') {
            name.pop_back();
        }
        ArchivedEntry archived;
        switch (archive_entry_filetype(entry)) {
        case AE_IFREG:
            archived.type = EntryType::RegularFile;
            break;
        case AE_IFDIR:
            archived.type = EntryType::Directory;
            break;
        case AE_IFLNK:
            archived.type = EntryType::Symlink;
            archived.linkTarget = archive_entry_symlink(entry) ? archive_entry_symlink(entry) : "";
            break;
        default:
            break;
        }
        archived.mode = static_cast<unsigned>(archive_entry_perm(entry));
        archived.mtimeSeconds = static_cast<std::int64_t>(archive_entry_mtime(entry));

        char buffer[8192];
        la_ssize_t n = 0;
        while ((n = archive_read_data(a, buffer, sizeof(buffer))) > 0) {
            archived.content.append(buffer, static_cast<std::size_t>(n));
        }
        if (n < 0) {
            std::string message = archive_error_string(a) ? archive_error_string(a) : "unknown error";
            archive_read_free(a);
            throw std::runtime_error(std::format("Failed to read {} from archive: {}", name, message));
        }
        entries[name] = std::move(archived);
    }
    bool clean = status == ARCHIVE_EOF;
    std::string message = clean || !archive_error_string(a) ? "" : archive_error_string(a);
    archive_read_free(a);
    if (!clean) {
        throw std::runtime_error(std::format("Archive {} is truncated or corrupt: {}", file.string(), message));
    }
    return entries;
}

/**
 * @brief Returns a deterministic pseudo-random payload of the given size.
 */
inline std::string makePayload(std::size_t size, unsigned seed) {
    std::mt19937 gen(seed);
    std::string data(size, '\0');
    for (auto& c : data) {
        c = static_cast<char>('a' + gen() % 26);
    }
    return data;
}

#endif // TEST_SUPPORT_HPP
