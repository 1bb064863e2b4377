/**
 * @file file_system.hpp
 * @brief Filesystem access used by the archive pipeline.
 *
 * The tree walker reaches the disk only through the FileSystem interface so that
 * traversal can be observed or made to fail in tests.
 */

#ifndef FILE_SYSTEM_HPP
#define FILE_SYSTEM_HPP

#include <cstdint>
#include <expected>
#include <istream>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Kind of filesystem node.
 */
enum class EntryType {
    RegularFile,
    Directory,
    Symlink,
    Other
};

/**
 * @brief One filesystem node found during traversal.
 */
struct SourceEntry {
    std::string absolutePath;        ///< Path on the local disk.
    std::string relativePath;        ///< Path below the backup root, '/' separated.
    EntryType type = EntryType::Other; ///< Node kind (symlinks are not followed).
    std::uint64_t size = 0;          ///< Size in bytes for regular files.
    unsigned int mode = 0;           ///< Permission bits (e.g. 0644).
    std::int64_t mtimeSeconds = 0;   ///< Modification time, seconds since the epoch.
    long mtimeNanoseconds = 0;       ///< Sub-second part of the modification time.
    std::string linkTarget;          ///< Target of a symbolic link.
};

/**
 * @brief Children of one directory.
 */
struct DirectoryListing {
    std::vector<std::string> names; ///< Child names in enumeration order.
    std::string error;              ///< Set if enumeration stopped early; names holds what was read before.
};

/**
 * @brief Interface for the filesystem operations the walker performs.
 */
class FileSystem {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~FileSystem() = default;

    /**
     * @brief Lists the names of a directory's children in enumeration order.
     *
     * A failure part way through still yields the names read so far, with
     * DirectoryListing::error describing the failure.
     *
     * @param path Directory to list.
     * @return std::expected<DirectoryListing, std::string> The listing, or an error message if
     *         the directory cannot be opened.
     */
    virtual std::expected<DirectoryListing, std::string> listDirectory(const std::string& path) = 0;

    /**
     * @brief Reads metadata of a node without following symbolic links.
     *
     * The relativePath and linkTarget fields are left empty.
     */
    virtual std::expected<SourceEntry, std::string> statEntry(const std::string& path) = 0;

    /**
     * @brief Reads the target of a symbolic link.
     */
    virtual std::expected<std::string, std::string> readSymlink(const std::string& path) = 0;

    /**
     * @brief Opens a regular file for binary reading.
     */
    virtual std::expected<std::unique_ptr<std::istream>, std::string> openFile(const std::string& path) = 0;
};

/**
 * @brief FileSystem backed by the local disk.
 */
class LocalFileSystem : public FileSystem {
public:
    std::expected<DirectoryListing, std::string> listDirectory(const std::string& path) override;
    std::expected<SourceEntry, std::string> statEntry(const std::string& path) override;
    std::expected<std::string, std::string> readSymlink(const std::string& path) override;
    std::expected<std::unique_ptr<std::istream>, std::string> openFile(const std::string& path) override;
};

#endif // FILE_SYSTEM_HPP
