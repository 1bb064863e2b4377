/**
 * @file archive_format.hpp
 * @brief Archive container formats for HomeVault.
 *
 * POSIX targets produce a tar stream compressed with multi-threaded gzip; the Windows
 * target produces a zip file whose entries are deflated individually. The format is
 * chosen once per run from the target platform.
 *
 * @note Requires libarchive and zlib.
 */

#ifndef ARCHIVE_FORMAT_HPP
#define ARCHIVE_FORMAT_HPP

#include <atomic>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include "file_system.hpp"
#include "parallel_gzip.hpp"
#include "platform.hpp"

struct archive;

constexpr int kDefaultCompressionLevel = 6;

/**
 * @brief Returns level if it lies in 0..9, otherwise kDefaultCompressionLevel.
 */
int clampCompressionLevel(int level);

/**
 * @brief Sequential writer for one archive file.
 *
 * Entries are written as writeHeader(), any number of writeData() calls, then
 * finishEntry(). The writer is not thread-safe; callers sharing it must hold a lock
 * for the whole header-plus-content sequence of an entry.
 */
class ArchiveWriter {
public:
    /**
     * @brief Takes ownership of a libarchive handle that is already open.
     *
     * @param handle Open libarchive write handle.
     * @param path Output file path, used in messages.
     * @param sink Compression stream the handle writes into, if any.
     */
    ArchiveWriter(struct archive* handle, std::string path, std::unique_ptr<ParallelGzipWriter> sink = nullptr);

    /**
     * @brief Frees the handle. An archive that was not closed is left incomplete.
     */
    ~ArchiveWriter();

    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    /**
     * @brief Writes the header of an entry.
     *
     * Records the relative path, type, mode bits, modification time, size of regular
     * files and target of symbolic links.
     */
    std::expected<void, std::string> writeHeader(const SourceEntry& entry);

    /**
     * @brief Appends content to the current entry.
     */
    std::expected<void, std::string> writeData(const char* data, std::size_t size);

    /**
     * @brief Completes the current entry. Content shorter than the size declared in
     * the header is padded with zero bytes.
     */
    std::expected<void, std::string> finishEntry();

    /**
     * @brief Finalizes the container and the compression stream.
     *
     * @return std::expected<void, std::string> Success or an error message; an error
     *         means the archive is unusable.
     */
    std::expected<void, std::string> close();

    /**
     * @brief Returns true once libarchive reported a fatal error; no further entry can
     *        be written.
     */
    bool broken() const { return broken_; }

    const std::string& path() const { return path_; }

private:
    std::string lastError() const;

    struct archive* handle;
    std::string path_;
    std::unique_ptr<ParallelGzipWriter> sink;
    std::atomic<bool> broken_{false};
    bool closed = false;
};

/**
 * @brief Interface for archive container formats.
 */
class ArchiveFormat {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~ArchiveFormat() = default;

    /**
     * @brief Human-readable format name.
     */
    virtual std::string name() const = 0;

    /**
     * @brief File name extension without leading dot ("tar.gz", "zip").
     */
    virtual std::string extension() const = 0;

    /**
     * @brief Creates the output file and returns a writer for it.
     *
     * @param path Output file path.
     * @param compressionLevel Level 0 to 9; out-of-range values use the default.
     * @param threads Compression threads where the format supports them; 0 uses every processor.
     * @return std::expected<std::unique_ptr<ArchiveWriter>, std::string> Writer or an error message.
     */
    virtual std::expected<std::unique_ptr<ArchiveWriter>, std::string> open(const std::string& path,
                                                                           int compressionLevel,
                                                                           unsigned threads) const = 0;
};

/**
 * @brief Tar (pax restricted) compressed with ParallelGzipWriter.
 */
class TarGzArchiveFormat : public ArchiveFormat {
public:
    std::string name() const override { return "tar.gz"; }
    std::string extension() const override { return "tar.gz"; }
    std::expected<std::unique_ptr<ArchiveWriter>, std::string> open(const std::string& path,
                                                                   int compressionLevel,
                                                                   unsigned threads) const override;
};

/**
 * @brief Zip with per-entry deflate compression.
 */
class ZipArchiveFormat : public ArchiveFormat {
public:
    std::string name() const override { return "zip"; }
    std::string extension() const override { return "zip"; }
    std::expected<std::unique_ptr<ArchiveWriter>, std::string> open(const std::string& path,
                                                                   int compressionLevel,
                                                                   unsigned threads) const override;
};

/**
 * @brief Returns the archive format used on the given platform.
 */
std::unique_ptr<ArchiveFormat> selectArchiveFormat(PlatformKind platform);

#endif // ARCHIVE_FORMAT_HPP
