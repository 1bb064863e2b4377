/**
 * @file file_backup.hpp
 * @brief Archive creation pipeline for HomeVault.
 *
 * A single traversal thread walks the source tree depth-first, consults the exclusion
 * matcher and feeds regular files into a bounded queue. A pool of worker threads reads
 * the files and writes them into one shared archive writer, holding a lock for the
 * header and content of each entry. Directory and symlink entries are written by the
 * traversal thread as they are discovered.
 *
 * @note Requires libarchive and zlib (through ArchiveFormat).
 */

#ifndef FILE_BACKUP_HPP
#define FILE_BACKUP_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include "archive_format.hpp"
#include "exclusion_rules.hpp"
#include "file_system.hpp"
#include "logger.hpp"

/**
 * @brief Tuning and error policy of one archive run.
 */
struct ArchiveOptions {
    int compressionLevel = kDefaultCompressionLevel; ///< 0 to 9, out-of-range values use the default.
    unsigned workers = 0;            ///< File worker threads; 0 uses every processor.
    unsigned compressionThreads = 0; ///< Compression threads; 0 uses every processor.
    bool skipOnError = true;         ///< Log and skip unreadable files instead of failing.
    std::chrono::milliseconds progressInterval = std::chrono::seconds(5); ///< Archive size report period.
};

/**
 * @brief Counters describing a finished archive run.
 */
struct ArchiveStats {
    std::uint64_t files = 0;       ///< Regular files written.
    std::uint64_t directories = 0; ///< Directory entries written.
    std::uint64_t symlinks = 0;    ///< Symbolic link entries written.
    std::uint64_t excluded = 0;    ///< Entries matched by an exclusion pattern (subtrees count once).
    std::uint64_t skipped = 0;     ///< Entries left out because of an error or unsupported type.
    std::uint64_t bytesRead = 0;   ///< Content bytes copied into the archive.
    std::uint64_t archiveSize = 0; ///< Size of the closed archive file.
    double elapsedSeconds = 0;     ///< Wall-clock duration of the run.
};

/**
 * @brief Builds one archive from a source directory.
 */
class ArchiveBuilder {
public:
    /**
     * @brief Constructs a builder.
     *
     * @param format Container format to produce.
     * @param matcher Exclusion decisions; an empty matcher includes everything.
     * @param fileSystem Filesystem to traverse.
     * @param logger Destination of progress and diagnostics.
     * @param options Tuning and error policy.
     */
    ArchiveBuilder(const ArchiveFormat& format,
                   const ExclusionMatcher& matcher,
                   FileSystem& fileSystem,
                   Logger& logger,
                   ArchiveOptions options = {});

    /**
     * @brief Archives sourceDir into outputFile.
     *
     * Unreadable entries are logged and skipped; unreadable regular files either are
     * skipped or abort the run depending on ArchiveOptions::skipOnError. Failure to
     * create or finalize the output file always aborts.
     *
     * @param sourceDir Root of the tree to archive.
     * @param outputFile Archive file to create.
     * @return std::expected<ArchiveStats, std::string> Run statistics or an error message.
     */
    std::expected<ArchiveStats, std::string> execute(const std::string& sourceDir, const std::string& outputFile);

private:
    struct Run;

    void walk(Run& run, const std::string& root);
    void writeStructuralEntry(Run& run, const SourceEntry& entry);
    void workerLoop(Run& run);
    std::expected<void, std::string> archiveFile(Run& run, const SourceEntry& entry);

    const ArchiveFormat& format;
    const ExclusionMatcher& matcher;
    FileSystem& fileSystem;
    Logger& logger;
    ArchiveOptions options;
};

#endif // FILE_BACKUP_HPP
