/**
 * @file file_backup.cpp
 * @brief Archive creation pipeline implementation for HomeVault.
 *
 * Producer/consumer traversal with a bounded queue, a worker pool sharing one archive
 * writer under a mutex, and a monitor thread reporting the archive file size.
 */

#include "file_backup.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <format>
#include <mutex>
#include <thread>
#include <vector>
#include "work_queue.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBufferSize = 32 * 1024;
constexpr double kMegabyte = 1024.0 * 1024.0;

unsigned resolveWorkers(unsigned workers) {
    if (workers == 0) {
        workers = std::thread::hardware_concurrency();
    }
    return std::max(workers, 1u);
}

std::string normalizedAbsolute(const std::string& path) {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    if (ec) {
        return fs::path(path).lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

/**
 * @brief Reports the archive size at a fixed interval until stopped.
 *
 * Reads the size of the output file, so it never contends with the writers.
 */
class SizeMonitor {
public:
    SizeMonitor(const std::string& path, std::chrono::milliseconds interval, Logger& logger)
        : path(path), interval(interval), logger(logger), startTime(std::chrono::steady_clock::now()) {
        thread = std::thread([this] { run(); });
    }

    ~SizeMonitor() { stop(); }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            stopped = true;
        }
        condition.notify_all();
        if (thread.joinable()) {
            thread.join();
        }
    }

private:
    void run() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!condition.wait_for(lock, interval, [this] { return stopped; })) {
            std::error_code ec;
            auto size = fs::file_size(path, ec);
            if (ec) {
                continue;
            }
            double sizeMB = static_cast<double>(size) / kMegabyte;
            double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
            logger.info("Archive size: {:.2f} MB ({:.2f} MB/s)", sizeMB, elapsed > 0 ? sizeMB / elapsed : 0.0);
        }
    }

    std::string path;
    std::chrono::milliseconds interval;
    Logger& logger;
    std::chrono::steady_clock::time_point startTime;
    std::mutex mutex;
    std::condition_variable condition;
    bool stopped = false;
    std::thread thread;
};

} // namespace

struct ArchiveBuilder::Run {
    Run(ArchiveWriter& writer, std::size_t queueCapacity, std::string outputPath)
        : writer(writer), queue(queueCapacity), buffers(kCopyBufferSize), outputPath(std::move(outputPath)) {}

    void fail(const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(errorMutex);
            if (firstError.empty()) {
                firstError = message;
            }
        }
        failed = true;
        queue.close();
    }

    ArchiveWriter& writer;
    std::mutex writerMutex;
    BoundedQueue<SourceEntry> queue;
    BufferPool buffers;
    std::string outputPath;

    std::atomic<bool> failed{false};
    std::mutex errorMutex;
    std::string firstError;

    std::atomic<std::uint64_t> files{0};
    std::atomic<std::uint64_t> directories{0};
    std::atomic<std::uint64_t> symlinks{0};
    std::atomic<std::uint64_t> excluded{0};
    std::atomic<std::uint64_t> skipped{0};
    std::atomic<std::uint64_t> bytesRead{0};
};

ArchiveBuilder::ArchiveBuilder(const ArchiveFormat& format,
                               const ExclusionMatcher& matcher,
                               FileSystem& fileSystem,
                               Logger& logger,
                               ArchiveOptions options)
    : format(format), matcher(matcher), fileSystem(fileSystem), logger(logger), options(options) {}

std::expected<ArchiveStats, std::string> ArchiveBuilder::execute(const std::string& sourceDir,
                                                                 const std::string& outputFile) {
    auto startTime = std::chrono::steady_clock::now();
    std::string root = normalizedAbsolute(sourceDir);

    auto rootEntry = fileSystem.statEntry(root);
    if (!rootEntry) {
        return std::unexpected(std::format("source directory does not exist: {} ({})", sourceDir, rootEntry.error()));
    }
    if (rootEntry->type != EntryType::Directory) {
        return std::unexpected(std::format("source is not a directory: {}", sourceDir));
    }

    fs::path outputPath(outputFile);
    if (outputPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(outputPath.parent_path(), ec);
        if (ec) {
            return std::unexpected(std::format("failed to create output directory {}: {}",
                                               outputPath.parent_path().string(), ec.message()));
        }
    }

    int level = clampCompressionLevel(options.compressionLevel);
    auto writer = format.open(outputFile, level, options.compressionThreads);
    if (!writer) {
        return std::unexpected(std::format("failed to create output file: {}", writer.error()));
    }

    unsigned workerCount = resolveWorkers(options.workers);
    logger.debug("Archiving with {} workers, {} format, compression level {}", workerCount, format.name(), level);

    Run run(**writer, 2 * static_cast<std::size_t>(workerCount), normalizedAbsolute(outputFile));
    {
        SizeMonitor monitor(outputFile, options.progressInterval, logger);

        std::vector<std::thread> workers;
        for (unsigned i = 0; i < workerCount; ++i) {
            workers.emplace_back([this, &run] { workerLoop(run); });
        }

        walk(run, root);
        run.queue.close();

        for (auto& t : workers) {
            if (t.joinable()) {
                t.join();
            }
        }
        monitor.stop();
    }

    auto closed = (*writer)->close();
    if (run.failed) {
        return std::unexpected(run.firstError);
    }
    if (!closed) {
        return std::unexpected(std::format("failed to finalize archive: {}", closed.error()));
    }

    ArchiveStats stats;
    stats.files = run.files;
    stats.directories = run.directories;
    stats.symlinks = run.symlinks;
    stats.excluded = run.excluded;
    stats.skipped = run.skipped;
    stats.bytesRead = run.bytesRead;
    stats.elapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    std::error_code ec;
    stats.archiveSize = fs::file_size(outputFile, ec);

    double sizeMB = static_cast<double>(stats.archiveSize) / kMegabyte;
    logger.info("Final archive size: {:.2f} MB (average speed: {:.2f} MB/s)",
                sizeMB,
                stats.elapsedSeconds > 0 ? sizeMB / stats.elapsedSeconds : 0.0);
    logger.info("Archived {} files, {} directories, {} symlinks ({} excluded, {} skipped)",
                stats.files, stats.directories, stats.symlinks, stats.excluded, stats.skipped);
    return stats;
}

void ArchiveBuilder::walk(Run& run, const std::string& root) {
    struct Frame {
        std::string absolutePath;
        std::string relativePath;
        std::vector<std::string> names;
        std::size_t next = 0;
    };

    auto rootListing = fileSystem.listDirectory(root);
    if (!rootListing) {
        run.fail(std::format("failed to read source directory: {}", rootListing.error()));
        return;
    }
    if (!rootListing->error.empty()) {
        logger.warn("Incomplete directory listing: {}", rootListing->error);
    }

    std::vector<Frame> stack;
    stack.push_back(Frame{root, {}, std::move(rootListing->names)});

    while (!stack.empty() && !run.failed) {
        Frame& frame = stack.back();
        if (frame.next >= frame.names.size()) {
            stack.pop_back();
            continue;
        }
        const std::string name = frame.names[frame.next++];
        std::string path = (fs::path(frame.absolutePath) / name).string();
        std::string relPath = frame.relativePath.empty() ? name : frame.relativePath + "/" + name;

        auto entry = fileSystem.statEntry(path);
        if (!entry) {
            logger.warn("Error accessing path {}: {}", path, entry.error());
            ++run.skipped;
            continue;
        }
        entry->relativePath = relPath;

        if (fs::path(path).lexically_normal().string() == run.outputPath) {
            logger.debug("Skipping the archive being written: {}", path);
            continue;
        }

        bool isDirectory = entry->type == EntryType::Directory;
        if (const auto* pattern = matcher.findMatch(relPath, isDirectory)) {
            logger.debug("Excluding: ./{} (matched pattern {})", relPath, pattern->text());
            ++run.excluded;
            continue;
        }
        logger.debug("Including: ./{}", relPath);

        switch (entry->type) {
        case EntryType::Directory: {
            writeStructuralEntry(run, *entry);
            auto listing = fileSystem.listDirectory(path);
            if (!listing) {
                logger.warn("Error accessing path {}: {}", path, listing.error());
                ++run.skipped;
                continue;
            }
            if (!listing->error.empty()) {
                logger.warn("Incomplete directory listing: {}", listing->error);
            }
            // frame is invalidated by the push.
            stack.push_back(Frame{path, relPath, std::move(listing->names)});
            break;
        }
        case EntryType::Symlink: {
            auto target = fileSystem.readSymlink(path);
            if (!target) {
                logger.debug("Failed to read symlink {}: {}", path, target.error());
                ++run.skipped;
                continue;
            }
            entry->linkTarget = std::move(*target);
            writeStructuralEntry(run, *entry);
            break;
        }
        case EntryType::RegularFile:
            if (!run.queue.push(std::move(*entry))) {
                return;
            }
            break;
        case EntryType::Other:
            logger.debug("Skipping special file: {}", path);
            ++run.skipped;
            break;
        }
    }
}

void ArchiveBuilder::writeStructuralEntry(Run& run, const SourceEntry& entry) {
    std::lock_guard<std::mutex> lock(run.writerMutex);
    auto result = run.writer.writeHeader(entry);
    if (result) {
        result = run.writer.finishEntry();
    }
    if (!result) {
        if (run.writer.broken()) {
            run.fail(std::format("failed to write archive: {}", result.error()));
        } else {
            logger.warn("Skipping {}: {}", entry.relativePath, result.error());
            ++run.skipped;
        }
        return;
    }
    if (entry.type == EntryType::Directory) {
        ++run.directories;
    } else {
        ++run.symlinks;
    }
}

void ArchiveBuilder::workerLoop(Run& run) {
    while (auto entry = run.queue.pop()) {
        if (run.failed) {
            continue;
        }
        auto result = archiveFile(run, *entry);
        if (result) {
            continue;
        }
        if (run.writer.broken()) {
            run.fail(std::format("failed to write archive: {}", result.error()));
        } else if (options.skipOnError) {
            logger.warn("Skipping file {}: {}", entry->absolutePath, result.error());
            ++run.skipped;
        } else {
            run.fail(std::format("failed to archive {}: {}", entry->absolutePath, result.error()));
        }
    }
}

std::expected<void, std::string> ArchiveBuilder::archiveFile(Run& run, const SourceEntry& entry) {
    auto buffer = run.buffers.acquire();

    // The file is opened before the lock so an unopenable file leaves no header behind.
    auto stream = fileSystem.openFile(entry.absolutePath);
    if (!stream) {
        return std::unexpected(stream.error());
    }
    std::istream& in = **stream;
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (in.bad()) {
        return std::unexpected(std::format("Failed to read file: {}", entry.absolutePath));
    }
    std::streamsize n = in.gcount();

    std::lock_guard<std::mutex> lock(run.writerMutex);
    auto result = run.writer.writeHeader(entry);
    if (!result) {
        return result;
    }

    std::uint64_t copied = 0;
    std::string readError;
    while (n > 0) {
        result = run.writer.writeData(buffer.data(), static_cast<std::size_t>(n));
        if (!result) {
            return result;
        }
        copied += static_cast<std::uint64_t>(n);
        if (in.eof()) {
            break;
        }
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (in.bad()) {
            readError = std::format("Failed to read file: {} after {} bytes", entry.absolutePath, copied);
            break;
        }
        n = in.gcount();
    }

    // Short content is zero-filled up to the size recorded in the header.
    result = run.writer.finishEntry();
    if (!result) {
        return result;
    }
    run.bytesRead += copied;
    if (!readError.empty()) {
        return std::unexpected(readError);
    }
    ++run.files;
    return {};
}
