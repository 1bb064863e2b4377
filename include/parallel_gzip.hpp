/**
 * @file parallel_gzip.hpp
 * @brief Multi-threaded gzip output stream for HomeVault.
 *
 * The stream is cut into fixed-size blocks which are deflated concurrently, each one
 * as a complete gzip member. Members are written to the file in input order, so the
 * result is a standard multi-member gzip file that gzip, tar and libarchive read as
 * one stream.
 *
 * @note Requires zlib.
 */

#ifndef PARALLEL_GZIP_HPP
#define PARALLEL_GZIP_HPP

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "work_queue.hpp"

/**
 * @brief Writes gzip data to a file using several compression threads.
 *
 * write() and close() must be called from one thread at a time; the archive writer
 * serializes them with its own lock.
 */
class ParallelGzipWriter {
public:
    static constexpr std::size_t kBlockSize = 1024 * 1024;

    /**
     * @brief Constructs a writer.
     *
     * @param level zlib compression level, 0 to 9.
     * @param threads Number of compression threads; 0 uses every processor.
     */
    ParallelGzipWriter(int level, unsigned threads);

    /**
     * @brief Stops the compression threads. Does not flush; call close() for that.
     */
    ~ParallelGzipWriter();

    ParallelGzipWriter(const ParallelGzipWriter&) = delete;
    ParallelGzipWriter& operator=(const ParallelGzipWriter&) = delete;

    /**
     * @brief Creates (or truncates) the output file.
     *
     * @param path Output file path.
     * @return std::expected<void, std::string> Success or an error message.
     */
    std::expected<void, std::string> open(const std::string& path);

    /**
     * @brief Appends uncompressed bytes.
     */
    std::expected<void, std::string> write(const char* data, std::size_t size);

    /**
     * @brief Compresses the remaining input, writes every pending member and closes the file.
     */
    std::expected<void, std::string> close();

    std::uint64_t bytesIn() const { return bytesIn_; }
    std::uint64_t bytesOut() const { return bytesOut_; }
    unsigned threads() const { return static_cast<unsigned>(workers.size()); }

private:
    struct Block {
        std::string input;
        std::string output;
        std::string error;
        bool done = false;
    };

    std::expected<void, std::string> submitCurrent();
    std::expected<void, std::string> writeCompleted(bool waitForAll);
    void compressBlock(Block& block) const;
    void workerLoop();
    void stopWorkers();

    int level;
    std::size_t maxInFlight;
    std::ofstream out;
    std::string path_;
    std::string current;
    std::deque<std::shared_ptr<Block>> pending;
    BoundedQueue<std::shared_ptr<Block>> work;
    std::vector<std::thread> workers;
    std::mutex doneMutex;
    std::condition_variable doneCondition;
    std::uint64_t bytesIn_ = 0;
    std::uint64_t bytesOut_ = 0;
    std::uint64_t membersWritten = 0;
    bool opened = false;
    bool closed = false;
};

#endif // PARALLEL_GZIP_HPP
