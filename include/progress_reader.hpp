/**
 * @file progress_reader.hpp
 * @brief Throughput reporting for byte streams.
 */

#ifndef PROGRESS_READER_HPP
#define PROGRESS_READER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <istream>
#include <string>
#include "logger.hpp"

/**
 * @brief One progress measurement.
 */
struct ProgressSnapshot {
    std::uint64_t transferred = 0; ///< Bytes read so far.
    std::uint64_t total = 0;       ///< Expected number of bytes.
    double elapsedSeconds = 0;     ///< Time since the reader was created.
    bool complete = false;         ///< True for the report issued when total is reached.

    double percent() const;
    double megabytes() const;
    double totalMegabytes() const;
    double megabytesPerSecond() const;
};

/**
 * @brief Read decorator that logs transfer progress.
 *
 * Every read() is forwarded to the wrapped stream unchanged. A progress line is
 * logged at most once per interval, plus one completion line when the expected total
 * has been read. With a total of zero nothing is reported but reads still work.
 */
class ProgressReader {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Constructs a progress reader.
     *
     * @param source Stream to read from.
     * @param total Expected number of bytes.
     * @param logger Destination of progress lines.
     * @param label Prefix of the progress lines (e.g. "Upload").
     * @param interval Minimum time between two progress lines.
     */
    ProgressReader(std::istream& source,
                   std::uint64_t total,
                   Logger& logger,
                   std::string label = "Upload",
                   std::chrono::milliseconds interval = std::chrono::seconds(5));

    /**
     * @brief Reads up to size bytes.
     *
     * @return std::size_t Number of bytes stored in buffer; 0 at end of stream or on error.
     */
    std::size_t read(char* buffer, std::size_t size);

    /**
     * @brief Returns true if the underlying stream failed with a read error.
     */
    bool bad() const { return source.bad(); }

    std::uint64_t transferred() const { return transferred_; }
    std::uint64_t total() const { return total_; }

    /**
     * @brief Registers a callback invoked with every reported snapshot.
     */
    void setReportHook(std::function<void(const ProgressSnapshot&)> hook) { reportHook = std::move(hook); }

private:
    void report(Clock::time_point now, bool complete);

    std::istream& source;
    std::uint64_t total_;
    std::uint64_t transferred_ = 0;
    Logger& logger;
    std::string label;
    std::chrono::milliseconds interval;
    Clock::time_point startTime;
    Clock::time_point lastReport;
    bool completionReported = false;
    std::function<void(const ProgressSnapshot&)> reportHook;
};

#endif // PROGRESS_READER_HPP
