#include "progress_reader.hpp"

namespace {

constexpr double kMegabyte = 1024.0 * 1024.0;

} // namespace

double ProgressSnapshot::percent() const {
    return total == 0 ? 0.0 : static_cast<double>(transferred) / static_cast<double>(total) * 100.0;
}

double ProgressSnapshot::megabytes() const {
    return static_cast<double>(transferred) / kMegabyte;
}

double ProgressSnapshot::totalMegabytes() const {
    return static_cast<double>(total) / kMegabyte;
}

double ProgressSnapshot::megabytesPerSecond() const {
    return elapsedSeconds > 0 ? megabytes() / elapsedSeconds : 0.0;
}

ProgressReader::ProgressReader(std::istream& source,
                               std::uint64_t total,
                               Logger& logger,
                               std::string label,
                               std::chrono::milliseconds interval)
    : source(source),
      total_(total),
      logger(logger),
      label(std::move(label)),
      interval(interval),
      startTime(Clock::now()),
      lastReport(startTime) {}

std::size_t ProgressReader::read(char* buffer, std::size_t size) {
    if (!source) {
        return 0;
    }
    source.read(buffer, static_cast<std::streamsize>(size));
    auto n = static_cast<std::size_t>(source.gcount());
    transferred_ += n;

    if (total_ == 0 || completionReported) {
        return n;
    }
    auto now = Clock::now();
    if (transferred_ >= total_) {
        report(now, true);
    } else if (n > 0 && now - lastReport >= interval) {
        report(now, false);
    }
    return n;
}

void ProgressReader::report(Clock::time_point now, bool complete) {
    lastReport = now;
    completionReported = complete;

    ProgressSnapshot snapshot;
    snapshot.transferred = transferred_;
    snapshot.total = total_;
    snapshot.elapsedSeconds = std::chrono::duration<double>(now - startTime).count();
    snapshot.complete = complete;

    if (complete) {
        logger.info("{} completed: {:.2f} MB ({:.2f} MB/s)", label, snapshot.megabytes(), snapshot.megabytesPerSecond());
    } else {
        logger.info("{} progress: {:.1f}% ({:.2f}/{:.2f} MB, {:.2f} MB/s)",
                    label,
                    snapshot.percent(),
                    snapshot.megabytes(),
                    snapshot.totalMegabytes(),
                    snapshot.megabytesPerSecond());
    }
    if (reportHook) {
        reportHook(snapshot);
    }
}
