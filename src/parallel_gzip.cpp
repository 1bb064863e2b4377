#include "parallel_gzip.hpp"
#include <algorithm>
#include <cerrno>
#include <format>
#include <system_error>
#include <zlib.h>

namespace {

unsigned resolveThreads(unsigned threads) {
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
    }
    return std::max(threads, 1u);
}

} // namespace

ParallelGzipWriter::ParallelGzipWriter(int level, unsigned threads)
    : level(std::clamp(level, 0, 9)),
      maxInFlight(2 * static_cast<std::size_t>(resolveThreads(threads))),
      work(maxInFlight) {
    unsigned count = resolveThreads(threads);
    for (unsigned i = 0; i < count; ++i) {
        workers.emplace_back([this] { workerLoop(); });
    }
}

ParallelGzipWriter::~ParallelGzipWriter() {
    stopWorkers();
}

void ParallelGzipWriter::stopWorkers() {
    work.close();
    for (auto& t : workers) {
        if (t.joinable()) {
            t.join();
        }
    }
}

std::expected<void, std::string> ParallelGzipWriter::open(const std::string& path) {
    out.open(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected(std::format("Failed to create {} (error: {})", path, std::generic_category().message(errno)));
    }
    path_ = path;
    opened = true;
    current.reserve(kBlockSize);
    return {};
}

std::expected<void, std::string> ParallelGzipWriter::write(const char* data, std::size_t size) {
    if (!opened || closed) {
        return std::unexpected("gzip stream is not open");
    }
    while (size > 0) {
        std::size_t n = std::min(size, kBlockSize - current.size());
        current.append(data, n);
        data += n;
        size -= n;
        bytesIn_ += n;
        if (current.size() == kBlockSize) {
            auto result = submitCurrent();
            if (!result) {
                return result;
            }
        }
    }
    return {};
}

std::expected<void, std::string> ParallelGzipWriter::submitCurrent() {
    auto block = std::make_shared<Block>();
    block->input = std::move(current);
    current.clear();
    current.reserve(kBlockSize);

    pending.push_back(block);
    if (!work.push(block)) {
        return std::unexpected("gzip compression threads have stopped");
    }
    return writeCompleted(false);
}

std::expected<void, std::string> ParallelGzipWriter::writeCompleted(bool waitForAll) {
    while (!pending.empty()) {
        auto front = pending.front();
        {
            std::unique_lock<std::mutex> lock(doneMutex);
            if (!front->done) {
                if (!waitForAll && pending.size() <= maxInFlight) {
                    break;
                }
                doneCondition.wait(lock, [&front] { return front->done; });
            }
        }
        if (!front->error.empty()) {
            return std::unexpected(front->error);
        }
        out.write(front->output.data(), static_cast<std::streamsize>(front->output.size()));
        if (!out) {
            return std::unexpected(std::format("Failed to write {} (error: {})", path_, std::generic_category().message(errno)));
        }
        bytesOut_ += front->output.size();
        ++membersWritten;
        pending.pop_front();
    }
    return {};
}

std::expected<void, std::string> ParallelGzipWriter::close() {
    if (!opened) {
        return std::unexpected("gzip stream is not open");
    }
    if (closed) {
        return {};
    }
    // An empty input still needs one member to be a valid gzip file.
    if (!current.empty() || (membersWritten == 0 && pending.empty())) {
        auto result = submitCurrent();
        if (!result) {
            closed = true;
            stopWorkers();
            return result;
        }
    }
    auto result = writeCompleted(true);
    closed = true;
    stopWorkers();
    if (!result) {
        return result;
    }
    out.flush();
    out.close();
    if (out.fail()) {
        return std::unexpected(std::format("Failed to close {} (error: {})", path_, std::generic_category().message(errno)));
    }
    return {};
}

void ParallelGzipWriter::compressBlock(Block& block) const {
    z_stream zs{};
    // windowBits 15 + 16 selects the gzip wrapper.
    if (deflateInit2(&zs, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        block.error = "deflateInit2 failed";
        return;
    }

    block.output.resize(deflateBound(&zs, static_cast<uLong>(block.input.size())) + 64);
    zs.next_in = reinterpret_cast<Bytef*>(block.input.data());
    zs.avail_in = static_cast<uInt>(block.input.size());
    zs.next_out = reinterpret_cast<Bytef*>(block.output.data());
    zs.avail_out = static_cast<uInt>(block.output.size());

    int rc;
    while ((rc = deflate(&zs, Z_FINISH)) == Z_OK || rc == Z_BUF_ERROR) {
        if (zs.avail_out != 0 && rc == Z_BUF_ERROR) {
            break;
        }
        std::size_t used = block.output.size() - zs.avail_out;
        block.output.resize(block.output.size() * 2);
        zs.next_out = reinterpret_cast<Bytef*>(block.output.data() + used);
        zs.avail_out = static_cast<uInt>(block.output.size() - used);
    }
    if (rc != Z_STREAM_END) {
        block.error = std::format("deflate failed: {}", zs.msg ? zs.msg : "unknown error");
    } else {
        block.output.resize(zs.total_out);
        // Input is no longer needed once compressed.
        std::string().swap(block.input);
    }
    deflateEnd(&zs);
}

void ParallelGzipWriter::workerLoop() {
    while (auto block = work.pop()) {
        compressBlock(**block);
        {
            std::lock_guard<std::mutex> lock(doneMutex);
            (*block)->done = true;
        }
        doneCondition.notify_all();
    }
}
