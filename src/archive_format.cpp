/**
 * @file archive_format.cpp
 * @brief libarchive based container writers.
 */

#include "archive_format.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <cerrno>
#include <format>
#include <string>

int clampCompressionLevel(int level) {
    if (level < 0 || level > 9) {
        return kDefaultCompressionLevel;
    }
    return level;
}

ArchiveWriter::ArchiveWriter(struct archive* handle, std::string path, std::unique_ptr<ParallelGzipWriter> sink)
    : handle(handle), path_(std::move(path)), sink(std::move(sink)) {}

ArchiveWriter::~ArchiveWriter() {
    if (handle) {
        archive_write_free(handle);
    }
}

std::string ArchiveWriter::lastError() const {
    const char* message = archive_error_string(handle);
    return message ? message : "unknown libarchive error";
}


std::expected<void, std::string> ArchiveWriter::writeHeader(const SourceEntry& entry) {
    if (broken_ || closed) {
        return std::unexpected(std::format("archive {} is no longer writable", path_));
    }

    struct archive_entry* ae = archive_entry_new();
    archive_entry_set_pathname(ae, entry.relativePath.c_str());
    switch (entry.type) {
    case EntryType::RegularFile:
        archive_entry_set_filetype(ae, AE_IFREG);
        archive_entry_set_size(ae, static_cast<la_int64_t>(entry.size));
        break;
    case EntryType::Directory:
        archive_entry_set_filetype(ae, AE_IFDIR);
        archive_entry_set_size(ae, 0);
        break;
    case EntryType::Symlink:
        archive_entry_set_filetype(ae, AE_IFLNK);
        archive_entry_set_symlink(ae, entry.linkTarget.c_str());
        archive_entry_set_size(ae, 0);
        break;
    case EntryType::Other:
        archive_entry_free(ae);
        return std::unexpected(std::format("unsupported entry type: {}", entry.relativePath));
    }
    archive_entry_set_perm(ae, entry.mode);
    archive_entry_set_mtime(ae, static_cast<time_t>(entry.mtimeSeconds), entry.mtimeNanoseconds);

    int result = archive_write_header(handle, ae);
    archive_entry_free(ae);
    if (result < ARCHIVE_WARN) {
        broken_ = result == ARCHIVE_FATAL;
        return std::unexpected(std::format("Failed to write header for {}: {}", entry.relativePath, lastError()));
    }
    return {};
}

std::expected<void, std::string> ArchiveWriter::writeData(const char* data, std::size_t size) {
    la_ssize_t written = archive_write_data(handle, data, size);
    if (written < 0) {
        broken_ = written == ARCHIVE_FATAL;
        return std::unexpected(std::format("Failed to write data to {}: {}", path_, lastError()));
    }
    return {};
}

std::expected<void, std::string> ArchiveWriter::finishEntry() {
    int result = archive_write_finish_entry(handle);
    if (result < ARCHIVE_WARN) {
        broken_ = result == ARCHIVE_FATAL;
        return std::unexpected(std::format("Failed to finish entry in {}: {}", path_, lastError()));
    }
    return {};
}

std::expected<void, std::string> ArchiveWriter::close() {
    if (closed) {
        return {};
    }
    closed = true;
    if (archive_write_close(handle) != ARCHIVE_OK) {
        broken_ = true;
        return std::unexpected(std::format("Failed to close archive {}: {}", path_, lastError()));
    }
    return {};
}

namespace {

const char* errorString(struct archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown libarchive error";
}

la_ssize_t gzipWriteCallback(struct archive* a, void* clientData, const void* buffer, size_t length) {
    auto* sink = static_cast<ParallelGzipWriter*>(clientData);
    auto result = sink->write(static_cast<const char*>(buffer), length);
    if (!result) {
        archive_set_error(a, EIO, "%s", result.error().c_str());
        return -1;
    }
    return static_cast<la_ssize_t>(length);
}

int gzipCloseCallback(struct archive* a, void* clientData) {
    auto* sink = static_cast<ParallelGzipWriter*>(clientData);
    auto result = sink->close();
    if (!result) {
        archive_set_error(a, EIO, "%s", result.error().c_str());
        return ARCHIVE_FATAL;
    }
    return ARCHIVE_OK;
}

} // namespace

std::expected<std::unique_ptr<ArchiveWriter>, std::string> TarGzArchiveFormat::open(const std::string& path,
                                                                                   int compressionLevel,
                                                                                   unsigned threads) const {
    auto sink = std::make_unique<ParallelGzipWriter>(clampCompressionLevel(compressionLevel), threads);
    auto opened = sink->open(path);
    if (!opened) {
        return std::unexpected(opened.error());
    }

    struct archive* a = archive_write_new();
    if (!a) {
        return std::unexpected("Failed to allocate archive writer");
    }
    // Writer owns the handle from here on, so every early return frees it.
    ParallelGzipWriter* rawSink = sink.get();
    auto writer = std::make_unique<ArchiveWriter>(a, path, std::move(sink));

    if (archive_write_set_format_pax_restricted(a) != ARCHIVE_OK) {
        return std::unexpected(std::format("Failed to select tar format: {}", errorString(a)));
    }
    int result = archive_write_open(a, rawSink, nullptr, gzipWriteCallback, gzipCloseCallback);
    if (result != ARCHIVE_OK) {
        return std::unexpected(std::format("Failed to open archive file: {} (error: {})", path, errorString(a)));
    }
    return writer;
}

std::expected<std::unique_ptr<ArchiveWriter>, std::string> ZipArchiveFormat::open(const std::string& path,
                                                                                 int compressionLevel,
                                                                                 [[maybe_unused]] unsigned threads) const {
    int level = clampCompressionLevel(compressionLevel);
    struct archive* a = archive_write_new();
    if (!a) {
        return std::unexpected("Failed to allocate archive writer");
    }
    auto writer = std::make_unique<ArchiveWriter>(a, path);

    if (archive_write_set_format_zip(a) != ARCHIVE_OK) {
        return std::unexpected(std::format("Failed to select zip format: {}", errorString(a)));
    }
    if (archive_write_set_format_option(a, "zip", "compression", level == 0 ? "store" : "deflate") < ARCHIVE_WARN) {
        return std::unexpected(std::format("Failed to set zip compression: {}", errorString(a)));
    }
    // Older libarchive releases do not know compression-level and answer ARCHIVE_WARN.
    if (archive_write_set_format_option(a, "zip", "compression-level", std::to_string(level).c_str()) < ARCHIVE_WARN) {
        return std::unexpected(std::format("Failed to set zip compression level: {}", errorString(a)));
    }

    int result = archive_write_open_filename(a, path.c_str());
    if (result != ARCHIVE_OK) {
        return std::unexpected(std::format("Failed to open archive file: {} (error: {})", path, errorString(a)));
    }
    return writer;
}

std::unique_ptr<ArchiveFormat> selectArchiveFormat(PlatformKind platform) {
    if (platform == PlatformKind::Windows) {
        return std::make_unique<ZipArchiveFormat>();
    }
    return std::make_unique<TarGzArchiveFormat>();
}
