#include <gtest/gtest.h>
#include <zlib.h>
#include "parallel_gzip.hpp"
#include "test_support.hpp"

namespace {

/**
 * @brief Decompresses a gzip file, following concatenated members.
 */
std::string gunzip(const fs::path& file) {
    gzFile in = gzopen(file.string().c_str(), "rb");
    if (!in) {
        throw std::runtime_error("Failed to open " + file.string());
    }
    std::string data;
    char buffer[16384];
    int n = 0;
    while ((n = gzread(in, buffer, sizeof(buffer))) > 0) {
        data.append(buffer, static_cast<std::size_t>(n));
    }
    int closed = gzclose(in);
    if (n < 0 || closed != Z_OK) {
        throw std::runtime_error("Corrupt gzip stream in " + file.string());
    }
    return data;
}

/**
 * @brief Counts gzip member headers (1f 8b 08) that start a member.
 */
std::size_t countMembers(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::size_t count = 0;
    for (std::size_t i = 0; i + 2 < bytes.size(); ++i) {
        if (static_cast<unsigned char>(bytes[i]) == 0x1f && static_cast<unsigned char>(bytes[i + 1]) == 0x8b &&
            bytes[i + 2] == 0x08) {
            ++count;
        }
    }
    return count;
}

} // namespace

TEST(ParallelGzipWriterTest, MultiMemberOutputDecompressesToInput) {
    TempDir dir;
    auto path = dir.path() / "out.gz";
    std::string input = makePayload(3 * ParallelGzipWriter::kBlockSize + 12345, 11);

    ParallelGzipWriter writer(6, 4);
    ASSERT_TRUE(writer.open(path.string()));
    // Uneven chunk sizes so block boundaries fall inside writes.
    std::size_t offset = 0;
    std::size_t chunk = 1;
    while (offset < input.size()) {
        std::size_t n = std::min(chunk, input.size() - offset);
        ASSERT_TRUE(writer.write(input.data() + offset, n));
        offset += n;
        chunk = chunk * 3 + 7;
    }
    ASSERT_TRUE(writer.close());

    EXPECT_EQ(writer.threads(), 4u);
    EXPECT_EQ(writer.bytesIn(), input.size());
    EXPECT_EQ(writer.bytesOut(), fs::file_size(path));
    EXPECT_EQ(gunzip(path), input);
    EXPECT_GE(countMembers(path), 4u);
}

TEST(ParallelGzipWriterTest, EmptyInputIsStillValidGzip) {
    TempDir dir;
    auto path = dir.path() / "empty.gz";

    ParallelGzipWriter writer(6, 2);
    ASSERT_TRUE(writer.open(path.string()));
    ASSERT_TRUE(writer.close());

    EXPECT_GT(fs::file_size(path), 0u);
    EXPECT_EQ(gunzip(path), "");
}

TEST(ParallelGzipWriterTest, LevelZeroStoresAndLevelNineShrinks) {
    TempDir dir;
    std::string input;
    while (input.size() < 1536 * 1024) {
        input += "lorem ipsum dolor sit amet ";
    }

    auto stored = dir.path() / "stored.gz";
    auto packed = dir.path() / "packed.gz";
    for (auto [level, path] : {std::pair{0, stored}, std::pair{9, packed}}) {
        ParallelGzipWriter writer(level, 2);
        ASSERT_TRUE(writer.open(path.string()));
        ASSERT_TRUE(writer.write(input.data(), input.size()));
        ASSERT_TRUE(writer.close());
    }

    EXPECT_GT(fs::file_size(stored), input.size());
    EXPECT_LT(fs::file_size(packed), input.size() / 20);
    EXPECT_EQ(gunzip(stored), input);
    EXPECT_EQ(gunzip(packed), input);
}

TEST(ParallelGzipWriterTest, WriteBeforeOpenOrAfterCloseFails) {
    TempDir dir;
    ParallelGzipWriter writer(6, 1);
    EXPECT_FALSE(writer.write("x", 1));

    ASSERT_TRUE(writer.open((dir.path() / "x.gz").string()));
    ASSERT_TRUE(writer.close());
    EXPECT_FALSE(writer.write("x", 1));
}

TEST(ParallelGzipWriterTest, OpenFailsForMissingDirectory) {
    TempDir dir;
    ParallelGzipWriter writer(6, 1);
    auto result = writer.open((dir.path() / "missing" / "x.gz").string());
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().find("Failed to create"), std::string::npos);
}
