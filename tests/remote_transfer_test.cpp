#include <gtest/gtest.h>
#include "remote_transfer.hpp"
#include "test_support.hpp"

namespace {

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

TEST(SyncTransferStrategyTest, StreamsArchiveIntoCommand) {
    TempDir dir;
    std::string payload = makePayload(600 * 1024, 21);
    auto archive = dir.write("alice.tar.gz", payload);
    auto remote = dir.mkdir("remote");

    MemoryLogger logger;
    SyncTransferStrategy strategy(SyncConfig{remote.string(), "cat > {dest}"}, logger);
    auto result = strategy.transfer(archive.string());
    ASSERT_TRUE(result) << result.error();

    EXPECT_EQ(readFile(remote / "alice.tar.gz"), payload);
    EXPECT_TRUE(logger.contains(LogLevel::Info, "Upload completed"));
}

TEST(SyncTransferStrategyTest, NonZeroExitStatusFails) {
    TempDir dir;
    auto archive = dir.write("alice.tar.gz", makePayload(1024, 1));

    MemoryLogger logger;
    SyncTransferStrategy strategy(SyncConfig{"remote:", "cat > /dev/null; exit 3 # {dest}"}, logger);
    auto result = strategy.transfer(archive.string());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), "sync copy failed with status 3");
}

TEST(SyncTransferStrategyTest, MissingLocalFileFails) {
    TempDir dir;
    MemoryLogger logger;
    SyncTransferStrategy strategy(SyncConfig{"remote:", "cat > /dev/null"}, logger);

    auto result = strategy.transfer((dir.path() / "missing.tar.gz").string());
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().find("missing.tar.gz"), std::string::npos);
}

TEST(SyncTransferStrategyTest, RemoteTargetJoinsDestinationAndName) {
    EXPECT_EQ(SyncTransferStrategy::remoteTarget("gdrive:backup/home", "a.tar.gz"), "gdrive:backup/home/a.tar.gz");
    EXPECT_EQ(SyncTransferStrategy::remoteTarget("gdrive:", "a.tar.gz"), "gdrive:a.tar.gz");
    EXPECT_EQ(SyncTransferStrategy::remoteTarget("gdrive:backup/", "a.tar.gz"), "gdrive:backup/a.tar.gz");
    EXPECT_EQ(SyncTransferStrategy::remoteTarget("", "a.tar.gz"), "a.tar.gz");
}

TEST(SyncTransferStrategyTest, BuildCommandQuotesTarget) {
    MemoryLogger logger;
    SyncTransferStrategy rclone(SyncConfig{"gdrive:", "rclone rcat {dest}"}, logger);
    EXPECT_EQ(rclone.buildCommand("gdrive:it's.tar.gz"), "rclone rcat 'gdrive:it'\\''s.tar.gz'");

    SyncTransferStrategy appended(SyncConfig{"gdrive:", "upload-tool --stdin"}, logger);
    EXPECT_EQ(appended.buildCommand("gdrive:a b.zip"), "upload-tool --stdin 'gdrive:a b.zip'");
    EXPECT_EQ(appended.describe(), "gdrive:");
}

TEST(SFTPTransferStrategyTest, RemoteDirectoryLayout) {
    EXPECT_EQ(SFTPTransferStrategy::remoteDirectory("backups/", "box", "2024-01-02"), "backups/box/Users/2024-01-02");
    EXPECT_EQ(SFTPTransferStrategy::remoteDirectory("/srv/backups//", "box", "2024-01-02"),
              "/srv/backups/box/Users/2024-01-02");
    EXPECT_EQ(SFTPTransferStrategy::remoteDirectory("", "box", "2024-01-02"), "box/Users/2024-01-02");
    EXPECT_EQ(SFTPTransferStrategy::remoteDirectory("/", "box", "2024-01-02"), "/box/Users/2024-01-02");
}

TEST(SFTPTransferStrategyTest, CurrentDateIsIsoDay) {
    auto date = SFTPTransferStrategy::currentDate();
    ASSERT_EQ(date.size(), 10u);
    EXPECT_EQ(date[4], '-');
    EXPECT_EQ(date[7], '-');
}

TEST(SFTPTransferStrategyTest, ConnectionFailureIsReported) {
    TempDir dir;
    auto archive = dir.write("alice.tar.gz", "payload");

    MemoryLogger logger;
    SFTPConfig config;
    config.host = "127.0.0.1";
    config.port = 1;
    config.user = "alice";
    config.timeout = std::chrono::seconds(5);
    SFTPTransferStrategy strategy(config, logger);

    auto result = strategy.transfer(archive.string());
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().find("failed to connect to SSH server 127.0.0.1:1"), std::string::npos) << result.error();
    EXPECT_EQ(strategy.describe(), "alice@127.0.0.1:");
}

/**
 * @brief Writes complete in submission order with at most `limit` outstanding.
 */
TEST(RequestWindowTest, BoundsRequestsInFlight) {
    std::vector<int> completed;
    auto wait = [&completed](int& request) -> std::expected<void, std::string> {
        completed.push_back(request);
        return {};
    };
    RequestWindow<int, decltype(wait)> window(SFTPTransferStrategy::kMaxRequestsInFlight, wait);

    std::size_t maxInFlight = 0;
    for (int i = 0; i < 100; ++i) {
        auto submitted = window.submit([i]() -> std::expected<int, std::string> { return i; });
        ASSERT_TRUE(submitted) << submitted.error();
        maxInFlight = std::max(maxInFlight, window.inFlight());
    }
    EXPECT_EQ(maxInFlight, SFTPTransferStrategy::kMaxRequestsInFlight);
    EXPECT_EQ(completed.size(), 100u - SFTPTransferStrategy::kMaxRequestsInFlight);

    ASSERT_TRUE(window.drain());
    EXPECT_EQ(window.inFlight(), 0u);
    ASSERT_EQ(completed.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(completed[static_cast<std::size_t>(i)], i);
    }
}

TEST(RequestWindowTest, FirstFailedWriteStopsTheUpload) {
    int waits = 0;
    auto wait = [&waits](int& request) -> std::expected<void, std::string> {
        ++waits;
        if (request == 2) {
            return std::unexpected("write 2 failed");
        }
        return {};
    };
    RequestWindow<int, decltype(wait)> window(2, wait);

    std::expected<void, std::string> result;
    int next = 0;
    while (result && next < 10) {
        result = window.submit([&next]() -> std::expected<int, std::string> { return next++; });
    }
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), "write 2 failed");
    EXPECT_EQ(waits, 3);
    EXPECT_EQ(next, 4);
}

TEST(RequestWindowTest, BeginFailureIsReturned) {
    auto wait = [](int&) -> std::expected<void, std::string> { return {}; };
    RequestWindow<int, decltype(wait)> window(4, wait);

    auto result = window.submit([]() -> std::expected<int, std::string> {
        return std::unexpected("connection lost");
    });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), "connection lost");
    EXPECT_EQ(window.inFlight(), 0u);
}
