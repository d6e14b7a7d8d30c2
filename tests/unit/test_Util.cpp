#include <gtest/gtest.h>
#include "TestFs.hpp"
#include "util/files.hpp"
#include "util/RateLimiter.hpp"
#include "util/reachability.hpp"

using namespace ferry::util;
using namespace ferry::test;
using namespace std::chrono_literals;

TEST(FilesTest, ExtensionFilters) {
    const auto filters = normalizeExtensions({"JPG", ".Png", ""});
    EXPECT_EQ(filters, (std::vector<std::string>{".jpg", ".png"}));

    EXPECT_TRUE(matchesExtension("/a/IMG_1.JPG", filters));
    EXPECT_TRUE(matchesExtension("shot.png", filters));
    EXPECT_FALSE(matchesExtension("notes.txt", filters));
    EXPECT_FALSE(matchesExtension("jpg", filters));
    EXPECT_TRUE(matchesExtension("anything.bin", {}));
}

TEST(FilesTest, UniqueNameCountsUp) {
    TempDir tmp;
    const auto base = tmp / "a.jpg";
    EXPECT_EQ(uniqueName(base), base);

    writeBytes(base, "x");
    EXPECT_EQ(uniqueName(base), tmp / "a (1).jpg");

    writeBytes(tmp / "a (1).jpg", "x");
    EXPECT_EQ(uniqueName(base), tmp / "a (2).jpg");
}

TEST(FilesTest, PartialFiles) {
    const auto part = partialPathFor("/dst/2024/movie.raw");
    EXPECT_EQ(part, std::filesystem::path("/dst/2024/.movie.raw.part"));
    EXPECT_TRUE(isPartialFile(part));
    EXPECT_FALSE(isPartialFile("/dst/movie.raw"));
    EXPECT_FALSE(isPartialFile("/dst/.part"));
}

TEST(FilesTest, AtomicWriteReplaces) {
    TempDir tmp;
    const auto file = tmp / "ledger.json";
    writeFileAtomic(file, "one");
    writeFileAtomic(file, "two");
    EXPECT_EQ(readFileToString(file), "two");
    EXPECT_FALSE(std::filesystem::exists(tmp / "ledger.json.tmp"));
    EXPECT_THROW(readFileToString(tmp / "missing.json"), std::runtime_error);
}

TEST(ReachabilityTest, SmbEndpointFromUncPath) {
    const auto ep = smbEndpointOf("//nas01/photos/inbox");
    ASSERT_TRUE(ep.has_value());
    EXPECT_EQ(ep->host, "nas01");
    EXPECT_EQ(ep->port, 445);

    EXPECT_EQ(smbEndpointOf("\\\\fileserver\\share")->host, "fileserver");
    EXPECT_FALSE(smbEndpointOf("/mnt/nas/photos").has_value());
    EXPECT_FALSE(smbEndpointOf("//").has_value());
}

TEST(ReachabilityTest, ClosedPortIsUnreachable) {
    EXPECT_FALSE(tcpReachable({"127.0.0.1", 1}, 500ms));
}

TEST(RateLimiterTest, PacesChunks) {
    RateLimiter limiter(100 * 1024);   // 100 KiB/s
    ASSERT_TRUE(limiter.enabled());

    const auto t0 = std::chrono::steady_clock::now();
    limiter.chunkStarted();
    limiter.chunkFinished(20 * 1024);   // ~200ms budget
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 150ms);
}

TEST(RateLimiterTest, CancelCutsTheWaitShort) {
    RateLimiter limiter(1024);
    const auto t0 = std::chrono::steady_clock::now();
    limiter.chunkStarted();
    limiter.chunkFinished(1024 * 1024, [] { return true; });
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
    EXPECT_FALSE(RateLimiter().enabled());
}
