#include <gtest/gtest.h>
#include "TestFs.hpp"
#include "protocols/Error.hpp"
#include "storage/ResumableTransfer.hpp"
#include "util/files.hpp"

using namespace ferry::storage;
using namespace ferry::protocols;
using namespace ferry::test;
namespace fs = std::filesystem;

class ResumableTransferTest : public ::testing::Test {
protected:
    static constexpr uintmax_t CHUNK = 4096;
    static constexpr size_t SIZE = 10 * CHUNK + 123;

    TempDir tmp;
    fs::path source, target;
    std::shared_ptr<ResumeLedger> ledger;

    void SetUp() override {
        ferry::config::ResumeConfig cfg;
        cfg.threshold_bytes = 1024;
        ledger = std::make_shared<ResumeLedger>(tmp / "resume_data", cfg);

        source = tmp / "src" / "movie.raw";
        target = tmp / "dst" / "movie.raw";
        writeBytes(source, randomBytes(SIZE));
        fs::create_directories(target.parent_path());
    }
};

TEST_F(ResumableTransferTest, FreshTransferCopiesAndCleansUp) {
    ResumableTransfer transfer(ledger, CHUNK);

    uintmax_t lastDone = 0;
    const auto result = transfer.run(source, target, "smb", [&](const uintmax_t done, uintmax_t) { lastDone = done; });

    EXPECT_EQ(result.bytes, SIZE);
    EXPECT_EQ(result.resumedFrom, 0u);
    EXPECT_EQ(lastDone, SIZE);
    EXPECT_EQ(readBytes(target), readBytes(source));
    EXPECT_FALSE(fs::exists(ferry::util::partialPathFor(target)));
    EXPECT_TRUE(ledger->pending().empty());
    EXPECT_EQ(fs::last_write_time(target), fs::last_write_time(source));
}

TEST_F(ResumableTransferTest, InterruptedTransferResumesToIdenticalFile) {
    ResumableTransfer transfer(ledger, CHUNK);

    int chunks = 0;
    auto cancelAfterThree = [&] { return chunks >= 3; };
    auto count = [&](uintmax_t, uintmax_t) { ++chunks; };

    try {
        transfer.run(source, target, "smb", count, cancelAfterThree);
        FAIL() << "expected an interruption";
    } catch (const TransferError& e) {
        EXPECT_TRUE(e.interrupted());
    }

    // Progress callback fires once up front, so two chunks made it to disk.
    const auto temp = ferry::util::partialPathFor(target);
    ASSERT_TRUE(fs::exists(temp));
    EXPECT_EQ(fs::file_size(temp), 2 * CHUNK);
    EXPECT_FALSE(fs::exists(target));
    ASSERT_EQ(ledger->pending().size(), 1u);
    EXPECT_EQ(ledger->pending().front().uploadedBytes, 2 * CHUNK);

    const auto result = transfer.run(source, target, "smb");
    EXPECT_EQ(result.resumedFrom, 2 * CHUNK);
    EXPECT_EQ(result.bytes, SIZE);
    EXPECT_EQ(readBytes(target), readBytes(source));
    EXPECT_FALSE(fs::exists(temp));
    EXPECT_TRUE(ledger->pending().empty());
}

TEST_F(ResumableTransferTest, TamperedTempFileRestartsFromZero) {
    ResumableTransfer transfer(ledger, CHUNK);

    int chunks = 0;
    EXPECT_THROW(transfer.run(source, target, "smb",
                              [&](uintmax_t, uintmax_t) { ++chunks; },
                              [&] { return chunks >= 3; }),
                 InterruptedError);

    // Truncate the temp file behind the ledger's back.
    const auto temp = ferry::util::partialPathFor(target);
    fs::resize_file(temp, 100);

    const auto result = transfer.run(source, target, "smb");
    EXPECT_EQ(result.resumedFrom, 0u);
    EXPECT_EQ(readBytes(target), readBytes(source));
}

TEST_F(ResumableTransferTest, ExistingTargetIsReplaced) {
    writeBytes(target, "stale content");
    ResumableTransfer transfer(ledger, CHUNK);

    transfer.run(source, target, "smb");
    EXPECT_EQ(readBytes(target), readBytes(source));
}

TEST_F(ResumableTransferTest, MissingSourceIsAPathError) {
    ResumableTransfer transfer(ledger, CHUNK);
    try {
        transfer.run(tmp / "src" / "nope.raw", target, "smb");
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Path);
    }
}
