#include <gtest/gtest.h>
#include "TestFs.hpp"
#include "protocols/Error.hpp"
#include "protocols/LocalCopyClient.hpp"
#include "util/files.hpp"

using namespace ferry::protocols;
using namespace ferry::test;
namespace fs = std::filesystem;

class LocalCopyClientTest : public ::testing::Test {
protected:
    TempDir tmp;
    fs::path root;
    ClientOptions opts;

    void SetUp() override {
        root = tmp / "share";
        opts.chunkSize = 1024;
    }

    fs::path source(const std::string& name, const size_t size) const {
        const auto p = tmp / "src" / name;
        writeBytes(p, randomBytes(size, static_cast<unsigned int>(size)));
        return p;
    }
};

TEST_F(LocalCopyClientTest, ConnectCreatesMissingRoot) {
    LocalCopyClient client(root, opts);
    EXPECT_FALSE(client.isConnected());
    client.connect();
    EXPECT_TRUE(client.isConnected());
    EXPECT_TRUE(fs::is_directory(root));
    client.disconnect();
    EXPECT_FALSE(client.isConnected());
}

TEST_F(LocalCopyClientTest, UploadCopiesBytesAndMtime) {
    LocalCopyClient client(root, opts);
    client.connect();

    const auto src = source("a.jpg", 5000);
    const auto remote = client.remotePathFor("2024/05/a.jpg");

    std::vector<uintmax_t> progress;
    client.uploadFile(src, remote, [&](const uintmax_t done, uintmax_t) { progress.push_back(done); });

    EXPECT_EQ(readBytes(remote), readBytes(src));
    EXPECT_EQ(fs::last_write_time(remote), fs::last_write_time(src));
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.front(), 0u);
    EXPECT_EQ(progress.back(), 5000u);
}

TEST_F(LocalCopyClientTest, CancelRemovesPartialCopy) {
    LocalCopyClient client(root, opts);
    client.connect();

    const auto src = source("b.jpg", 8000);
    const auto remote = client.remotePathFor("b.jpg");

    int calls = 0;
    try {
        client.uploadFile(src, remote, [&](uintmax_t, uintmax_t) { ++calls; }, [&] { return calls >= 3; });
        FAIL() << "expected an interruption";
    } catch (const TransferError& e) {
        EXPECT_TRUE(e.interrupted());
    }
    EXPECT_FALSE(fs::exists(remote));
}

TEST_F(LocalCopyClientTest, LargeFilesGoThroughTheResumeLedger) {
    ferry::config::ResumeConfig rc;
    rc.threshold_bytes = 2048;
    auto ledger = std::make_shared<ferry::storage::ResumeLedger>(tmp / "resume_data", rc);
    LocalCopyClient client(root, opts, ledger);
    client.connect();

    const auto src = source("big.raw", 10000);
    const auto remote = client.remotePathFor("big.raw");

    int calls = 0;
    EXPECT_THROW(client.uploadFile(src, remote, [&](uintmax_t, uintmax_t) { ++calls; }, [&] { return calls >= 4; }),
                 InterruptedError);
    EXPECT_TRUE(fs::exists(ferry::util::partialPathFor(remote)));
    EXPECT_EQ(ledger->pending().size(), 1u);

    client.uploadFile(src, remote);
    EXPECT_EQ(readBytes(remote), readBytes(src));
    EXPECT_TRUE(ledger->pending().empty());
}

TEST_F(LocalCopyClientTest, MissingSourceIsAPathError) {
    LocalCopyClient client(root, opts);
    client.connect();
    try {
        client.uploadFile(tmp / "src" / "gone.jpg", client.remotePathFor("gone.jpg"));
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Path);
    }
}

TEST_F(LocalCopyClientTest, ExistsAndRemove) {
    LocalCopyClient client(root, opts);
    client.connect();

    const auto remote = client.remotePathFor("x/y.jpg");
    EXPECT_FALSE(client.exists(remote));

    client.ensureDirectory(client.parentOf(remote));
    EXPECT_TRUE(fs::is_directory(root / "x"));

    writeBytes(remote, "data");
    EXPECT_TRUE(client.exists(remote));
    client.remove(remote);
    EXPECT_FALSE(client.exists(remote));
}

TEST_F(LocalCopyClientTest, RemotePathsAreUnderRoot) {
    LocalCopyClient client(root, opts);
    EXPECT_EQ(client.remotePathFor("a/b.jpg"), (root / "a" / "b.jpg").string());
    EXPECT_EQ(client.parentOf((root / "a" / "b.jpg").string()), (root / "a").string());
    EXPECT_TRUE(client.supportsDedup());
    EXPECT_EQ(client.protocol(), ferry::config::Protocol::Smb);
}
