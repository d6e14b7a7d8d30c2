#include <gtest/gtest.h>
#include "protocols/Error.hpp"
#include "protocols/FTPClient.hpp"

#include <chrono>

using namespace ferry::protocols;
using namespace std::chrono_literals;

namespace {

ferry::config::FTPClientConfig unreachable() {
    ferry::config::FTPClientConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 1;   // nothing listens here
    cfg.timeout_seconds = 2;
    cfg.retry_count = 1;
    return cfg;
}

}

TEST(FTPClientTest, JoinRemoteNormalisesSlashes) {
    EXPECT_EQ(FTPClient::joinRemote("/upload", "a/b.jpg"), "/upload/a/b.jpg");
    EXPECT_EQ(FTPClient::joinRemote("upload/", "/a//b.jpg"), "/upload/a/b.jpg");
    EXPECT_EQ(FTPClient::joinRemote("", "b.jpg"), "/b.jpg");
    EXPECT_EQ(FTPClient::joinRemote("/", "./x/b.jpg"), "/x/b.jpg");
}

TEST(FTPClientTest, RemotePathsUseConfiguredRoot) {
    auto cfg = unreachable();
    cfg.remote_path = "/photos";
    FTPClient client(cfg, {});

    EXPECT_EQ(client.remotePathFor("2024/05/a.jpg"), "/photos/2024/05/a.jpg");
    EXPECT_EQ(client.parentOf("/photos/2024/05/a.jpg"), "/photos/2024/05");
    EXPECT_EQ(client.parentOf("/a.jpg"), "/");
    EXPECT_EQ(client.protocol(), ferry::config::Protocol::FtpClient);
    EXPECT_FALSE(client.supportsDedup());
    EXPECT_EQ(client.settings().port, 1);
}

TEST(FTPClientTest, MissingHostIsAPathError) {
    auto cfg = unreachable();
    cfg.host.clear();
    FTPClient client(cfg, {});
    try {
        client.connect();
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Path);
    }
}

TEST(FTPClientTest, RefusedConnectionIsANetworkError) {
    FTPClient client(unreachable(), {});
    try {
        client.connect();
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Network);
    }
    EXPECT_FALSE(client.isConnected());
}

TEST(FTPClientTest, CancelDuringBackoffInterrupts) {
    auto cfg = unreachable();
    cfg.retry_count = 3;
    FTPClient client(cfg, {});

    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_THROW(client.connect([] { return true; }), InterruptedError);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 4s);
}

TEST(FTPClientTest, ConnectionTestReportsUnreachableServer) {
    FTPClient client(unreachable(), {});
    try {
        (void)client.testConnection();
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Network);
        EXPECT_FALSE(hint(e.kind()).empty());
    }
    EXPECT_FALSE(client.isConnected());
}
