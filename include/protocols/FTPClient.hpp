#pragma once

#include "protocols/ProtocolClient.hpp"
#include "util/curlWrappers.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ferry::protocols {

// Outbound FTP/FTPS channel on a single libcurl easy handle. Calls are
// serialised on an internal mutex; the handle keeps the control connection
// alive between requests.
class FTPClient final : public ProtocolClient {
public:
    FTPClient(config::FTPClientConfig cfg, ClientOptions opts);
    ~FTPClient() override;

    // Retries with 5s/10s/15s waits. Auth failures are not retried.
    void connect(const CancelFn& shouldCancel = {}) override;
    void disconnect() override;
    [[nodiscard]] bool isConnected() const override { return connected_.load(); }

    void uploadFile(const std::filesystem::path& local,
                    const std::string& remote,
                    const ProgressFn& onProgress = {},
                    const CancelFn& shouldCancel = {}) override;

    // Walks the path segment by segment, CWD first and MKD on failure.
    void ensureDirectory(const std::string& remote) override;
    bool exists(const std::string& remote) override;
    void remove(const std::string& remote) override;

    [[nodiscard]] std::string remotePathFor(const std::filesystem::path& relative) const override;
    [[nodiscard]] std::string parentOf(const std::string& remote) const override;

    [[nodiscard]] config::Protocol protocol() const override { return config::Protocol::FtpClient; }

    // Connects, lists the remote root and disconnects.
    std::vector<std::string> testConnection();

    [[nodiscard]] const config::FTPClientConfig& settings() const { return cfg_; }

    static std::string joinRemote(const std::string& base, const std::string& rel);

private:
    config::FTPClientConfig cfg_;
    ClientOptions opts_;

    std::mutex mutex_;
    std::unique_ptr<util::CurlEasy> curl_;
    std::atomic<bool> connected_{false};
    char errbuf_[CURL_ERROR_SIZE]{};

    [[nodiscard]] std::string url(const std::string& remotePath, bool asDirectory = false) const;

    void prepare();   // reset + common options; mutex_ held
    CURLcode perform();
    [[nodiscard]] long responseCode();
    [[noreturn]] void fail(CURLcode rc, const std::string& context);

    bool directoryExists(const std::string& dir);
    void probeRoot();
    std::vector<std::string> listRoot();
};

}
