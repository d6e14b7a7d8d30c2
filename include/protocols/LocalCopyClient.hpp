#pragma once

#include "protocols/ProtocolClient.hpp"
#include "storage/ResumeLedger.hpp"
#include "util/RateLimiter.hpp"

#include <memory>

namespace ferry::protocols {

// Filesystem destination (local disk or a mounted SMB share).
class LocalCopyClient final : public ProtocolClient {
public:
    LocalCopyClient(std::filesystem::path root, ClientOptions opts,
                    std::shared_ptr<storage::ResumeLedger> ledger = nullptr);

    void connect(const CancelFn& shouldCancel = {}) override;
    void disconnect() override { connected_ = false; }
    [[nodiscard]] bool isConnected() const override { return connected_; }

    void uploadFile(const std::filesystem::path& local,
                    const std::string& remote,
                    const ProgressFn& onProgress = {},
                    const CancelFn& shouldCancel = {}) override;

    void ensureDirectory(const std::string& remote) override;
    bool exists(const std::string& remote) override;
    void remove(const std::string& remote) override;

    [[nodiscard]] std::string remotePathFor(const std::filesystem::path& relative) const override;
    [[nodiscard]] std::string parentOf(const std::string& remote) const override;

    [[nodiscard]] config::Protocol protocol() const override { return config::Protocol::Smb; }
    [[nodiscard]] bool supportsDedup() const override { return true; }

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    ClientOptions opts_;
    std::shared_ptr<storage::ResumeLedger> ledger_;
    util::RateLimiter limiter_;
    bool connected_ = false;

    void streamCopy(const std::filesystem::path& local, const std::filesystem::path& dest,
                    const ProgressFn& onProgress, const CancelFn& shouldCancel);
};

}
