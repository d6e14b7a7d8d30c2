#pragma once

#include "config/Config.hpp"
#include "protocols/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace ferry::protocols {

struct ClientOptions {
    uintmax_t chunkSize = config::DEFAULT_CHUNK_SIZE_BYTES;
    uint64_t maxBytesPerSecond = 0;    // 0 = unthrottled
};

// One destination channel. Every failure surfaces as TransferError; a cancel
// request observed mid-transfer surfaces as ErrorKind::Interrupted.
// Instances are not shared between concurrent uploads.
class ProtocolClient {
public:
    virtual ~ProtocolClient() = default;

    virtual void connect(const CancelFn& shouldCancel = {}) = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool isConnected() const = 0;

    virtual void uploadFile(const std::filesystem::path& local,
                            const std::string& remote,
                            const ProgressFn& onProgress = {},
                            const CancelFn& shouldCancel = {}) = 0;

    virtual void ensureDirectory(const std::string& remote) = 0;
    virtual bool exists(const std::string& remote) = 0;
    virtual void remove(const std::string& remote) = 0;

    // Destination location for a path relative to the source root.
    [[nodiscard]] virtual std::string remotePathFor(const std::filesystem::path& relative) const = 0;

    [[nodiscard]] virtual std::string parentOf(const std::string& remote) const = 0;

    [[nodiscard]] virtual config::Protocol protocol() const = 0;

    [[nodiscard]] virtual bool supportsDedup() const { return false; }
};

}
