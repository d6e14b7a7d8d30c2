#include "protocols/LocalCopyClient.hpp"
#include "protocols/Error.hpp"
#include "storage/ResumableTransfer.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

#include <cerrno>
#include <fstream>
#include <vector>

using namespace ferry::protocols;
using namespace ferry::log;
namespace fs = std::filesystem;

LocalCopyClient::LocalCopyClient(fs::path root, const ClientOptions opts, std::shared_ptr<storage::ResumeLedger> ledger)
    : root_(std::move(root)), opts_(opts), ledger_(std::move(ledger)), limiter_(opts.maxBytesPerSecond) {
    if (opts_.chunkSize == 0) opts_.chunkSize = config::DEFAULT_CHUNK_SIZE_BYTES;
}

void LocalCopyClient::connect(const CancelFn&) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        fs::create_directories(root_, ec);
        if (ec) throw TransferError(classify(ec), "Target folder " + root_.string() + " unavailable: " + ec.message());
    }
    connected_ = true;
}

void LocalCopyClient::uploadFile(const fs::path& local, const std::string& remote,
                                 const ProgressFn& onProgress, const CancelFn& shouldCancel) {
    const fs::path dest(remote);
    ensureDirectory(parentOf(remote));

    if (ledger_ && ledger_->shouldResume(local)) {
        storage::ResumableTransfer transfer(ledger_, opts_.chunkSize);
        transfer.run(local, dest, config::to_string(protocol()), onProgress, shouldCancel,
                     limiter_.enabled() ? &limiter_ : nullptr);
        return;
    }

    streamCopy(local, dest, onProgress, shouldCancel);
}

void LocalCopyClient::streamCopy(const fs::path& local, const fs::path& dest,
                                 const ProgressFn& onProgress, const CancelFn& shouldCancel) {
    std::error_code ec;
    const auto total = fs::file_size(local, ec);
    if (ec) throw TransferError(classify(ec), "Cannot stat source " + local.string() + ": " + ec.message());

    std::ifstream in(local, std::ios::binary);
    if (!in) throw TransferError(ErrorKind::Path, "Cannot open source " + local.string());

    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) {
        const std::error_code oec(errno, std::generic_category());
        throw TransferError(oec ? classify(oec) : ErrorKind::Permission,
                            "Cannot create " + dest.string() + ": " + oec.message());
    }

    auto abandon = [&] {
        out.close();
        fs::remove(dest, ec);
    };

    std::vector<char> buffer(opts_.chunkSize);
    uintmax_t copied = 0;
    if (onProgress) onProgress(0, total);

    while (copied < total) {
        if (shouldCancel && shouldCancel()) {
            abandon();
            throw InterruptedError("Copy of " + local.filename().string() + " interrupted");
        }

        if (limiter_.enabled()) limiter_.chunkStarted();

        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = static_cast<uintmax_t>(in.gcount());
        if (n == 0) {
            abandon();
            throw TransferError(ErrorKind::Path, "Source " + local.string() + " shrank during copy");
        }

        out.write(buffer.data(), static_cast<std::streamsize>(n));
        if (!out) {
            const std::error_code wec(errno, std::generic_category());
            abandon();
            throw TransferError(classify(wec), "Write failed on " + dest.string() + ": " + wec.message());
        }

        copied += n;
        if (onProgress) onProgress(copied, total);
        limiter_.chunkFinished(n, shouldCancel);
    }

    out.close();
    if (!out) {
        fs::remove(dest, ec);
        throw TransferError(ErrorKind::Unknown, "Failed to close " + dest.string());
    }

    try {
        util::copyTimes(local, dest);
    } catch (const fs::filesystem_error& e) {
        Registry::protocol()->debug("[LocalCopyClient] Could not copy mtime to {}: {}", dest.string(), e.what());
    }
}

void LocalCopyClient::ensureDirectory(const std::string& remote) {
    if (remote.empty()) return;
    std::error_code ec;
    if (fs::is_directory(remote, ec)) return;
    fs::create_directories(remote, ec);
    if (ec && !fs::is_directory(remote)) {
        auto kind = classify(ec);
        if (kind == ErrorKind::Unknown) kind = ErrorKind::Path;
        throw TransferError(kind, "Cannot create directory " + remote + ": " + ec.message());
    }
}

bool LocalCopyClient::exists(const std::string& remote) {
    std::error_code ec;
    const bool found = fs::exists(remote, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        throw TransferError(classify(ec), "Cannot check " + remote + ": " + ec.message());
    return found;
}

void LocalCopyClient::remove(const std::string& remote) {
    std::error_code ec;
    fs::remove(remote, ec);
    if (ec) throw TransferError(classify(ec), "Cannot remove " + remote + ": " + ec.message());
}

std::string LocalCopyClient::remotePathFor(const fs::path& relative) const {
    return (root_ / relative).string();
}

std::string LocalCopyClient::parentOf(const std::string& remote) const {
    return fs::path(remote).parent_path().string();
}
