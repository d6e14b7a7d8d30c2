#include "storage/ResumableTransfer.hpp"
#include "protocols/Error.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"
#include "util/units.hpp"

#include <cerrno>
#include <fstream>
#include <vector>

using namespace ferry::storage;
using namespace ferry::protocols;
using namespace ferry::log;
using ferry::util::operator""_MiB;
namespace fs = std::filesystem;

namespace {

TransferError ioError(const std::string& what, const fs::path& p) {
    const std::error_code ec(errno, std::generic_category());
    return {classify(ec), what + " " + p.string() + ": " + ec.message()};
}

}

ResumableTransfer::ResumableTransfer(std::shared_ptr<ResumeLedger> ledger, const uintmax_t chunkSize)
    : ledger_(std::move(ledger)), chunkSize_(chunkSize == 0 ? 1_MiB : chunkSize) {
    if (!ledger_) throw std::invalid_argument("ResumableTransfer requires a ledger");
}

ResumableTransfer::Result ResumableTransfer::run(const fs::path& source,
                                                 const fs::path& target,
                                                 const std::string& protocol,
                                                 const ProgressFn& onProgress,
                                                 const CancelFn& shouldCancel,
                                                 util::RateLimiter* limiter) const {
    std::error_code ec;
    const auto total = fs::file_size(source, ec);
    if (ec) throw TransferError(classify(ec), "Cannot stat source " + source.string() + ": " + ec.message());

    TransferRecord rec;
    if (const auto existing = ledger_->getResumeInfo(source, target)) {
        rec = *existing;
    } else {
        fs::remove(util::partialPathFor(target), ec);
        try {
            rec = ledger_->createRecord(source, target, protocol);
        } catch (const std::exception& e) {
            throw fromFilesystem(e, "Failed to create resume record for " + source.string());
        }
    }

    Result result{.bytes = rec.uploadedBytes, .resumedFrom = rec.uploadedBytes};
    if (result.resumedFrom > 0)
        Registry::protocol()->info("[ResumableTransfer] Resuming {} from {:.1f} MB", source.filename().string(),
                                   util::toMiB(result.resumedFrom));

    std::ifstream in(source, std::ios::binary);
    if (!in) throw ioError("Cannot open source", source);
    in.seekg(static_cast<std::streamoff>(rec.uploadedBytes));

    const auto mode = std::ios::binary | (rec.uploadedBytes > 0 ? std::ios::app : std::ios::trunc);
    std::ofstream out(rec.tempPath, mode);
    if (!out) throw ioError("Cannot open temp file", rec.tempPath);

    std::vector<char> buffer(chunkSize_);
    unsigned int nextMilestone = total ? static_cast<unsigned int>(result.bytes * 10 / total) + 1 : 10;
    if (onProgress) onProgress(result.bytes, total);

    while (result.bytes < total) {
        if (shouldCancel && shouldCancel()) {
            out.close();
            ledger_->complete(source, false);
            throw InterruptedError("Transfer of " + source.filename().string() + " interrupted at " +
                                   std::to_string(result.bytes) + "/" + std::to_string(total) + " bytes");
        }

        if (limiter) limiter->chunkStarted();

        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = static_cast<uintmax_t>(in.gcount());
        if (n == 0) throw TransferError(ErrorKind::Path, "Source " + source.string() + " shrank during transfer");

        out.write(buffer.data(), static_cast<std::streamsize>(n));
        out.flush();
        if (!out) throw ioError("Write failed on", rec.tempPath);

        result.bytes += n;
        ledger_->updateProgress(source, result.bytes);
        if (onProgress) onProgress(result.bytes, total);

        if (total && result.bytes * 10 / total >= nextMilestone) {
            nextMilestone = static_cast<unsigned int>(result.bytes * 10 / total) + 1;
            Registry::protocol()->info("[ResumableTransfer] {} {}% ({:.1f}/{:.1f} MB)",
                                       source.filename().string(), result.bytes * 100 / total,
                                       util::toMiB(result.bytes), util::toMiB(total));
        }

        if (limiter) limiter->chunkFinished(n, shouldCancel);
    }

    out.close();
    if (!out) throw ioError("Closing temp file failed", rec.tempPath);

    const auto written = fs::file_size(rec.tempPath, ec);
    if (ec || written != total)
        throw TransferError(ErrorKind::Unknown, "Size mismatch after transfer of " + source.string() + ": " +
                                                std::to_string(written) + " != " + std::to_string(total));

    try {
        if (fs::exists(target)) fs::remove(target);
        fs::rename(rec.tempPath, target);
        util::copyTimes(source, target);
    } catch (const fs::filesystem_error& e) {
        throw fromFilesystem(e, "Failed to finalise " + target.string());
    }

    ledger_->complete(source, true);
    return result;
}
