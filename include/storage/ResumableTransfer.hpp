#pragma once

#include "protocols/types.hpp"
#include "storage/ResumeLedger.hpp"
#include "util/RateLimiter.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace ferry::storage {

// Chunked, restart-safe copy through "<dir>/.<name>.part". The ledger is
// updated after every chunk so a killed process resumes where it left off.
class ResumableTransfer {
public:
    struct Result {
        uintmax_t bytes{};
        uintmax_t resumedFrom{};
    };

    ResumableTransfer(std::shared_ptr<ResumeLedger> ledger, uintmax_t chunkSize);

    // Throws protocols::TransferError; an Interrupted error leaves the temp
    // file and ledger record in place.
    Result run(const std::filesystem::path& source,
               const std::filesystem::path& target,
               const std::string& protocol,
               const protocols::ProgressFn& onProgress = {},
               const protocols::CancelFn& shouldCancel = {},
               util::RateLimiter* limiter = nullptr) const;

private:
    std::shared_ptr<ResumeLedger> ledger_;
    uintmax_t chunkSize_;
};

}
