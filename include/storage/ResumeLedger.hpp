#pragma once

#include "config/Config.hpp"
#include "storage/TransferRecord.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ferry::storage {

// Persists one "<fileId>.resume" JSON document per large transfer in flight.
// All methods are safe to call from multiple workers.
class ResumeLedger {
public:
    explicit ResumeLedger(std::filesystem::path dir, config::ResumeConfig cfg = {});

    [[nodiscard]] bool shouldResume(const std::filesystem::path& source) const;

    // Returns a record only when it can be trusted: same source and target,
    // unchanged source size and a temp file whose size equals uploadedBytes.
    // Anything else is discarded together with its temp file.
    std::optional<TransferRecord> getResumeInfo(const std::filesystem::path& source,
                                                const std::filesystem::path& target);

    TransferRecord createRecord(const std::filesystem::path& source,
                                const std::filesystem::path& target,
                                const std::string& protocol);

    bool updateProgress(const std::filesystem::path& source, uintmax_t uploadedBytes);

    // success drops the record; failure keeps it as the next run's resume point.
    void complete(const std::filesystem::path& source, bool success);

    // Records whose source still exists. Records for vanished sources are removed.
    std::vector<TransferRecord> pending();

    size_t purgeExpired();

    [[nodiscard]] uintmax_t threshold() const { return cfg_.threshold_bytes; }
    [[nodiscard]] const std::filesystem::path& dir() const { return dir_; }

    // md5("path|size|mtime"), first 16 hex chars.
    static std::string fileIdFor(const std::filesystem::path& source);

private:
    std::filesystem::path dir_;
    config::ResumeConfig cfg_;
    mutable std::mutex mutex_;

    [[nodiscard]] std::filesystem::path recordPath(const std::string& fileId) const;
    [[nodiscard]] std::vector<std::filesystem::path> recordFiles() const;
    std::optional<TransferRecord> load(const std::filesystem::path& recordFile) const;
    void save(const TransferRecord& r) const;
    void discard(const std::string& fileId, const std::filesystem::path& tempPath) const;
};

}
