#pragma once

#include "config/Config.hpp"
#include "protocols/types.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ferry::storage {

struct DedupRecord {
    std::string contentHash;
    std::filesystem::path canonicalPath;
    uintmax_t sizeBytes{};
    std::chrono::system_clock::time_point recordedAt;
};

void to_json(nlohmann::json& j, const DedupRecord& r);
void from_json(const nlohmann::json& j, DedupRecord& r);

// Content hash -> canonical uploaded location, persisted as a single JSON
// ledger. A missing or corrupt ledger loads as an empty store.
class HashStore {
public:
    struct Stats {
        size_t records{};
        uintmax_t totalBytes{};
    };

    HashStore(std::filesystem::path ledgerFile, config::DedupConfig cfg);

    // Full-file digest. shouldCancel is polled every block and raises an
    // Interrupted TransferError.
    [[nodiscard]] std::string hash(const std::filesystem::path& path,
                                   config::HashAlgorithm algo,
                                   const protocols::CancelFn& shouldCancel = {}) const;

    // md5 over the first and last 1 MiB for files >= 1 MiB, the whole file otherwise.
    [[nodiscard]] std::string quickHash(const std::filesystem::path& path) const;

    // The identity used for lookups: quickHash in quick mode, else hash(cfg algorithm).
    [[nodiscard]] std::string contentHash(const std::filesystem::path& path,
                                          const protocols::CancelFn& shouldCancel = {}) const;

    // Evicts and misses when the canonical file no longer exists.
    std::optional<DedupRecord> lookup(const std::string& contentHash);

    std::optional<std::filesystem::path> isDuplicate(const std::filesystem::path& path);

    void record(const std::string& contentHash, const std::filesystem::path& canonicalPath, uintmax_t sizeBytes);
    void record(const std::filesystem::path& path);

    bool remove(const std::filesystem::path& canonicalPath);

    [[nodiscard]] Stats stats() const;
    [[nodiscard]] std::vector<DedupRecord> records() const;
    void clear();

    [[nodiscard]] const config::DedupConfig& settings() const { return cfg_; }

private:
    std::filesystem::path ledgerFile_;
    config::DedupConfig cfg_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, DedupRecord> byHash_;
    std::unordered_map<std::string, std::string> hashByPath_;

    void load();
    void save() const;
};

}
