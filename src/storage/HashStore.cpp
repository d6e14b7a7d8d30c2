#include "storage/HashStore.hpp"
#include "protocols/Error.hpp"
#include "log/Registry.hpp"
#include "util/digest.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "util/units.hpp"

#include <fstream>
#include <ranges>
#include <vector>
#include <nlohmann/json.hpp>

using namespace ferry::storage;
using namespace ferry::protocols;
using namespace ferry::log;
using ferry::util::operator""_MiB;
namespace fs = std::filesystem;

void ferry::storage::to_json(nlohmann::json& j, const DedupRecord& r) {
    j = {
        {"hash", r.contentHash},
        {"path", r.canonicalPath.string()},
        {"size", r.sizeBytes},
        {"time", util::timestampToString(r.recordedAt)}
    };
}

void ferry::storage::from_json(const nlohmann::json& j, DedupRecord& r) {
    r.contentHash = j.at("hash").get<std::string>();
    r.canonicalPath = j.at("path").get<std::string>();
    r.sizeBytes = j.value("size", uintmax_t{0});
    r.recordedAt = util::parseTimestamp(j.value("time", ""));
}

namespace {

constexpr size_t HASH_BLOCK = 64 * 1024;

ferry::util::DigestAlgorithm toDigest(const ferry::config::HashAlgorithm a) {
    return a == ferry::config::HashAlgorithm::Sha256 ? ferry::util::DigestAlgorithm::Sha256 : ferry::util::DigestAlgorithm::Md5;
}

std::ifstream openForHash(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw TransferError(ErrorKind::Path, "Cannot open " + path.string() + " for hashing");
    return in;
}

}

HashStore::HashStore(fs::path ledgerFile, config::DedupConfig cfg)
    : ledgerFile_(std::move(ledgerFile)), cfg_(cfg) {
    load();
}

std::string HashStore::hash(const fs::path& path, const config::HashAlgorithm algo, const CancelFn& shouldCancel) const {
    auto in = openForHash(path);
    util::Digest digest(toDigest(algo));

    std::vector<char> buf(HASH_BLOCK);
    size_t sinceCheck = 0;
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        digest.update(buf.data(), static_cast<size_t>(in.gcount()));

        sinceCheck += static_cast<size_t>(in.gcount());
        if (sinceCheck >= 1_MiB) {
            sinceCheck = 0;
            if (shouldCancel && shouldCancel()) throw InterruptedError("Hashing of " + path.string() + " interrupted");
        }
    }
    if (in.bad()) throw TransferError(ErrorKind::Path, "Read error while hashing " + path.string());
    return digest.hexFinal();
}

std::string HashStore::quickHash(const fs::path& path) const {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) throw TransferError(classify(ec), "Cannot stat " + path.string() + ": " + ec.message());
    if (size < 1_MiB) return hash(path, config::HashAlgorithm::Md5);

    auto in = openForHash(path);
    util::Digest digest(util::DigestAlgorithm::Md5);
    std::vector<char> buf(1_MiB);

    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    digest.update(buf.data(), static_cast<size_t>(in.gcount()));

    in.seekg(-static_cast<std::streamoff>(1_MiB), std::ios::end);
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    digest.update(buf.data(), static_cast<size_t>(in.gcount()));

    if (in.bad()) throw TransferError(ErrorKind::Path, "Read error while hashing " + path.string());
    return digest.hexFinal();
}

std::string HashStore::contentHash(const fs::path& path, const CancelFn& shouldCancel) const {
    if (cfg_.quick_hash) return quickHash(path);
    return hash(path, cfg_.hash_algorithm, shouldCancel);
}

std::optional<DedupRecord> HashStore::lookup(const std::string& contentHash) {
    std::scoped_lock lock(mutex_);

    const auto it = byHash_.find(contentHash);
    if (it == byHash_.end()) return std::nullopt;

    std::error_code ec;
    if (!fs::exists(it->second.canonicalPath, ec)) {
        Registry::storage()->debug("[HashStore] Evicting {}: {} no longer exists",
                                   contentHash, it->second.canonicalPath.string());
        hashByPath_.erase(it->second.canonicalPath.string());
        byHash_.erase(it);
        save();
        return std::nullopt;
    }
    return it->second;
}

std::optional<fs::path> HashStore::isDuplicate(const fs::path& path) {
    const auto rec = lookup(contentHash(path));
    if (!rec) return std::nullopt;
    return rec->canonicalPath;
}

void HashStore::record(const std::string& contentHash, const fs::path& canonicalPath, const uintmax_t sizeBytes) {
    std::scoped_lock lock(mutex_);

    if (const auto old = byHash_.find(contentHash); old != byHash_.end())
        hashByPath_.erase(old->second.canonicalPath.string());
    if (const auto prev = hashByPath_.find(canonicalPath.string()); prev != hashByPath_.end())
        byHash_.erase(prev->second);

    byHash_[contentHash] = DedupRecord{contentHash, canonicalPath, sizeBytes, std::chrono::system_clock::now()};
    hashByPath_[canonicalPath.string()] = contentHash;
    save();
}

void HashStore::record(const fs::path& path) {
    record(contentHash(path), path, fs::file_size(path));
}

bool HashStore::remove(const fs::path& canonicalPath) {
    std::scoped_lock lock(mutex_);

    const auto it = hashByPath_.find(canonicalPath.string());
    if (it == hashByPath_.end()) return false;
    byHash_.erase(it->second);
    hashByPath_.erase(it);
    save();
    return true;
}

HashStore::Stats HashStore::stats() const {
    std::scoped_lock lock(mutex_);
    Stats s;
    s.records = byHash_.size();
    for (const auto& r : byHash_ | std::views::values) s.totalBytes += r.sizeBytes;
    return s;
}

std::vector<DedupRecord> HashStore::records() const {
    std::scoped_lock lock(mutex_);
    std::vector<DedupRecord> out;
    out.reserve(byHash_.size());
    for (const auto& r : byHash_ | std::views::values) out.push_back(r);
    return out;
}

void HashStore::clear() {
    std::scoped_lock lock(mutex_);
    byHash_.clear();
    hashByPath_.clear();
    std::error_code ec;
    fs::remove(ledgerFile_, ec);
    Registry::storage()->info("[HashStore] Dedup ledger cleared");
}

void HashStore::load() {
    std::error_code ec;
    if (!fs::exists(ledgerFile_, ec)) return;

    try {
        const auto j = nlohmann::json::parse(util::readFileToString(ledgerFile_));
        for (const auto& item : j.at("records")) {
            auto rec = item.get<DedupRecord>();
            hashByPath_[rec.canonicalPath.string()] = rec.contentHash;
            byHash_[rec.contentHash] = std::move(rec);
        }
        Registry::storage()->debug("[HashStore] Loaded {} record(s) from {}", byHash_.size(), ledgerFile_.string());
    } catch (const std::exception& e) {
        Registry::storage()->warn("[HashStore] Ignoring unreadable dedup ledger {}: {}", ledgerFile_.string(), e.what());
        byHash_.clear();
        hashByPath_.clear();
    }
}

void HashStore::save() const {
    nlohmann::json records = nlohmann::json::array();
    for (const auto& r : byHash_ | std::views::values) records.push_back(r);

    const nlohmann::json doc = {
        {"version", "1.0"},
        {"updated_at", util::getCurrentTimestamp()},
        {"records", records}
    };

    try {
        if (ledgerFile_.has_parent_path()) fs::create_directories(ledgerFile_.parent_path());
        util::writeFileAtomic(ledgerFile_, doc.dump(2));
    } catch (const std::exception& e) {
        Registry::storage()->error("[HashStore] Failed to persist dedup ledger: {}", e.what());
    }
}
