#include "storage/ResumeLedger.hpp"
#include "log/Registry.hpp"
#include "util/digest.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>

using namespace ferry::storage;
using namespace ferry::log;
namespace fs = std::filesystem;

ResumeLedger::ResumeLedger(fs::path dir, config::ResumeConfig cfg)
    : dir_(std::move(dir)), cfg_(cfg) {
    fs::create_directories(dir_);
    if (const auto n = purgeExpired(); n > 0)
        Registry::storage()->info("[ResumeLedger] Purged {} expired resume record(s)", n);
}

std::string ResumeLedger::fileIdFor(const fs::path& source) {
    std::error_code ec;
    const auto size = fs::file_size(source, ec);
    if (ec) return util::md5Hex(source.string()).substr(0, 16);

    const auto mtime = fs::last_write_time(source, ec);
    if (ec) return util::md5Hex(source.string()).substr(0, 16);

    const auto id = source.string() + "|" + std::to_string(size) + "|" +
                    std::to_string(mtime.time_since_epoch().count());
    return util::md5Hex(id).substr(0, 16);
}

bool ResumeLedger::shouldResume(const fs::path& source) const {
    std::error_code ec;
    const auto size = fs::file_size(source, ec);
    return !ec && size >= cfg_.threshold_bytes;
}

fs::path ResumeLedger::recordPath(const std::string& fileId) const {
    return dir_ / (fileId + ".resume");
}

std::vector<fs::path> ResumeLedger::recordFiles() const {
    std::vector<fs::path> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir_, ec))
        if (entry.is_regular_file(ec) && entry.path().extension() == ".resume") files.push_back(entry.path());
    return files;
}

std::optional<TransferRecord> ResumeLedger::load(const fs::path& recordFile) const {
    try {
        return nlohmann::json::parse(util::readFileToString(recordFile)).get<TransferRecord>();
    } catch (const std::exception& e) {
        Registry::storage()->warn("[ResumeLedger] Unreadable resume record {}: {}", recordFile.string(), e.what());
        return std::nullopt;
    }
}

void ResumeLedger::save(const TransferRecord& r) const {
    util::writeFileAtomic(recordPath(r.fileId), nlohmann::json(r).dump(2));
}

void ResumeLedger::discard(const std::string& fileId, const fs::path& tempPath) const {
    std::error_code ec;
    if (!tempPath.empty()) fs::remove(tempPath, ec);
    fs::remove(recordPath(fileId), ec);
    if (ec) Registry::storage()->warn("[ResumeLedger] Failed to remove record {}: {}", fileId, ec.message());
}

std::optional<TransferRecord> ResumeLedger::getResumeInfo(const fs::path& source, const fs::path& target) {
    std::scoped_lock lock(mutex_);

    const auto fileId = fileIdFor(source);
    const auto file = recordPath(fileId);
    if (!fs::exists(file)) return std::nullopt;

    const auto rec = load(file);
    if (!rec) {
        discard(fileId, util::partialPathFor(target));
        return std::nullopt;
    }

    auto reject = [&](const std::string& why) -> std::optional<TransferRecord> {
        Registry::storage()->info("[ResumeLedger] Discarding resume record for {}: {}", source.string(), why);
        discard(fileId, rec->tempPath);
        return std::nullopt;
    };

    if (rec->sourcePath != source) return reject("source path changed");
    if (rec->targetPath != target) return reject("target path changed");

    std::error_code ec;
    const auto sourceSize = fs::file_size(source, ec);
    if (ec || sourceSize != rec->totalBytes) return reject("source size changed");

    const auto tempSize = fs::file_size(rec->tempPath, ec);
    if (ec) return reject("temp file missing");
    if (tempSize != rec->uploadedBytes)
        return reject("temp file holds " + std::to_string(tempSize) + " bytes, record says " +
                      std::to_string(rec->uploadedBytes));
    if (rec->uploadedBytes > rec->totalBytes) return reject("record beyond end of file");

    Registry::storage()->info("[ResumeLedger] Resuming {} at {}/{} bytes",
                              source.string(), rec->uploadedBytes, rec->totalBytes);
    return rec;
}

TransferRecord ResumeLedger::createRecord(const fs::path& source, const fs::path& target, const std::string& protocol) {
    std::scoped_lock lock(mutex_);

    TransferRecord r;
    r.fileId = fileIdFor(source);
    r.sourcePath = source;
    r.targetPath = target;
    r.tempPath = util::partialPathFor(target);
    r.totalBytes = fs::file_size(source);
    r.uploadedBytes = 0;
    r.protocol = protocol;
    r.createdAt = r.lastUpdate = std::chrono::system_clock::now();

    save(r);
    Registry::storage()->debug("[ResumeLedger] Created record {} for {} -> {}", r.fileId, source.string(), target.string());
    return r;
}

bool ResumeLedger::updateProgress(const fs::path& source, const uintmax_t uploadedBytes) {
    std::scoped_lock lock(mutex_);

    const auto file = recordPath(fileIdFor(source));
    if (!fs::exists(file)) return false;

    auto rec = load(file);
    if (!rec) return false;

    rec->uploadedBytes = uploadedBytes;
    rec->lastUpdate = std::chrono::system_clock::now();
    try {
        save(*rec);
    } catch (const std::exception& e) {
        Registry::storage()->warn("[ResumeLedger] Failed to persist progress for {}: {}", source.string(), e.what());
        return false;
    }
    return true;
}

void ResumeLedger::complete(const fs::path& source, const bool success) {
    std::scoped_lock lock(mutex_);

    const auto fileId = fileIdFor(source);
    if (success) {
        std::error_code ec;
        fs::remove(recordPath(fileId), ec);
        Registry::storage()->debug("[ResumeLedger] Transfer of {} complete, record {} removed", source.string(), fileId);
    } else {
        Registry::storage()->info("[ResumeLedger] Transfer of {} interrupted, record {} kept", source.string(), fileId);
    }
}

std::vector<TransferRecord> ResumeLedger::pending() {
    std::scoped_lock lock(mutex_);

    std::vector<TransferRecord> out;
    std::error_code ec;
    for (const auto& file : recordFiles()) {
        const auto rec = load(file);
        if (!rec) {
            fs::remove(file, ec);
            continue;
        }
        if (fs::exists(rec->sourcePath, ec)) out.push_back(*rec);
        else discard(file.stem().string(), rec->tempPath);
    }
    return out;
}

size_t ResumeLedger::purgeExpired() {
    std::scoped_lock lock(mutex_);

    const auto cutoff = std::chrono::system_clock::now() - std::chrono::days(cfg_.expiry_days);
    size_t purged = 0;
    std::error_code ec;
    for (const auto& file : recordFiles()) {
        const auto rec = load(file);
        if (!rec) {
            fs::remove(file, ec);
            ++purged;
            continue;
        }
        if (rec->lastUpdate < cutoff) {
            discard(file.stem().string(), rec->tempPath);
            ++purged;
        }
    }
    return purged;
}
