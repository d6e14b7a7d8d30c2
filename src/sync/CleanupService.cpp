#include "sync/CleanupService.hpp"
#include "log/Registry.hpp"
#include "util/disk.hpp"
#include "util/units.hpp"

using namespace ferry::sync;
using namespace ferry::log;
namespace fs = std::filesystem;

CleanupService::CleanupService(config::CleanupConfig cfg, UsageFn usage)
    : AsyncService("CleanupService"), cfg_(std::move(cfg)), usage_(std::move(usage)) {
    if (!usage_) usage_ = [](const fs::path& p) { return util::usedSpacePercent(p); };
}

CleanupService::~CleanupService() {
    stop();
}

std::vector<fs::path> CleanupService::candidates(const std::chrono::system_clock::time_point now) const {
    std::vector<fs::path> out;
    std::error_code ec;
    if (cfg_.folder.empty() || !fs::is_directory(cfg_.folder, ec)) return out;

    const auto cutoff = now - std::chrono::days(cfg_.keep_days);
    for (auto it = fs::recursive_directory_iterator(cfg_.folder, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file(ec)) continue;

        const auto mtime = it->last_write_time(ec);
        if (ec) continue;
        const auto sysTime = std::chrono::file_clock::to_sys(mtime);
        if (sysTime < cutoff) out.push_back(it->path());
    }
    return out;
}

CleanupService::Preview CleanupService::preview() const {
    Preview p;
    std::error_code ec;
    for (const auto& f : candidates()) {
        const auto size = fs::file_size(f, ec);
        if (ec) continue;
        ++p.files;
        p.bytes += size;
    }
    return p;
}

CleanupService::Result CleanupService::runOnce() {
    Result r;
    r.usedPercent = usage_(cfg_.folder);
    if (!r.usedPercent) {
        Registry::archive()->debug("[CleanupService] Cannot measure usage of {}", cfg_.folder.string());
        return r;
    }
    if (*r.usedPercent < static_cast<double>(cfg_.threshold_percent)) return r;

    r.triggered = true;
    Registry::archive()->warn("[CleanupService] {} is {:.1f}% full (threshold {}%), deleting files older than {} days",
                              cfg_.folder.string(), *r.usedPercent, cfg_.threshold_percent, cfg_.keep_days);

    std::error_code ec;
    for (const auto& f : candidates()) {
        if (shouldStop()) break;
        const auto size = fs::file_size(f, ec);
        if (fs::remove(f, ec) && !ec) {
            ++r.deleted;
            r.freedBytes += size;
            Registry::archive()->info("[CleanupService] Deleted {}", f.string());
        } else {
            ++r.errors;
            Registry::archive()->warn("[CleanupService] Failed to delete {}: {}", f.string(), ec.message());
        }
    }

    Registry::archive()->info("[CleanupService] Cleanup finished: {} deleted, {} errors, {:.1f} MB freed",
                              r.deleted, r.errors, util::toMiB(r.freedBytes));
    return r;
}

void CleanupService::runLoop() {
    while (!shouldStop()) {
        try {
            runOnce();
        } catch (const std::exception& e) {
            Registry::archive()->error("[CleanupService] Cleanup pass failed: {}", e.what());
        }
        if (!lazySleep(std::chrono::seconds(cfg_.check_interval_seconds))) break;
    }
}
