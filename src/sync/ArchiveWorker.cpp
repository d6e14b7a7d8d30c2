#include "sync/ArchiveWorker.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

using namespace ferry::sync;
using namespace ferry::log;
namespace fs = std::filesystem;

ArchiveWorker::ArchiveWorker(const bool enableBackup, fs::path backupRoot, EventBus& bus)
    : AsyncService("ArchiveWorker"), enableBackup_(enableBackup), backupRoot_(std::move(backupRoot)), bus_(bus) {}

ArchiveWorker::~ArchiveWorker() {
    stop();
}

void ArchiveWorker::enqueue(fs::path source, fs::path backup) {
    {
        std::scoped_lock lock(mutex_);
        queue_.emplace_back(std::move(source), std::move(backup));
    }
    cv_.notify_one();
}

size_t ArchiveWorker::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_.size() + (busy_ ? 1 : 0);
}

bool ArchiveWorker::drain(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return queue_.empty() && !busy_; });
}

bool ArchiveWorker::backupAvailable() const {
    if (!enableBackup_ || backupRoot_.empty()) return false;
    std::error_code ec;
    const auto parent = backupRoot_.has_parent_path() ? backupRoot_.parent_path() : backupRoot_;
    return fs::exists(parent, ec);
}

bool ArchiveWorker::archive(const fs::path& source, const fs::path& backup) {
    std::error_code ec;
    if (!fs::exists(source, ec)) return true;

    try {
        if (backupAvailable()) {
            fs::create_directories(backup.parent_path());
            const auto dest = util::uniqueName(backup);

            fs::rename(source, dest, ec);
            if (ec) {
                // Cross-device: copy then remove.
                fs::copy_file(source, dest, fs::copy_options::overwrite_existing);
                util::copyTimes(source, dest);
                fs::remove(source);
            }
            Registry::archive()->info("[ArchiveWorker] Archived {} -> {}", source.filename().string(), dest.string());
            bus_.info("Archived: {}", dest.filename().string());
        } else {
            if (enableBackup_)
                Registry::archive()->warn("[ArchiveWorker] Backup folder {} unavailable, deleting source instead",
                                          backupRoot_.string());
            fs::remove(source);
            Registry::archive()->info("[ArchiveWorker] Deleted {}", source.string());
            bus_.info("Deleted: {}", source.filename().string());
        }
    } catch (const std::exception& e) {
        bus_.error("Archive failed for {}: {}", source.filename().string(), e.what());
        return false;
    }
    return true;
}

void ArchiveWorker::runLoop() {
    while (true) {
        std::pair<fs::path, fs::path> job;
        {
            std::unique_lock lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(200), [this] { return !queue_.empty() || shouldStop(); });
            if (queue_.empty()) {
                if (shouldStop()) break;
                continue;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        archive(job.first, job.second);

        {
            std::scoped_lock lock(mutex_);
            busy_ = false;
        }
        idleCv_.notify_all();
    }
    idleCv_.notify_all();
}
