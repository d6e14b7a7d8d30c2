#pragma once

#include "concurrency/AsyncService.hpp"
#include "sync/EventBus.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <mutex>
#include <utility>

namespace ferry::sync {

// Moves uploaded sources into the backup tree (or deletes them when backup is
// off or its parent is unreachable) on a dedicated thread, so an archive
// backlog never blocks uploads.
class ArchiveWorker : public concurrency::AsyncService {
public:
    ArchiveWorker(bool enableBackup, std::filesystem::path backupRoot, EventBus& bus);
    ~ArchiveWorker() override;

    void enqueue(std::filesystem::path source, std::filesystem::path backup);

    // Waits until the queue is empty and nothing is in progress; false on timeout.
    bool drain(std::chrono::milliseconds timeout);

    [[nodiscard]] size_t pending() const;

    // Archives one file on the calling thread. Returns false when it failed.
    bool archive(const std::filesystem::path& source, const std::filesystem::path& backup);

protected:
    void runLoop() override;

private:
    bool enableBackup_;
    std::filesystem::path backupRoot_;
    EventBus& bus_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    std::deque<std::pair<std::filesystem::path, std::filesystem::path>> queue_;
    bool busy_ = false;

    [[nodiscard]] bool backupAvailable() const;
};

}
