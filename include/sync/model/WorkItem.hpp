#pragma once

#include "config/Config.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>

namespace ferry::sync::model {

// One source file on its way to the destination. Owned by the engine thread.
struct WorkItem {
    std::filesystem::path sourcePath;
    std::filesystem::path relativePath;
    std::filesystem::path targetPath;   // relative target for remote channels
    std::filesystem::path backupPath;
    uintmax_t sizeBytes{};
    int priority{};                     // higher first; pending resumes get 1
    unsigned int attemptCount{};
    unsigned int maxAttempts{3};
    std::string lastError;
    std::chrono::system_clock::time_point nextAttemptAt{};
};

// Channels that already delivered the item in dual-write mode.
struct ProtocolState {
    std::set<config::Protocol> succeeded;

    [[nodiscard]] bool done(const config::Protocol p) const { return succeeded.contains(p); }
    [[nodiscard]] bool any() const { return !succeeded.empty(); }
    void markDone(const config::Protocol p) { succeeded.insert(p); }
};

}
