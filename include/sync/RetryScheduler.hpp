#pragma once

#include "protocols/Error.hpp"
#include "sync/model/WorkItem.hpp"

#include <array>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ferry::sync {

struct RetryPolicy {
    // Fixed table, not exponential: attempt 1 waits 10s, 2 waits 30s, 3+ waits 60s.
    static constexpr std::array<std::chrono::seconds, 3> BACKOFF = {
        std::chrono::seconds(10), std::chrono::seconds(30), std::chrono::seconds(60)};

    unsigned int maxAttempts = 3;
    unsigned int diskFullMaxAttempts = 2;
    bool retryPermissionErrors = false;

    [[nodiscard]] bool retryable(protocols::ErrorKind kind) const;
    [[nodiscard]] unsigned int ceilingFor(protocols::ErrorKind kind) const;
    [[nodiscard]] std::chrono::seconds backoffFor(unsigned int attempt, protocols::ErrorKind kind) const;
};

struct RetryDecision {
    enum class Kind { Scheduled, PermanentFailure };

    Kind kind;
    unsigned int attempt{};
    std::chrono::system_clock::time_point nextAttemptAt{};
};

class RetryScheduler {
public:
    struct Entry {
        model::WorkItem item;
        model::ProtocolState state;
    };

    explicit RetryScheduler(RetryPolicy policy = {}) : policy_(policy) {}

    // Bumps attemptCount and either schedules the item or drops it as permanently failed.
    RetryDecision handleFailure(model::WorkItem item,
                                model::ProtocolState state,
                                protocols::ErrorKind kind,
                                std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Puts an entry back untouched: no attempt is counted and nextAttemptAt is kept.
    void requeue(Entry entry);

    // Removes and returns every entry whose nextAttemptAt has passed, earliest first.
    std::vector<Entry> dueItems(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    [[nodiscard]] bool contains(const std::filesystem::path& source) const;
    [[nodiscard]] std::optional<Entry> peek(const std::filesystem::path& source) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> nextDue() const;
    void clear();

    [[nodiscard]] const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

}
