#include "sync/RetryScheduler.hpp"

#include <algorithm>
#include <ranges>

using namespace ferry::sync;
using ferry::protocols::ErrorKind;

bool RetryPolicy::retryable(const ErrorKind kind) const {
    switch (kind) {
        case ErrorKind::Auth:
        case ErrorKind::Path:
            return false;
        case ErrorKind::Permission:
            return retryPermissionErrors;
        default:
            return true;
    }
}

unsigned int RetryPolicy::ceilingFor(const ErrorKind kind) const {
    if (!retryable(kind)) return 1;
    if (kind == ErrorKind::DiskFull || kind == ErrorKind::Permission)
        return std::max(1u, std::min(maxAttempts, diskFullMaxAttempts));
    return std::max(1u, maxAttempts);
}

std::chrono::seconds RetryPolicy::backoffFor(const unsigned int attempt, const ErrorKind kind) const {
    const auto idx = std::min<size_t>(attempt == 0 ? 0 : attempt - 1, BACKOFF.size() - 1);
    const auto base = BACKOFF[idx];
    return kind == ErrorKind::DiskFull ? base * 2 : base;
}

RetryDecision RetryScheduler::handleFailure(model::WorkItem item, model::ProtocolState state,
                                            const ErrorKind kind, const std::chrono::system_clock::time_point now) {
    std::scoped_lock lock(mutex_);

    const auto key = item.sourcePath.string();
    item.attemptCount += 1;
    item.maxAttempts = policy_.ceilingFor(kind);

    if (item.attemptCount >= item.maxAttempts) {
        entries_.erase(key);
        return {RetryDecision::Kind::PermanentFailure, item.attemptCount, {}};
    }

    item.nextAttemptAt = now + policy_.backoffFor(item.attemptCount, kind);
    const RetryDecision decision{RetryDecision::Kind::Scheduled, item.attemptCount, item.nextAttemptAt};
    entries_[key] = Entry{std::move(item), std::move(state)};
    return decision;
}

void RetryScheduler::requeue(Entry entry) {
    std::scoped_lock lock(mutex_);
    auto key = entry.item.sourcePath.string();
    entries_.insert_or_assign(std::move(key), std::move(entry));
}

std::vector<RetryScheduler::Entry> RetryScheduler::dueItems(const std::chrono::system_clock::time_point now) {
    std::scoped_lock lock(mutex_);

    std::vector<Entry> due;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.item.nextAttemptAt <= now) {
            due.push_back(std::move(it->second));
            it = entries_.erase(it);
        } else ++it;
    }

    std::ranges::sort(due, [](const Entry& a, const Entry& b) {
        return a.item.nextAttemptAt < b.item.nextAttemptAt;
    });
    return due;
}

bool RetryScheduler::contains(const std::filesystem::path& source) const {
    std::scoped_lock lock(mutex_);
    return entries_.contains(source.string());
}

std::optional<RetryScheduler::Entry> RetryScheduler::peek(const std::filesystem::path& source) const {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(source.string());
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

size_t RetryScheduler::size() const {
    std::scoped_lock lock(mutex_);
    return entries_.size();
}

std::optional<std::chrono::system_clock::time_point> RetryScheduler::nextDue() const {
    std::scoped_lock lock(mutex_);
    std::optional<std::chrono::system_clock::time_point> next;
    for (const auto& e : entries_ | std::views::values)
        if (!next || e.item.nextAttemptAt < *next) next = e.item.nextAttemptAt;
    return next;
}

void RetryScheduler::clear() {
    std::scoped_lock lock(mutex_);
    entries_.clear();
}
