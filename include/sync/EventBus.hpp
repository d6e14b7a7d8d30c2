#pragma once

#include "sync/model/Events.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace ferry::sync {

// Fan-out of engine events to any number of listeners (UI, logger, tests).
// Listeners run synchronously on the emitting thread; one that throws is
// logged and does not affect the others.
class EventBus {
public:
    using ListenerId = uint64_t;

    template <typename Event>
    ListenerId on(std::function<void(const Event&)> listener) {
        const auto id = nextId_.fetch_add(1);
        std::scoped_lock lock(mutex_);
        listeners_[std::type_index(typeid(Event))].push_back(
            {id, [fn = std::move(listener)](const void* e) { fn(*static_cast<const Event*>(e)); }});
        return id;
    }

    bool off(ListenerId id);

    template <typename Event>
    void emit(const Event& event) const {
        std::vector<Entry> snapshot;
        {
            std::scoped_lock lock(mutex_);
            const auto it = listeners_.find(std::type_index(typeid(Event)));
            if (it == listeners_.end()) return;
            snapshot = it->second;
        }
        for (const auto& entry : snapshot) dispatch(entry, &event, typeid(Event).name());
    }

    // Writes to the sync logger and emits a LogLine.
    void log(spdlog::level::level_enum level, const std::string& message) const;

    template <typename... Args>
    void info(fmt::format_string<Args...> f, Args&&... args) const {
        log(spdlog::level::info, fmt::format(f, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> f, Args&&... args) const {
        log(spdlog::level::warn, fmt::format(f, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> f, Args&&... args) const {
        log(spdlog::level::err, fmt::format(f, std::forward<Args>(args)...));
    }

private:
    struct Entry {
        ListenerId id;
        std::function<void(const void*)> fn;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<Entry>> listeners_;
    std::atomic<ListenerId> nextId_{1};

    static void dispatch(const Entry& entry, const void* event, const char* eventName);
};

}
