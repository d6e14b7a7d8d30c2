#include "sync/EventBus.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <ranges>

using namespace ferry::sync;
using namespace ferry::log;

bool EventBus::off(const ListenerId id) {
    std::scoped_lock lock(mutex_);
    for (auto& list : listeners_ | std::views::values) {
        if (std::erase_if(list, [id](const Entry& e) { return e.id == id; }) > 0) return true;
    }
    return false;
}

void EventBus::log(const spdlog::level::level_enum level, const std::string& message) const {
    Registry::sync()->log(level, message);
    emit(model::LogLine{level, message});
}

void EventBus::dispatch(const Entry& entry, const void* event, const char* eventName) {
    try {
        entry.fn(event);
    } catch (const std::exception& e) {
        Registry::sync()->error("[EventBus] Listener {} for {} threw: {}", entry.id, eventName, e.what());
    }
}
