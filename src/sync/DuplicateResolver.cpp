#include "sync/DuplicateResolver.hpp"
#include "log/Registry.hpp"

using namespace ferry::sync;
using namespace ferry::log;
using ferry::config::DuplicateStrategy;

void DuplicatePrompt::answer(const DuplicateStrategy choice, const bool applyAll) {
    {
        std::scoped_lock lock(mutex_);
        if (answer_) return;
        answer_ = std::make_pair(choice, applyAll);
    }
    cv_.notify_all();
}

bool DuplicatePrompt::waitFor(const std::chrono::milliseconds d) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, d, [this] { return answer_.has_value(); });
}

std::optional<std::pair<DuplicateStrategy, bool>> DuplicatePrompt::response() const {
    std::scoped_lock lock(mutex_);
    return answer_;
}

void DuplicateResolver::setHandler(Handler handler) {
    std::scoped_lock lock(mutex_);
    handler_ = std::move(handler);
}

DuplicateStrategy DuplicateResolver::resolve(const std::string& file, const std::string& duplicate,
                                             const protocols::CancelFn& shouldStop) {
    Handler handler;
    {
        std::scoped_lock lock(mutex_);
        if (applyAll_) return *applyAll_;
        handler = handler_;
    }

    if (!handler) {
        Registry::sync()->info("[DuplicateResolver] No prompt handler registered, skipping {}", file);
        return DuplicateStrategy::Skip;
    }

    const auto prompt = std::make_shared<DuplicatePrompt>(file, duplicate);
    handler(prompt);

    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    while (!prompt->response()) {
        if (shouldStop && shouldStop()) {
            Registry::sync()->info("[DuplicateResolver] Stop requested while asking about {}, skipping", file);
            return DuplicateStrategy::Skip;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            Registry::sync()->info("[DuplicateResolver] No answer for {} within {}s, skipping", file, timeout_.count());
            return DuplicateStrategy::Skip;
        }
        prompt->waitFor(std::chrono::milliseconds(100));
    }

    auto [choice, applyAll] = *prompt->response();
    if (choice == DuplicateStrategy::Ask) choice = DuplicateStrategy::Skip;

    if (applyAll) {
        std::scoped_lock lock(mutex_);
        applyAll_ = choice;
        Registry::sync()->info("[DuplicateResolver] Applying '{}' to all further duplicates", config::to_string(choice));
    }
    return choice;
}

void DuplicateResolver::resetSession() {
    std::scoped_lock lock(mutex_);
    applyAll_.reset();
}

std::optional<DuplicateStrategy> DuplicateResolver::remembered() const {
    std::scoped_lock lock(mutex_);
    return applyAll_;
}
