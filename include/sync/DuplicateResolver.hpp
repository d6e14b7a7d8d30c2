#pragma once

#include "config/Config.hpp"
#include "protocols/types.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ferry::sync {

// Posted to the registered handler when the "ask" strategy meets a duplicate.
// The handler may answer on any thread; the first answer wins.
class DuplicatePrompt {
public:
    DuplicatePrompt(std::string file, std::string duplicate)
        : file(std::move(file)), duplicate(std::move(duplicate)) {}

    const std::string file;
    const std::string duplicate;

    void answer(config::DuplicateStrategy choice, bool applyAll = false);

    // Waits up to d for an answer; false on timeout.
    bool waitFor(std::chrono::milliseconds d);

    [[nodiscard]] std::optional<std::pair<config::DuplicateStrategy, bool>> response() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<std::pair<config::DuplicateStrategy, bool>> answer_;
};

class DuplicateResolver {
public:
    using Handler = std::function<void(std::shared_ptr<DuplicatePrompt>)>;

    explicit DuplicateResolver(std::chrono::seconds timeout = std::chrono::seconds(120)) : timeout_(timeout) {}

    void setHandler(Handler handler);

    // Blocks until answered, timed out or stopped. Timeout, stop and a missing
    // handler all resolve to Skip. Never returns Ask.
    config::DuplicateStrategy resolve(const std::string& file,
                                      const std::string& duplicate,
                                      const protocols::CancelFn& shouldStop = {});

    // Forget an "apply to all" answer (called when a new session starts).
    void resetSession();

    [[nodiscard]] std::optional<config::DuplicateStrategy> remembered() const;

private:
    std::chrono::seconds timeout_;
    mutable std::mutex mutex_;
    Handler handler_;
    std::optional<config::DuplicateStrategy> applyAll_;
};

}
