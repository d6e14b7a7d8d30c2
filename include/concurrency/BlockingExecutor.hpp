#pragma once

#include "concurrency/ThreadPool.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <type_traits>

namespace ferry::concurrency {

// Small pool for filesystem/network calls that may hang (stat on a dead SMB
// mount, a stuck FTP socket). Callers wait with a timeout and treat expiry as
// a retryable failure; the stuck call keeps its worker until it returns.
class BlockingExecutor {
public:
    explicit BlockingExecutor(unsigned int workers = 3) : pool_(workers, "BlockingExecutor") {}

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<PromisedTask<R>>(std::function<R()>(std::forward<F>(fn)));
        auto fut = task->getFuture();
        pool_.submit(task);
        return fut;
    }

    // nullopt on timeout; exceptions thrown by fn are rethrown here.
    template <typename F>
    auto run(F&& fn, const std::chrono::milliseconds timeout) -> std::optional<std::invoke_result_t<F>> {
        static_assert(!std::is_void_v<std::invoke_result_t<F>>, "run() needs a value-returning callable");
        auto fut = submit(std::forward<F>(fn));
        if (fut.wait_for(timeout) != std::future_status::ready) return std::nullopt;
        return fut.get();
    }

    void shutdown(const std::chrono::milliseconds grace = std::chrono::milliseconds(1200)) { pool_.stop(grace); }

private:
    ThreadPool pool_;
};

}
