#pragma once

#include <functional>
#include <future>
#include <type_traits>

namespace ferry::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// Wraps a callable and reports its result (or exception) through a future.
template <typename R>
struct PromisedTask : Task {
    std::promise<R> promise;
    std::function<R()> fn;

    explicit PromisedTask(std::function<R()> f) : fn(std::move(f)) {}

    std::future<R> getFuture() { return promise.get_future(); }

    void operator()() override {
        try {
            if constexpr (std::is_void_v<R>) {
                fn();
                promise.set_value();
            } else {
                promise.set_value(fn());
            }
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }
};

}
