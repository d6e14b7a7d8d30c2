#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace ferry::concurrency;
using namespace ferry::log;

ThreadPool::ThreadPool(const unsigned int nThreads, std::string name)
    : name_(std::move(name)), state_(std::make_shared<State>()) {
    for (unsigned int i = 0; i < std::max(1u, nThreads); ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop(const std::chrono::milliseconds gracefulTimeout) {
    {
        std::scoped_lock lock(state_->mutex);
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(state_->queue, empty);
        state_->stopFlag.store(true);
    }
    state_->cv.notify_all();

    const auto deadline = std::chrono::steady_clock::now() + gracefulTimeout;
    for (auto& w : workers_) {
        if (!w.thread.joinable()) continue;
        while (!w.exited->load() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));

        if (w.exited->load()) w.thread.join();
        else {
            if (Registry::isInitialized())
                Registry::ferry()->warn("[{}] Worker still busy after {}ms, detaching", name_, gracefulTimeout.count());
            w.thread.detach();
        }
    }

    workers_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(state_->mutex);
        if (state_->stopFlag.load()) throw std::runtime_error("[" + name_ + "] submit on stopped pool");
        state_->queue.push(std::move(task));
    }
    state_->cv.notify_one();
}

void ThreadPool::spawnWorker() {
    auto exited = std::make_shared<std::atomic<bool>>(false);

    std::thread t([state = state_, exited, name = name_] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(state->mutex);
                state->cv.wait(lock, [&state] {
                    return state->stopFlag.load() || !state->queue.empty();
                });

                if (state->stopFlag.load() && state->queue.empty()) break;

                task = std::move(state->queue.front());
                state->queue.pop();
            }

            if (task) {
                try {
                    (*task)();
                } catch (const std::exception& e) {
                    // Detached workers may outlive the log registry.
                    if (Registry::isInitialized()) Registry::ferry()->error("[{}] Task failed: {}", name, e.what());
                }
            }
        }
        exited->store(true);
    });

    workers_.push_back({std::move(t), std::move(exited)});
}
