#pragma once

#include "Task.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <string>
#include <vector>

namespace ferry::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads, std::string name = "pool");

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks, joins workers that finish within the timeout and
    // detaches the rest (they keep the shared state alive until they return).
    void stop(std::chrono::milliseconds gracefulTimeout = std::chrono::milliseconds(1200));

    void submit(std::shared_ptr<Task> task);

private:
    struct State {
        std::condition_variable cv;
        mutable std::mutex mutex;
        std::queue<std::shared_ptr<Task>> queue;
        std::atomic<bool> stopFlag{false};
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> exited;
    };

    void spawnWorker();

    std::string name_;
    std::shared_ptr<State> state_;
    std::vector<Worker> workers_;
};

} // namespace ferry::concurrency
