#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace ferry::concurrency {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(); }

    // Sleeps up to d, returns early (false) once stop() has been requested.
    bool lazySleep(std::chrono::milliseconds d);

    // Cuts a pending lazySleep short without stopping the service.
    void wake();

private:
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
    bool woken_ = false;
};

}
