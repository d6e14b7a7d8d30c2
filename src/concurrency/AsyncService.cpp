#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace ferry::concurrency;
using namespace ferry::log;

AsyncService::AsyncService(const std::string& serviceName) : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        interruptFlag_.store(true);
        sleepCv_.notify_all();
        worker_.join();
    }
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            Registry::ferry()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    Registry::ferry()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    Registry::ferry()->debug("[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock lock(sleepMutex_);
        interruptFlag_.store(true);
    }
    sleepCv_.notify_all();

    // Only join if we're not calling stop() from the same thread
    if (std::this_thread::get_id() == worker_.get_id()) return;
    worker_.join();

    running_.store(false);
    interruptFlag_.store(false);

    Registry::ferry()->debug("[{}] Service stopped.", serviceName_);
}

bool AsyncService::lazySleep(const std::chrono::milliseconds d) {
    std::unique_lock lock(sleepMutex_);
    sleepCv_.wait_for(lock, d, [this] { return interruptFlag_.load() || woken_; });
    woken_ = false;
    return !interruptFlag_.load();
}

void AsyncService::wake() {
    {
        std::scoped_lock lock(sleepMutex_);
        woken_ = true;
    }
    sleepCv_.notify_all();
}
