#include "sync/NetworkMonitor.hpp"
#include "concurrency/BlockingExecutor.hpp"
#include "log/Registry.hpp"

using namespace ferry::sync;
using namespace ferry::log;
using ferry::sync::model::NetworkStatus;
namespace fs = std::filesystem;

NetworkMonitor::NetworkMonitor(config::NetworkConfig cfg, ProbeTargets targets, Pausable& pausable, EventBus& bus,
                               Probe probe)
    : AsyncService("NetworkMonitor"),
      cfg_(cfg), targets_(std::move(targets)), pausable_(pausable), bus_(bus), probe_(std::move(probe)) {
    if (!probe_) throw std::invalid_argument("NetworkMonitor requires a probe");
}

NetworkMonitor::~NetworkMonitor() {
    stop();
}

void NetworkMonitor::setHeartbeat(std::function<void()> heartbeat) {
    std::scoped_lock lock(mutex_);
    heartbeat_ = std::move(heartbeat);
}

NetworkMonitor::Probe NetworkMonitor::defaultProbe(concurrency::BlockingExecutor& executor,
                                                   const std::chrono::milliseconds timeout) {
    return [&executor, timeout](const ProbeTarget& t) {
        if (t.endpoint && !util::tcpReachable(*t.endpoint, timeout)) return false;
        if (t.path.empty()) return true;

        const auto path = t.path;
        const auto found = executor.run([path] {
            std::error_code ec;
            return fs::exists(path, ec);
        }, timeout);
        return found.value_or(false);
    };
}

NetworkStatus NetworkMonitor::evaluate() {
    NetworkStatus next;
    if (targets_.target.configured() && probe_(targets_.target)) next = NetworkStatus::Good;
    else if (targets_.backup.configured() && probe_(targets_.backup)) next = NetworkStatus::Unstable;
    else next = NetworkStatus::Disconnected;

    const auto prev = status_.exchange(next);
    if (prev != next) onTransition(prev, next);

    if (next == NetworkStatus::Disconnected) {
        if (++downChecks_ % 3 == 0)
            Registry::net()->warn("[NetworkMonitor] Network still down (check {})", downChecks_);
    } else {
        downChecks_ = 0;
    }

    std::function<void()> heartbeat;
    {
        std::scoped_lock lock(mutex_);
        heartbeat = heartbeat_;
    }
    if (heartbeat) heartbeat();

    return next;
}

void NetworkMonitor::onTransition(const NetworkStatus from, const NetworkStatus to) {
    const auto level = to == NetworkStatus::Good ? spdlog::level::info : spdlog::level::warn;
    bus_.log(level, "Network status: " + model::to_string(from) + " -> " + model::to_string(to) +
                    " (" + targets_.target.label + ")");
    bus_.emit(model::NetworkStatusChanged{to, from});

    std::scoped_lock lock(mutex_);
    if (from == NetworkStatus::Good && cfg_.auto_pause) {
        pausable_.autoPause("network " + model::to_string(to));
        pausedByMonitor_ = true;
    } else if (to == NetworkStatus::Good && pausedByMonitor_) {
        pausedByMonitor_ = false;
        if (cfg_.auto_resume) pausable_.autoResume();
    }
}

void NetworkMonitor::runLoop() {
    Registry::net()->info("[NetworkMonitor] Watching {} every {}s", targets_.target.label, cfg_.check_interval_seconds);
    while (!shouldStop()) {
        try {
            evaluate();
        } catch (const std::exception& e) {
            Registry::net()->error("[NetworkMonitor] Probe cycle failed: {}", e.what());
        }

        // Poll faster while degraded so recovery is noticed quickly.
        const auto interval = status() == NetworkStatus::Good
            ? std::chrono::milliseconds(cfg_.check_interval_seconds * 1000)
            : std::chrono::milliseconds(1000);
        if (!lazySleep(interval)) break;
    }
}
