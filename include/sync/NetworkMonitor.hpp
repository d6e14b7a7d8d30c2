#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"
#include "sync/EventBus.hpp"
#include "sync/model/Events.hpp"
#include "util/reachability.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace ferry::concurrency { class BlockingExecutor; }

namespace ferry::sync {

// Whatever the monitor may pause while the destination is unreachable.
class Pausable {
public:
    virtual ~Pausable() = default;

    virtual void autoPause(const std::string& reason) = 0;

    // Only resumes when the current pause was started by autoPause().
    virtual void autoResume() = 0;
};

struct ProbeTarget {
    std::string label;
    std::filesystem::path path;               // existence check; empty for FTP
    std::optional<util::Endpoint> endpoint;   // fast TCP check first when set

    [[nodiscard]] bool configured() const { return !path.empty() || endpoint.has_value(); }
};

struct ProbeTargets {
    ProbeTarget target;
    ProbeTarget backup;
};

// Polls reachability of the target (and backup) and publishes transitions:
// target OK -> Good, backup OK only -> Unstable, neither -> Disconnected.
class NetworkMonitor : public concurrency::AsyncService {
public:
    using Probe = std::function<bool(const ProbeTarget&)>;

    NetworkMonitor(config::NetworkConfig cfg, ProbeTargets targets, Pausable& pausable, EventBus& bus,
                   Probe probe = {});
    ~NetworkMonitor() override;

    // One synchronous probe cycle; returns the resulting status.
    model::NetworkStatus evaluate();

    [[nodiscard]] model::NetworkStatus status() const { return status_.load(); }

    void setHeartbeat(std::function<void()> heartbeat);

    // TCP pre-check then a bounded existence check on the executor.
    static Probe defaultProbe(concurrency::BlockingExecutor& executor, std::chrono::milliseconds timeout);

protected:
    void runLoop() override;

private:
    config::NetworkConfig cfg_;
    ProbeTargets targets_;
    Pausable& pausable_;
    EventBus& bus_;
    Probe probe_;

    std::atomic<model::NetworkStatus> status_{model::NetworkStatus::Good};
    std::mutex mutex_;
    std::function<void()> heartbeat_;
    bool pausedByMonitor_ = false;
    unsigned int downChecks_ = 0;

    void onTransition(model::NetworkStatus from, model::NetworkStatus to);
};

}
