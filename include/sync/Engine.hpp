#pragma once

#include "concurrency/AsyncService.hpp"
#include "concurrency/BlockingExecutor.hpp"
#include "config/Config.hpp"
#include "protocols/Error.hpp"
#include "protocols/ProtocolClient.hpp"
#include "storage/HashStore.hpp"
#include "storage/ResumeLedger.hpp"
#include "sync/ArchiveWorker.hpp"
#include "sync/CleanupService.hpp"
#include "sync/DuplicateResolver.hpp"
#include "sync/EventBus.hpp"
#include "sync/FailureLog.hpp"
#include "sync/NetworkMonitor.hpp"
#include "sync/RetryScheduler.hpp"
#include "sync/model/Throughput.hpp"
#include "sync/model/WorkItem.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ferry::sync {

using ClientFactory = std::function<std::unique_ptr<protocols::ProtocolClient>(
    config::Protocol, const config::Config&, std::shared_ptr<storage::ResumeLedger>)>;

ClientFactory defaultClientFactory();

// The upload loop: scans the source tree, gates on network and disk health,
// de-duplicates, transfers through one or two protocol channels, archives on
// success and routes failures through the retry scheduler.
class Engine : public concurrency::AsyncService, public Pausable {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    Engine(config::Config cfg, EventBus& bus, ClientFactory factory = defaultClientFactory());
    ~Engine() override;

    // Validates paths and builds the per-session state without starting any
    // thread. Throws protocols::PathError. start() calls it.
    void open();

    // open() then spawns the monitor, archive, cleanup and control threads.
    void start() override;

    void pause();
    void resume();

    // Fast stop cancels in-flight transfers (resume state stays on disk);
    // graceful waits up to gracefulTimeout for the current file first.
    void stop(bool graceful, std::chrono::milliseconds gracefulTimeout = std::chrono::seconds(30));
    void stop() override { stop(false); }

    // Blocks until the control loop has fully stopped; false on timeout.
    bool wait(std::chrono::milliseconds timeout);

    // One pass: due retries first, then a fresh scan. Runs on the caller's thread.
    void runCycle();

    [[nodiscard]] model::RunState state() const;
    [[nodiscard]] model::Stats stats() const;

    void autoPause(const std::string& reason) override;
    void autoResume() override;

    // Must be called before start(); replaces the TCP/path probe.
    void setNetworkProbe(NetworkMonitor::Probe probe);

    // Wall clock used for retry scheduling.
    void setClock(Clock clock);

    DuplicateResolver& duplicates() { return resolver_; }
    [[nodiscard]] storage::HashStore* hashStore() const { return hashStore_.get(); }
    [[nodiscard]] storage::ResumeLedger* ledger() const { return ledger_.get(); }
    [[nodiscard]] RetryScheduler& retries() { return retries_; }
    [[nodiscard]] NetworkMonitor* monitor() const { return monitor_.get(); }
    [[nodiscard]] ArchiveWorker* archiver() const { return archiver_.get(); }
    [[nodiscard]] const config::Config& settings() const { return cfg_; }

protected:
    void runLoop() override;

private:
    struct Flags {
        std::atomic<bool> stopRequested{false};
        std::atomic<bool> cancel{false};
        std::atomic<bool> paused{false};
    };

    struct Channel {
        config::Protocol protocol;
        std::shared_ptr<protocols::ProtocolClient> client;
    };

    enum class Disposition { Uploaded, Skipped, Interrupted, Retry, Failed, Dropped };

    config::Config cfg_;
    EventBus& bus_;
    ClientFactory factory_;

    std::shared_ptr<Flags> flags_ = std::make_shared<Flags>();
    std::atomic<bool> autoPaused_{false};

    concurrency::BlockingExecutor io_{3};
    concurrency::BlockingExecutor transfers_{2};

    std::shared_ptr<storage::ResumeLedger> ledger_;
    std::unique_ptr<storage::HashStore> hashStore_;
    std::unique_ptr<FailureLog> failureLog_;
    std::unique_ptr<ArchiveWorker> archiver_;
    std::unique_ptr<NetworkMonitor> monitor_;
    std::unique_ptr<CleanupService> cleanup_;
    std::shared_ptr<protocols::ProtocolClient> smbClient_;
    std::shared_ptr<protocols::ProtocolClient> ftpClient_;
    NetworkMonitor::Probe probe_;
    Clock clock_ = [] { return std::chrono::system_clock::now(); };

    DuplicateResolver resolver_;
    RetryScheduler retries_;

    mutable std::mutex statsMutex_;
    uint64_t uploaded_{}, failed_{}, skipped_{};
    model::Throughput throughput_;

    mutable std::mutex stateMutex_;
    std::condition_variable stateCv_;
    model::RunState state_ = model::RunState::Stopped;

    // Session bookkeeping, touched only by the thread running cycles.
    std::set<std::string> permanentFailures_;
    std::set<std::string> sessionSkipped_;
    std::set<std::string> pendingResume_;
    std::optional<std::chrono::steady_clock::time_point> lastDiskWarning_;
    bool opened_ = false;

    [[nodiscard]] bool cancelRequested() const;
    [[nodiscard]] bool stopRequested() const;
    [[nodiscard]] protocols::CancelFn cancelFn() const;
    [[nodiscard]] std::chrono::milliseconds ioTimeout() const;
    [[nodiscard]] std::chrono::system_clock::time_point clockNow() const { return clock_(); }

    void setState(model::RunState s);
    void resetSession();
    void validatePaths() const;
    void buildComponents();
    void shutdownHelpers();

    [[nodiscard]] bool dedupActive() const;
    [[nodiscard]] bool networkAllowsTransfers() const;
    [[nodiscard]] bool diskAllowsTransfers();

    std::vector<model::WorkItem> scan();
    std::vector<Channel> channelsFor(const model::ProtocolState& state) const;

    // A client stuck inside a call is left to its worker; later items get a new one.
    void retireClient(config::Protocol protocol);

    Disposition process(model::WorkItem& item, model::ProtocolState& state);
    Disposition processSingle(model::WorkItem& item, const Channel& ch);

    std::optional<std::filesystem::path> findDuplicate(const model::WorkItem& item, const std::string& hash);

    // Runs the uploads in parallel and joins them; stalled transfers are
    // cancelled and reported as Network errors. Returns the first failure.
    std::optional<protocols::TransferError> transfer(const model::WorkItem& item,
                                                     const std::vector<std::pair<Channel, std::string>>& jobs,
                                                     model::ProtocolState& state);

    bool remoteExists(const Channel& ch, const std::string& remote);

    void onSuccess(const model::WorkItem& item, const model::ScopedOp& op);
    void archive(const model::WorkItem& item);
    void onSkipped(const model::WorkItem& item, const std::string& reason, bool archiveSource);
    Disposition onFailure(model::WorkItem item, model::ProtocolState state, const protocols::TransferError& err);

    void emitStats() const;
    void emitOutcome(const model::WorkItem& item, model::FileOutcome::Kind kind, const std::string& reason) const;
};

}
