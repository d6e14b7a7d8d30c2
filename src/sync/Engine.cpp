#include "sync/Engine.hpp"
#include "log/Registry.hpp"
#include "protocols/FTPClient.hpp"
#include "protocols/LocalCopyClient.hpp"
#include "util/disk.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <future>
#include <thread>

using namespace ferry::sync;
using namespace ferry::sync::model;
using namespace ferry::protocols;
using namespace ferry::log;
using ferry::config::DuplicateStrategy;
using ferry::config::Protocol;
namespace fs = std::filesystem;
using namespace std::chrono;

namespace {

constexpr auto DISK_RECHECK = seconds(2);
constexpr auto DISK_WARNING_THROTTLE = seconds(10);
constexpr auto PAUSE_POLL = milliseconds(500);
constexpr auto NETWORK_POLL = seconds(1);
constexpr auto STALL_GRACE = seconds(5);
constexpr auto JOIN_POLL = milliseconds(100);
constexpr auto SCAN_TIMEOUT_FLOOR = seconds(30);
constexpr auto ARCHIVE_DRAIN = seconds(30);

ClientOptions clientOptions(const ferry::config::UploadConfig& u) {
    ClientOptions o;
    o.chunkSize = u.chunk_size;
    if (u.limit_upload_rate && u.max_upload_rate_mbps > 0)
        o.maxBytesPerSecond = static_cast<uint64_t>(u.max_upload_rate_mbps * 1024.0 * 1024.0);
    return o;
}

RetryPolicy policyFor(const ferry::config::UploadConfig& u) {
    RetryPolicy p;
    p.maxAttempts = u.retry_count;
    p.diskFullMaxAttempts = u.disk_full_max_attempts;
    p.retryPermissionErrors = u.retry_permission_errors;
    return p;
}

int64_t steadyMs() {
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

}

ClientFactory ferry::sync::defaultClientFactory() {
    return [](const Protocol p, const config::Config& cfg, std::shared_ptr<storage::ResumeLedger> ledger)
        -> std::unique_ptr<ProtocolClient> {
        const auto opts = clientOptions(cfg.upload);
        if (p == Protocol::FtpClient) return std::make_unique<FTPClient>(cfg.ftp, opts);
        return std::make_unique<LocalCopyClient>(cfg.paths.target, opts, std::move(ledger));
    };
}

Engine::Engine(config::Config cfg, EventBus& bus, ClientFactory factory)
    : AsyncService("SyncEngine"),
      cfg_(std::move(cfg)),
      bus_(bus),
      factory_(std::move(factory)),
      resolver_(seconds(cfg_.dedup.ask_timeout_seconds)),
      retries_(policyFor(cfg_.upload)) {
    if (!factory_) factory_ = defaultClientFactory();
}

Engine::~Engine() {
    stop(false);
    if (cleanup_) cleanup_->stop();
    if (monitor_) monitor_->stop();
    if (archiver_) archiver_->stop();
    transfers_.shutdown();
    io_.shutdown();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void Engine::validatePaths() const {
    std::error_code ec;
    const auto& p = cfg_.paths;

    if (p.source.empty() || !fs::is_directory(p.source, ec))
        throw PathError("Source folder does not exist: " + p.source.string());

    if (cfg_.upload.protocol != Protocol::FtpClient) {
        if (p.target.empty()) throw PathError("Target folder is not configured");
        fs::create_directories(p.target, ec);
        if (ec && !fs::is_directory(p.target))
            throw PathError("Cannot create target folder " + p.target.string() + ": " + ec.message());
    }

    if (cfg_.upload.enable_backup && !p.backup.empty()) {
        fs::create_directories(p.backup, ec);
        if (ec && !fs::is_directory(p.backup))
            throw PathError("Cannot create backup folder " + p.backup.string() + ": " + ec.message());
    }

    fs::create_directories(p.state_dir, ec);
    if (ec && !fs::is_directory(p.state_dir))
        throw PathError("Cannot create state folder " + p.state_dir.string() + ": " + ec.message());
}

void Engine::buildComponents() {
    if (!ledger_) ledger_ = std::make_shared<storage::ResumeLedger>(cfg_.resumeDir(), cfg_.resume);
    if (!failureLog_) failureLog_ = std::make_unique<FailureLog>(cfg_.failureLogPath());
    if (cfg_.dedup.enabled && !hashStore_)
        hashStore_ = std::make_unique<storage::HashStore>(cfg_.dedupLedgerPath(), cfg_.dedup);
    if (!archiver_) archiver_ = std::make_unique<ArchiveWorker>(cfg_.upload.enable_backup, cfg_.paths.backup, bus_);

    const auto proto = cfg_.upload.protocol;
    if (proto != Protocol::FtpClient && !smbClient_) smbClient_ = factory_(Protocol::Smb, cfg_, ledger_);
    if (proto != Protocol::Smb && !ftpClient_) ftpClient_ = factory_(Protocol::FtpClient, cfg_, ledger_);

    if (cfg_.network.enabled && !monitor_) {
        ProbeTargets targets;
        if (proto == Protocol::FtpClient) {
            targets.target = {"ftp://" + cfg_.ftp.host, {}, util::Endpoint{cfg_.ftp.host, cfg_.ftp.port}};
        } else {
            targets.target = {cfg_.paths.target.string(), cfg_.paths.target, util::smbEndpointOf(cfg_.paths.target)};
            if (proto == Protocol::Both && !cfg_.ftp.host.empty())
                targets.target.endpoint = util::Endpoint{cfg_.ftp.host, cfg_.ftp.port};
        }
        if (cfg_.upload.enable_backup && !cfg_.paths.backup.empty())
            targets.backup = {cfg_.paths.backup.string(), cfg_.paths.backup, util::smbEndpointOf(cfg_.paths.backup)};

        auto probe = probe_ ? probe_
                            : NetworkMonitor::defaultProbe(io_, milliseconds(cfg_.network.probe_timeout_ms));
        monitor_ = std::make_unique<NetworkMonitor>(cfg_.network, std::move(targets), *this, bus_, std::move(probe));
        monitor_->setHeartbeat([this] { emitStats(); });
    }

    if (cfg_.cleanup.enabled && !cleanup_) {
        auto cleanupCfg = cfg_.cleanup;
        if (cleanupCfg.folder.empty()) cleanupCfg.folder = cfg_.paths.backup;
        cleanup_ = std::make_unique<CleanupService>(cleanupCfg);
    }
}

void Engine::resetSession() {
    {
        std::scoped_lock lock(statsMutex_);
        uploaded_ = failed_ = skipped_ = 0;
        throughput_.clear();
    }
    retries_.clear();
    permanentFailures_.clear();
    sessionSkipped_.clear();
    pendingResume_.clear();
    resolver_.resetSession();
    lastDiskWarning_.reset();

    for (const auto& r : ledger_->pending()) pendingResume_.insert(r.sourcePath.string());
    if (!pendingResume_.empty())
        bus_.info("Found {} unfinished transfer(s), resuming them first", pendingResume_.size());
}

void Engine::open() {
    validatePaths();
    buildComponents();
    resetSession();

    flags_->stopRequested = false;
    flags_->cancel = false;
    opened_ = true;

    if (cfg_.dedup.enabled && cfg_.upload.protocol != Protocol::Smb)
        bus_.info("Deduplication is only supported for smb uploads; disabled for {}",
                  config::to_string(cfg_.upload.protocol));

    Registry::ferry()->info("[SyncEngine] Ready: {} -> {} ({}, {})", cfg_.paths.source.string(),
                            cfg_.upload.protocol == Protocol::FtpClient ? "ftp://" + cfg_.ftp.host
                                                                        : cfg_.paths.target.string(),
                            config::to_string(cfg_.upload.protocol), config::to_string(cfg_.upload.mode));
}

void Engine::start() {
    if (isRunning()) return;
    open();

    archiver_->start();
    if (monitor_) monitor_->start();
    if (cleanup_) cleanup_->start();

    setState(flags_->paused ? RunState::Paused : RunState::Running);
    AsyncService::start();
}

void Engine::stop(const bool graceful, const milliseconds gracefulTimeout) {
    if (!worker_.joinable()) return;

    flags_->stopRequested = true;
    if (!graceful) flags_->cancel = true;
    wake();

    if (graceful && std::this_thread::get_id() != worker_.get_id() && !wait(gracefulTimeout)) {
        Registry::ferry()->warn("[SyncEngine] Graceful stop timed out, cancelling the current transfer");
        flags_->cancel = true;
    }

    AsyncService::stop();
}

bool Engine::wait(const milliseconds timeout) {
    std::unique_lock lock(stateMutex_);
    return stateCv_.wait_for(lock, timeout, [this] { return state_ == RunState::Stopped; });
}

void Engine::shutdownHelpers() {
    if (cleanup_) cleanup_->stop();
    if (monitor_) monitor_->stop();
    if (archiver_) {
        if (!archiver_->drain(ARCHIVE_DRAIN))
            Registry::archive()->warn("[SyncEngine] {} archive job(s) still pending at shutdown", archiver_->pending());
        archiver_->stop();
    }
    for (const auto& client : {smbClient_, ftpClient_}) {
        if (!client) continue;
        try {
            client->disconnect();
        } catch (const std::exception& e) {
            Registry::protocol()->warn("[SyncEngine] Disconnect failed: {}", e.what());
        }
    }
}

// ---------------------------------------------------------------------------
// Run state
// ---------------------------------------------------------------------------

void Engine::setState(const RunState s) {
    {
        std::scoped_lock lock(stateMutex_);
        if (state_ == s) return;
        state_ = s;
    }
    stateCv_.notify_all();
    bus_.emit(RunStateChanged{s});
}

RunState Engine::state() const {
    std::scoped_lock lock(stateMutex_);
    return state_;
}

void Engine::pause() {
    autoPaused_ = false;
    if (flags_->paused.exchange(true)) return;
    bus_.info("Paused");
    if (isRunning()) setState(RunState::Paused);
}

void Engine::resume() {
    autoPaused_ = false;
    if (!flags_->paused.exchange(false)) return;
    bus_.info("Resumed");
    if (isRunning()) setState(RunState::Running);
    wake();
}

void Engine::autoPause(const std::string& reason) {
    if (flags_->paused) return;   // a manual pause stays manual
    autoPaused_ = true;
    flags_->paused = true;
    bus_.warn("Auto-paused: {}", reason);
    if (isRunning()) setState(RunState::Paused);
}

void Engine::autoResume() {
    if (!flags_->paused || !autoPaused_) return;
    autoPaused_ = false;
    flags_->paused = false;
    bus_.info("Auto-resumed");
    if (isRunning()) setState(RunState::Running);
    wake();
}

void Engine::setNetworkProbe(NetworkMonitor::Probe probe) {
    probe_ = std::move(probe);
}

void Engine::setClock(Clock clock) {
    if (clock) clock_ = std::move(clock);
}

bool Engine::stopRequested() const {
    return flags_->stopRequested || shouldStop();
}

bool Engine::cancelRequested() const {
    return flags_->cancel || flags_->paused;
}

CancelFn Engine::cancelFn() const {
    return [flags = flags_] { return flags->cancel.load() || flags->paused.load(); };
}

milliseconds Engine::ioTimeout() const {
    return seconds(std::max(1u, cfg_.upload.io_timeout_seconds));
}

Stats Engine::stats() const {
    std::scoped_lock lock(statsMutex_);
    return {uploaded_, failed_, skipped_, throughput_.toString()};
}

void Engine::emitStats() const {
    bus_.emit(stats());
}

void Engine::emitOutcome(const WorkItem& item, const FileOutcome::Kind kind, const std::string& reason) const {
    bus_.emit(FileOutcome{item.relativePath.generic_string(), kind, reason});
}

// ---------------------------------------------------------------------------
// Control loop
// ---------------------------------------------------------------------------

void Engine::runLoop() {
    Registry::ferry()->info("[SyncEngine] Started, scanning {} every {}s", cfg_.paths.source.string(),
                            cfg_.upload.interval_seconds);

    bool passDone = false;
    while (!stopRequested()) {
        if (flags_->paused) {
            lazySleep(PAUSE_POLL);
            continue;
        }

        if (!networkAllowsTransfers()) {
            lazySleep(NETWORK_POLL);
            continue;
        }

        if (!diskAllowsTransfers()) {
            lazySleep(DISK_RECHECK);
            continue;
        }

        try {
            runCycle();
        } catch (const std::exception& e) {
            bus_.error("Scan cycle failed: {}", e.what());
        }

        // A paused or stopped pass is not complete.
        if (flags_->paused || stopRequested()) continue;

        if (cfg_.upload.mode == config::RunMode::Once) {
            passDone = true;
            break;
        }

        auto sleepFor = milliseconds(seconds(std::max(1u, cfg_.upload.interval_seconds)));
        if (const auto due = retries_.nextDue()) {
            const auto untilDue = duration_cast<milliseconds>(*due - clockNow());
            sleepFor = std::clamp(untilDue, milliseconds(0), sleepFor);
        }
        lazySleep(sleepFor);
    }

    if (passDone) {
        if (const auto left = retries_.size()) bus_.warn("{} pending retries dropped at end of single pass", left);
        bus_.info("Single pass complete");
    }
    shutdownHelpers();
    emitStats();

    const auto s = stats();
    Registry::ferry()->info("[SyncEngine] Stopped: {} uploaded, {} skipped, {} failed", s.uploaded, s.skipped, s.failed);
    setState(RunState::Stopped);
}

bool Engine::networkAllowsTransfers() const {
    return !monitor_ || monitor_->status() == NetworkStatus::Good;
}

bool Engine::diskAllowsTransfers() {
    const auto threshold = static_cast<double>(cfg_.upload.disk_threshold_percent);

    auto measure = [this](const fs::path& p) -> std::optional<double> {
        if (p.empty()) return std::nullopt;
        try {
            return io_.run([p] { return util::freeSpacePercent(p); }, ioTimeout()).value_or(std::nullopt);
        } catch (const std::exception& e) {
            Registry::storage()->debug("[SyncEngine] Cannot measure free space on {}: {}", p.string(), e.what());
            return std::nullopt;
        }
    };

    DiskWarning warning;
    warning.threshold = cfg_.upload.disk_threshold_percent;
    if (cfg_.upload.protocol != Protocol::FtpClient) warning.targetPercent = measure(cfg_.paths.target);
    if (cfg_.upload.enable_backup) warning.backupPercent = measure(cfg_.paths.backup);

    const bool low = (warning.targetPercent && *warning.targetPercent < threshold) ||
                     (warning.backupPercent && *warning.backupPercent < threshold);
    if (!low) return true;

    const auto now = steady_clock::now();
    if (!lastDiskWarning_ || now - *lastDiskWarning_ >= DISK_WARNING_THROTTLE) {
        lastDiskWarning_ = now;
        bus_.emit(warning);
        bus_.warn("Disk space below {}% (target {}, backup {}), uploads paused",
                  warning.threshold,
                  warning.targetPercent ? fmt::format("{:.1f}%", *warning.targetPercent) : "n/a",
                  warning.backupPercent ? fmt::format("{:.1f}%", *warning.backupPercent) : "n/a");
    }
    return false;
}

void Engine::runCycle() {
    if (!opened_) open();

    if (stopRequested() || flags_->paused) return;

    auto due = retries_.dueItems(clockNow());
    for (size_t i = 0; i < due.size(); ++i) {
        if (stopRequested() || flags_->paused) {
            for (; i < due.size(); ++i) retries_.requeue(std::move(due[i]));
            break;
        }
        auto& entry = due[i];
        bus_.info("Retrying {} (attempt {})", entry.item.relativePath.generic_string(), entry.item.attemptCount + 1);
        process(entry.item, entry.state);
    }

    auto items = scan();
    if (!items.empty()) Registry::sync()->debug("[SyncEngine] {} file(s) to upload", items.size());

    for (auto& item : items) {
        if (stopRequested() || flags_->paused) break;
        ProtocolState state;
        process(item, state);
    }

    emitStats();
}

std::vector<WorkItem> Engine::scan() {
    const auto root = cfg_.paths.source;
    const auto filters = cfg_.upload.filters;
    const auto flags = flags_;

    auto walk = [root, filters, flags] {
        std::vector<std::pair<fs::path, uintmax_t>> found;
        std::error_code ec;
        for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
             !ec && it != end; it.increment(ec)) {
            if (flags->cancel || flags->stopRequested) break;
            std::error_code fec;
            if (!it->is_regular_file(fec)) continue;
            const auto& p = it->path();
            if (util::isPartialFile(p) || !util::matchesExtension(p, filters)) continue;
            const auto size = it->file_size(fec);
            if (fec) continue;
            found.emplace_back(p, size);
        }
        if (ec) throw fs::filesystem_error("Cannot scan source folder", root, ec);
        return found;
    };

    const auto timeout = std::max<milliseconds>(SCAN_TIMEOUT_FLOOR, ioTimeout());
    auto files = io_.run(walk, timeout);
    if (!files) {
        bus_.warn("Scanning {} timed out", root.string());
        return {};
    }

    std::vector<WorkItem> items;
    for (auto& [path, size] : *files) {
        const auto key = path.string();
        if (retries_.contains(path) || permanentFailures_.contains(key) || sessionSkipped_.contains(key)) continue;

        WorkItem item;
        item.sourcePath = path;
        item.relativePath = path.lexically_relative(root);
        item.targetPath = item.relativePath;
        item.backupPath = cfg_.paths.backup / item.relativePath;
        item.sizeBytes = size;
        item.maxAttempts = cfg_.upload.retry_count;
        item.priority = pendingResume_.contains(key) ? 1 : 0;
        items.push_back(std::move(item));
    }

    std::ranges::stable_sort(items, [](const WorkItem& a, const WorkItem& b) { return a.priority > b.priority; });
    return items;
}

// ---------------------------------------------------------------------------
// Per-file path
// ---------------------------------------------------------------------------

std::vector<Engine::Channel> Engine::channelsFor(const ProtocolState& state) const {
    std::vector<Channel> out;
    if (smbClient_ && !state.done(Protocol::Smb)) out.push_back({Protocol::Smb, smbClient_});
    if (ftpClient_ && !state.done(Protocol::FtpClient)) out.push_back({Protocol::FtpClient, ftpClient_});
    return out;
}

void Engine::retireClient(const Protocol protocol) {
    auto& slot = protocol == Protocol::Smb ? smbClient_ : ftpClient_;
    if (!slot) return;
    Registry::protocol()->warn("[SyncEngine] Replacing the {} client stuck in a call", config::to_string(protocol));
    slot = factory_(protocol, cfg_, ledger_);
}

bool Engine::dedupActive() const {
    return hashStore_ && cfg_.upload.protocol == Protocol::Smb;
}

bool Engine::remoteExists(const Channel& ch, const std::string& remote) {
    const auto client = ch.client;
    const auto found = io_.run([client, remote] { return client->exists(remote); }, ioTimeout());
    if (!found) {
        retireClient(ch.protocol);
        throw TransferError(ErrorKind::Network, "Timed out checking " + remote);
    }
    return *found;
}

Engine::Disposition Engine::process(WorkItem& item, ProtocolState& state) {
    std::error_code ec;
    if (!fs::exists(item.sourcePath, ec)) {
        Registry::sync()->debug("[SyncEngine] {} vanished before upload", item.sourcePath.string());
        return Disposition::Dropped;
    }

    const auto channels = channelsFor(state);
    if (channels.empty()) return Disposition::Dropped;

    try {
        if (cfg_.upload.protocol != Protocol::Both) return processSingle(item, channels.front());

        ScopedOp op;
        op.start(item.sizeBytes);

        std::vector<std::pair<Channel, std::string>> jobs;
        for (const auto& ch : channels) jobs.emplace_back(ch, ch.client->remotePathFor(item.targetPath));

        if (const auto err = transfer(item, jobs, state)) return onFailure(item, state, *err);

        op.stop(true);
        onSuccess(item, op);
        return Disposition::Uploaded;
    } catch (const TransferError& e) {
        return onFailure(item, state, e);
    } catch (const fs::filesystem_error& e) {
        return onFailure(item, state, fromFilesystem(e, item.relativePath.generic_string()));
    } catch (const std::exception& e) {
        return onFailure(item, state, TransferError(classify(std::string_view(e.what())), e.what()));
    }
}

Engine::Disposition Engine::processSingle(WorkItem& item, const Channel& ch) {
    ScopedOp op;
    op.start(item.sizeBytes);

    auto remote = ch.client->remotePathFor(item.targetPath);
    std::optional<std::string> contentHash;

    if (dedupActive() && ch.client->supportsDedup()) {
        contentHash = hashStore_->contentHash(item.sourcePath, cancelFn());

        if (const auto dup = findDuplicate(item, *contentHash)) {
            const auto dupName = dup->string();

            std::error_code ec;
            const auto dupSize = fs::file_size(*dup, ec);
            if (!ec && dupSize != item.sizeBytes)
                Registry::sync()->warn("[SyncEngine] Duplicate {} of {} has a different size ({} vs {} bytes)",
                                       dupName, item.relativePath.generic_string(), dupSize, item.sizeBytes);

            auto strategy = cfg_.dedup.strategy;
            if (strategy == DuplicateStrategy::Ask) {
                const auto flags = flags_;
                strategy = resolver_.resolve(item.relativePath.generic_string(), dupName,
                                             [flags] { return flags->cancel.load() || flags->stopRequested.load(); });
            }

            switch (strategy) {
                case DuplicateStrategy::Rename:
                    remote = util::uniqueName(remote).string();
                    bus_.info("Duplicate of {}, uploading as {}", dupName, fs::path(remote).filename().string());
                    break;
                case DuplicateStrategy::Overwrite:
                    bus_.info("Duplicate of {}, replacing it", dupName);
                    ch.client->remove(dupName);
                    hashStore_->remove(*dup);
                    break;
                case DuplicateStrategy::Skip:
                case DuplicateStrategy::Ask:
                default:
                    onSkipped(item, "duplicate of " + dupName, true);
                    return Disposition::Skipped;
            }
        }
    } else if (remoteExists(ch, remote)) {
        onSkipped(item, "already exists on target", false);
        return Disposition::Skipped;
    }

    ProtocolState state;
    const std::vector<std::pair<Channel, std::string>> jobs{{ch, remote}};
    if (const auto err = transfer(item, jobs, state)) return onFailure(item, state, *err);

    if (contentHash) hashStore_->record(*contentHash, remote, item.sizeBytes);

    op.stop(true);
    onSuccess(item, op);
    return Disposition::Uploaded;
}

std::optional<fs::path> Engine::findDuplicate(const WorkItem& item, const std::string& hash) {
    if (const auto rec = hashStore_->lookup(hash)) return rec->canonicalPath;

    // Rebuild from what is already anywhere on the target, e.g. after the
    // hash ledger was lost. Only same-size files can match.
    const auto& root = cfg_.paths.target;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return std::nullopt;

    for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        if (cancelRequested()) throw InterruptedError("Duplicate scan interrupted");

        std::error_code fec;
        if (!it->is_regular_file(fec) || util::isPartialFile(it->path())) continue;
        const auto size = it->file_size(fec);
        if (fec || size != item.sizeBytes) continue;

        try {
            if (hashStore_->contentHash(it->path(), cancelFn()) == hash) {
                hashStore_->record(hash, it->path(), size);
                return it->path();
            }
        } catch (const TransferError& e) {
            if (e.interrupted()) throw;
            Registry::storage()->debug("[SyncEngine] Skipping {} during duplicate scan: {}",
                                       it->path().string(), e.what());
        }
    }
    return std::nullopt;
}

std::optional<TransferError> Engine::transfer(const WorkItem& item,
                                              const std::vector<std::pair<Channel, std::string>>& jobs,
                                              ProtocolState& state) {
    struct Run {
        Channel channel;
        std::string remote;
        std::future<void> future;
        std::shared_ptr<std::atomic<bool>> abort = std::make_shared<std::atomic<bool>>(false);
        std::shared_ptr<std::atomic<int64_t>> lastProgress = std::make_shared<std::atomic<int64_t>>(steadyMs());
        std::shared_ptr<std::atomic<uintmax_t>> sent = std::make_shared<std::atomic<uintmax_t>>(0);
        std::optional<int64_t> abortedAt;
        bool finished = false;
        std::optional<TransferError> error;
    };

    const auto name = item.relativePath.generic_string();
    const auto total = std::max<uintmax_t>(item.sizeBytes, 1) * jobs.size();
    const auto stallMs = static_cast<int64_t>(std::max(1u, cfg_.upload.stall_timeout_seconds)) * 1000;
    const auto graceMs = duration_cast<milliseconds>(STALL_GRACE).count();
    const auto lastPercent = std::make_shared<std::atomic<int>>(-1);
    // Chunked filesystem copies log their own milestones.
    const bool large = item.sizeBytes >= cfg_.resume.threshold_bytes &&
                       std::ranges::none_of(jobs, [](const auto& j) { return j.first.protocol == Protocol::Smb; });

    std::vector<Run> runs(jobs.size());
    for (size_t i = 0; i < jobs.size(); ++i) {
        auto& run = runs[i];
        run.channel = jobs[i].first;
        run.remote = jobs[i].second;
    }

    // Combined percentage across channels.
    std::vector<std::shared_ptr<std::atomic<uintmax_t>>> counters;
    for (const auto& run : runs) counters.push_back(run.sent);

    for (auto& run : runs) {
        const auto client = run.channel.client;
        const auto source = item.sourcePath;
        const auto remote = run.remote;
        const auto abort = run.abort;
        const auto last = run.lastProgress;
        const auto sent = run.sent;
        const auto flags = flags_;
        auto* bus = &bus_;

        const CancelFn cancel = [abort, flags] {
            return abort->load() || flags->cancel.load() || flags->paused.load();
        };
        const ProgressFn progress = [=](const uintmax_t done, uintmax_t) {
            last->store(steadyMs());
            sent->store(done);
            if (abort->load()) return;

            uintmax_t sum = 0;
            for (const auto& c : counters) sum += c->load();
            const int pct = static_cast<int>(std::min<uintmax_t>(100, sum * 100 / total));
            const int prev = lastPercent->exchange(pct);
            if (prev == pct) return;
            bus->emit(FileProgress{name, pct});
            if (large && pct / 10 > std::max(prev, 0) / 10)
                Registry::sync()->info("[SyncEngine] {}: {}%", name, pct / 10 * 10);
        };

        run.future = transfers_.submit([client, source, remote, progress, cancel] {
            if (!client->isConnected()) client->connect(cancel);
            client->ensureDirectory(client->parentOf(remote));
            client->uploadFile(source, remote, progress, cancel);
        });
    }

    size_t open = runs.size();
    while (open > 0) {
        for (auto& run : runs) {
            if (run.finished) continue;

            if (run.future.wait_for(JOIN_POLL / static_cast<long>(runs.size())) == std::future_status::ready) {
                run.finished = true;
                --open;
                try {
                    run.future.get();
                    state.markDone(run.channel.protocol);
                } catch (const TransferError& e) {
                    run.error = (run.abortedAt && e.interrupted())
                        ? TransferError(ErrorKind::Network, "No progress for " +
                                        std::to_string(cfg_.upload.stall_timeout_seconds) + "s uploading " + name)
                        : e;
                } catch (const fs::filesystem_error& e) {
                    run.error = fromFilesystem(e, name);
                } catch (const std::exception& e) {
                    run.error = TransferError(classify(std::string_view(e.what())), e.what());
                }
                continue;
            }

            const auto now = steadyMs();
            if (!run.abortedAt && now - run.lastProgress->load() > stallMs) {
                Registry::protocol()->warn("[SyncEngine] {} upload of {} stalled, cancelling",
                                           config::to_string(run.channel.protocol), name);
                run.abort->store(true);
                run.abortedAt = now;
            } else if (run.abortedAt && now - *run.abortedAt > graceMs) {
                // The call is stuck inside the client; its worker keeps the old one.
                Registry::protocol()->error("[SyncEngine] {} upload of {} did not return after cancel, abandoning",
                                            config::to_string(run.channel.protocol), name);
                run.finished = true;
                --open;
                run.error = TransferError(ErrorKind::Network, "Upload of " + name + " hung and was abandoned");
                retireClient(run.channel.protocol);
            }
        }
    }

    // Report a real failure ahead of an interruption on the other channel.
    std::optional<TransferError> first;
    for (auto& run : runs) {
        if (!run.error) continue;
        if (!first || (first->interrupted() && !run.error->interrupted())) first = run.error;
    }
    return first;
}

// ---------------------------------------------------------------------------
// Outcomes
// ---------------------------------------------------------------------------

void Engine::onSuccess(const WorkItem& item, const ScopedOp& op) {
    {
        std::scoped_lock lock(statsMutex_);
        ++uploaded_;
        throughput_.record(op);
    }
    pendingResume_.erase(item.sourcePath.string());

    const auto name = item.relativePath.generic_string();
    bus_.info("Uploaded {} ({} ms)", name, op.duration_ms());
    bus_.emit(FileProgress{name, 100});
    emitOutcome(item, FileOutcome::Kind::Uploaded, {});

    archive(item);
    emitStats();
}

void Engine::archive(const WorkItem& item) {
    // Without the worker thread (a cycle driven directly) archive inline.
    if (archiver_->isRunning()) archiver_->enqueue(item.sourcePath, item.backupPath);
    else archiver_->archive(item.sourcePath, item.backupPath);
}

void Engine::onSkipped(const WorkItem& item, const std::string& reason, const bool archiveSource) {
    {
        std::scoped_lock lock(statsMutex_);
        ++skipped_;
    }

    const auto name = item.relativePath.generic_string();
    bus_.info("Skipped {}: {}", name, reason);
    emitOutcome(item, FileOutcome::Kind::Skipped, reason);

    if (archiveSource) archive(item);
    else sessionSkipped_.insert(item.sourcePath.string());
    emitStats();
}

Engine::Disposition Engine::onFailure(WorkItem item, ProtocolState state, const TransferError& err) {
    const auto name = item.relativePath.generic_string();

    if (err.interrupted()) {
        Registry::sync()->info("[SyncEngine] {} interrupted, will continue later", name);
        emitOutcome(item, FileOutcome::Kind::Interrupted, err.what());
        // Retries keep their attempt count and delivered channels.
        if (item.attemptCount > 0 || state.any()) retries_.requeue({std::move(item), std::move(state)});
        return Disposition::Interrupted;
    }

    item.lastError = err.what();
    const auto now = clockNow();
    const auto decision = retries_.handleFailure(item, state, err.kind(), now);

    if (decision.kind == RetryDecision::Kind::Scheduled) {
        const auto wait = duration_cast<seconds>(decision.nextAttemptAt - now).count();
        bus_.warn("Upload of {} failed ({}), retry {} in {}s: {}", name, to_string(err.kind()),
                  decision.attempt, std::max<long long>(0, wait), err.what());
        return Disposition::Retry;
    }

    {
        std::scoped_lock lock(statsMutex_);
        ++failed_;
    }
    permanentFailures_.insert(item.sourcePath.string());

    const auto reason = std::string(err.what()) + " (" + to_string(err.kind()) + ")";
    failureLog_->append(item.sourcePath, reason);

    const auto message = std::string(err.what()) + ". " + hint(err.kind());
    bus_.error("Upload of {} failed permanently: {}", name, message);
    bus_.emit(UploadError{name, message});
    emitOutcome(item, FileOutcome::Kind::Failed, reason);
    emitStats();
    return Disposition::Failed;
}
