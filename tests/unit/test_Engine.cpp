#include <gtest/gtest.h>
#include "TestFs.hpp"
#include "sync/Engine.hpp"
#include "util/files.hpp"

#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <thread>

using namespace ferry::sync;
using namespace ferry::sync::model;
using namespace ferry::protocols;
using namespace ferry::test;
using ferry::config::DuplicateStrategy;
using ferry::config::Protocol;
using namespace std::chrono_literals;
using std::chrono::system_clock;
namespace fs = std::filesystem;

namespace {

// In-memory stand-in for an FTP server.
struct FakeRemote {
    std::mutex mutex;
    std::map<std::string, std::string> files;
    std::deque<ErrorKind> failures;   // consumed one per upload attempt
    int uploads = 0;
    std::function<void()> beforeUpload;

    bool has(const std::string& remote) {
        std::scoped_lock lock(mutex);
        return files.contains(remote);
    }
};

class FakeClient final : public ProtocolClient {
public:
    FakeClient(const Protocol protocol, std::shared_ptr<FakeRemote> remote)
        : protocol_(protocol), remote_(std::move(remote)) {}

    void connect(const CancelFn&) override { connected_ = true; }
    void disconnect() override { connected_ = false; }
    [[nodiscard]] bool isConnected() const override { return connected_; }

    void uploadFile(const fs::path& local, const std::string& remote,
                    const ProgressFn& onProgress, const CancelFn& shouldCancel) override {
        if (remote_->beforeUpload) remote_->beforeUpload();
        if (shouldCancel && shouldCancel()) throw InterruptedError("upload of " + remote + " cancelled");

        const auto data = readBytes(local);
        std::scoped_lock lock(remote_->mutex);
        ++remote_->uploads;
        if (!remote_->failures.empty()) {
            const auto kind = remote_->failures.front();
            remote_->failures.pop_front();
            throw TransferError(kind, "injected " + to_string(kind) + " failure");
        }
        remote_->files[remote] = data;
        if (onProgress) onProgress(data.size(), data.size());
    }

    void ensureDirectory(const std::string&) override {}
    bool exists(const std::string& remote) override { return remote_->has(remote); }

    void remove(const std::string& remote) override {
        std::scoped_lock lock(remote_->mutex);
        remote_->files.erase(remote);
    }

    [[nodiscard]] std::string remotePathFor(const fs::path& relative) const override {
        return "/upload/" + relative.generic_string();
    }

    [[nodiscard]] std::string parentOf(const std::string& remote) const override {
        return remote.substr(0, remote.find_last_of('/'));
    }

    [[nodiscard]] Protocol protocol() const override { return protocol_; }

private:
    Protocol protocol_;
    std::shared_ptr<FakeRemote> remote_;
    bool connected_ = false;
};

}

class EngineTest : public ::testing::Test {
protected:
    TempDir tmp;
    EventBus bus;
    ferry::config::Config cfg;
    std::shared_ptr<FakeRemote> ftp = std::make_shared<FakeRemote>();
    std::shared_ptr<FakeRemote> smb = std::make_shared<FakeRemote>();
    bool fakeSmb = false;
    std::atomic<int> clockOffsetSeconds{0};

    std::mutex eventsMutex;
    std::vector<FileOutcome> outcomes;
    std::vector<UploadError> errors;

    void SetUp() override {
        cfg.paths.source = tmp / "src";
        cfg.paths.target = tmp / "dst";
        cfg.paths.backup = tmp / "backup";
        cfg.paths.state_dir = tmp / "state";
        cfg.upload.mode = ferry::config::RunMode::Once;
        cfg.upload.interval_seconds = 1;
        cfg.upload.disk_threshold_percent = 0;
        cfg.network.enabled = false;
        fs::create_directories(cfg.paths.source);

        bus.on<FileOutcome>([this](const FileOutcome& o) {
            std::scoped_lock lock(eventsMutex);
            outcomes.push_back(o);
        });
        bus.on<UploadError>([this](const UploadError& e) {
            std::scoped_lock lock(eventsMutex);
            errors.push_back(e);
        });
    }

    // Real LocalCopyClient for smb unless fakeSmb is set, the in-memory fake for FTP.
    ClientFactory factory() {
        return [ftpRemote = ftp, smbRemote = fakeSmb ? smb : nullptr](
                   const Protocol p, const ferry::config::Config& c,
                   std::shared_ptr<ferry::storage::ResumeLedger> ledger) -> std::unique_ptr<ProtocolClient> {
            if (p == Protocol::FtpClient) return std::make_unique<FakeClient>(p, ftpRemote);
            if (smbRemote) return std::make_unique<FakeClient>(p, smbRemote);
            return defaultClientFactory()(p, c, std::move(ledger));
        };
    }

    std::unique_ptr<Engine> make() {
        auto engine = std::make_unique<Engine>(cfg, bus, factory());
        engine->setClock([this] { return system_clock::now() + std::chrono::seconds(clockOffsetSeconds.load()); });
        return engine;
    }

    // Moves the engine's clock past the first retry backoff.
    void advancePastBackoff() { clockOffsetSeconds += 11; }

    fs::path source(const std::string& rel, const std::string& data) const {
        const auto p = cfg.paths.source / rel;
        writeBytes(p, data);
        return p;
    }

    std::vector<FileOutcome::Kind> kinds() {
        std::scoped_lock lock(eventsMutex);
        std::vector<FileOutcome::Kind> out;
        for (const auto& o : outcomes) out.push_back(o.outcome);
        return out;
    }
};

TEST_F(EngineTest, UploadsMatchingFilesThenArchives) {
    const auto a = source("2024/05/a.jpg", "alpha");
    const auto notes = source("notes.txt", "ignored");

    auto engine = make();
    engine->runCycle();

    EXPECT_EQ(readBytes(cfg.paths.target / "2024/05/a.jpg"), "alpha");
    EXPECT_EQ(readBytes(cfg.paths.backup / "2024/05/a.jpg"), "alpha");
    EXPECT_FALSE(fs::exists(a));
    EXPECT_TRUE(fs::exists(notes));
    EXPECT_FALSE(fs::exists(cfg.paths.target / "notes.txt"));

    EXPECT_EQ(engine->stats().uploaded, 1u);
    EXPECT_EQ(kinds(), (std::vector{FileOutcome::Kind::Uploaded}));
}

TEST_F(EngineTest, DeletesSourceWhenBackupDisabled) {
    cfg.upload.enable_backup = false;
    const auto a = source("a.jpg", "alpha");

    auto engine = make();
    engine->runCycle();

    EXPECT_TRUE(fs::exists(cfg.paths.target / "a.jpg"));
    EXPECT_FALSE(fs::exists(a));
    EXPECT_FALSE(fs::exists(cfg.paths.backup / "a.jpg"));
}

TEST_F(EngineTest, ExistingTargetIsSkippedAndKept) {
    writeBytes(cfg.paths.target / "a.jpg", "already there");
    const auto a = source("a.jpg", "alpha");

    auto engine = make();
    engine->runCycle();

    EXPECT_EQ(readBytes(cfg.paths.target / "a.jpg"), "already there");
    EXPECT_TRUE(fs::exists(a));
    EXPECT_EQ(engine->stats().skipped, 1u);

    // Not reconsidered for the rest of the session.
    engine->runCycle();
    EXPECT_EQ(engine->stats().skipped, 1u);
    EXPECT_EQ(kinds(), (std::vector{FileOutcome::Kind::Skipped}));
}

TEST_F(EngineTest, DuplicateContentIsSkippedAndArchived) {
    cfg.dedup.enabled = true;
    cfg.dedup.strategy = DuplicateStrategy::Skip;

    auto engine = make();
    source("a.jpg", "same pixels");
    engine->runCycle();

    const auto b = source("b.jpg", "same pixels");
    engine->runCycle();

    EXPECT_FALSE(fs::exists(cfg.paths.target / "b.jpg"));
    EXPECT_FALSE(fs::exists(b));
    EXPECT_TRUE(fs::exists(cfg.paths.backup / "b.jpg"));

    const auto s = engine->stats();
    EXPECT_EQ(s.uploaded, 1u);
    EXPECT_EQ(s.skipped, 1u);
}

TEST_F(EngineTest, DuplicateFoundByRescanningTarget) {
    cfg.dedup.enabled = true;
    writeBytes(cfg.paths.target / "old_name.jpg", "same pixels");
    source("new_name.jpg", "same pixels");

    auto engine = make();
    engine->runCycle();

    EXPECT_FALSE(fs::exists(cfg.paths.target / "new_name.jpg"));
    EXPECT_EQ(engine->stats().skipped, 1u);

    const auto rec = engine->hashStore()->lookup(engine->hashStore()->contentHash(cfg.paths.target / "old_name.jpg"));
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->canonicalPath, cfg.paths.target / "old_name.jpg");
}

TEST_F(EngineTest, RenameStrategyUploadsUnderFreshName) {
    cfg.dedup.enabled = true;
    cfg.dedup.strategy = DuplicateStrategy::Rename;

    auto engine = make();
    source("a.jpg", "same pixels");
    engine->runCycle();
    source("a.jpg", "same pixels");
    engine->runCycle();

    EXPECT_EQ(readBytes(cfg.paths.target / "a.jpg"), "same pixels");
    EXPECT_EQ(readBytes(cfg.paths.target / "a (1).jpg"), "same pixels");
    EXPECT_EQ(engine->stats().uploaded, 2u);
}

TEST_F(EngineTest, OverwriteStrategyReplacesDuplicate) {
    cfg.dedup.enabled = true;
    cfg.dedup.strategy = DuplicateStrategy::Overwrite;

    auto engine = make();
    source("a.jpg", "same pixels");
    engine->runCycle();
    source("b.jpg", "same pixels");
    engine->runCycle();

    EXPECT_FALSE(fs::exists(cfg.paths.target / "a.jpg"));
    EXPECT_EQ(readBytes(cfg.paths.target / "b.jpg"), "same pixels");
    EXPECT_EQ(engine->stats().uploaded, 2u);
}

TEST_F(EngineTest, AskStrategyUsesTheAnswer) {
    cfg.dedup.enabled = true;
    cfg.dedup.strategy = DuplicateStrategy::Ask;

    auto engine = make();
    int prompts = 0;
    engine->duplicates().setHandler([&](const std::shared_ptr<DuplicatePrompt>& p) {
        ++prompts;
        p->answer(DuplicateStrategy::Rename);
    });

    source("a.jpg", "same pixels");
    engine->runCycle();
    source("a.jpg", "same pixels");
    engine->runCycle();

    EXPECT_EQ(prompts, 1);
    EXPECT_TRUE(fs::exists(cfg.paths.target / "a (1).jpg"));
}

TEST_F(EngineTest, DualWritePartialSuccessIsRetriedOnFailedChannelOnly) {
    cfg.upload.protocol = Protocol::Both;
    ftp->failures.push_back(ErrorKind::Network);
    const auto a = source("a.jpg", "alpha");

    auto engine = make();
    engine->runCycle();

    EXPECT_TRUE(fs::exists(cfg.paths.target / "a.jpg"));
    EXPECT_FALSE(ftp->has("/upload/a.jpg"));
    EXPECT_TRUE(fs::exists(a));

    const auto entry = engine->retries().peek(a);
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->state.done(Protocol::Smb));
    EXPECT_FALSE(entry->state.done(Protocol::FtpClient));
    EXPECT_EQ(entry->item.attemptCount, 1u);
    EXPECT_EQ(engine->stats().uploaded, 0u);

    // Scheduled items stay out of the scan until they are due.
    engine->runCycle();
    EXPECT_EQ(ftp->uploads, 1);
}

TEST_F(EngineTest, DualWriteDeliversBothChannels) {
    cfg.upload.protocol = Protocol::Both;
    source("a.jpg", "alpha");

    auto engine = make();
    engine->runCycle();

    EXPECT_EQ(readBytes(cfg.paths.target / "a.jpg"), "alpha");
    EXPECT_TRUE(ftp->has("/upload/a.jpg"));
    EXPECT_EQ(engine->stats().uploaded, 1u);
}

TEST_F(EngineTest, AuthFailureIsPermanent) {
    cfg.upload.protocol = Protocol::FtpClient;
    ftp->failures.push_back(ErrorKind::Auth);
    const auto a = source("a.jpg", "alpha");

    auto engine = make();
    engine->runCycle();

    EXPECT_EQ(engine->stats().failed, 1u);
    EXPECT_TRUE(fs::exists(a));
    EXPECT_FALSE(engine->retries().contains(a));

    const auto log = readBytes(cfg.failureLogPath());
    EXPECT_NE(log.find(a.string()), std::string::npos) << log;
    EXPECT_NE(log.find("(auth)"), std::string::npos) << log;

    {
        std::scoped_lock lock(eventsMutex);
        ASSERT_EQ(errors.size(), 1u);
        EXPECT_EQ(errors[0].file, "a.jpg");
        EXPECT_NE(errors[0].message.find("check FTP credentials"), std::string::npos);
    }

    // Permanently failed files are not retried this session.
    engine->runCycle();
    EXPECT_EQ(ftp->uploads, 1);
}

TEST_F(EngineTest, FtpOnlyUploadsAndArchives) {
    cfg.upload.protocol = Protocol::FtpClient;
    const auto a = source("x/a.jpg", "alpha");

    auto engine = make();
    engine->runCycle();

    EXPECT_TRUE(ftp->has("/upload/x/a.jpg"));
    EXPECT_FALSE(fs::exists(a));
    EXPECT_FALSE(fs::exists(cfg.paths.target));
}

TEST_F(EngineTest, PausedCycleDoesNothing) {
    source("a.jpg", "alpha");
    auto engine = make();

    engine->pause();
    engine->runCycle();
    EXPECT_FALSE(fs::exists(cfg.paths.target / "a.jpg"));

    engine->resume();
    engine->runCycle();
    EXPECT_TRUE(fs::exists(cfg.paths.target / "a.jpg"));
}

TEST_F(EngineTest, MissingSourceFailsToOpen) {
    cfg.paths.source = tmp / "no_such_dir";
    auto engine = make();
    try {
        engine->open();
        FAIL() << "expected PathError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Path);
    }
}

TEST_F(EngineTest, OnceModeStopsAfterOnePass) {
    source("a.jpg", "alpha");
    source("b/c.jpg", "gamma");

    std::vector<RunState> states;
    std::mutex statesMutex;
    bus.on<RunStateChanged>([&](const RunStateChanged& e) {
        std::scoped_lock lock(statesMutex);
        states.push_back(e.state);
    });

    auto engine = make();
    engine->start();
    ASSERT_TRUE(engine->wait(20s));

    EXPECT_EQ(engine->state(), RunState::Stopped);
    EXPECT_EQ(engine->stats().uploaded, 2u);
    EXPECT_TRUE(fs::exists(cfg.paths.backup / "a.jpg"));
    EXPECT_TRUE(fs::exists(cfg.paths.backup / "b/c.jpg"));

    engine->stop();
    std::scoped_lock lock(statesMutex);
    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.front(), RunState::Running);
    EXPECT_EQ(states.back(), RunState::Stopped);
}

TEST_F(EngineTest, PeriodicModeStopsOnRequest) {
    cfg.upload.mode = ferry::config::RunMode::Periodic;
    source("a.jpg", "alpha");

    auto engine = make();
    engine->start();
    ASSERT_TRUE(eventually([&] { return engine->stats().uploaded == 1; }, 10s));

    engine->stop(true, 5s);
    EXPECT_EQ(engine->state(), RunState::Stopped);
    EXPECT_FALSE(engine->isRunning());
}

TEST_F(EngineTest, DuplicateInSiblingDirectoryIsFound) {
    cfg.dedup.enabled = true;
    cfg.dedup.strategy = DuplicateStrategy::Skip;
    writeBytes(cfg.paths.target / "2024/a.jpg", "same pixels");
    const auto b = source("2025/b.jpg", "same pixels");

    auto engine = make();
    engine->runCycle();

    EXPECT_FALSE(fs::exists(cfg.paths.target / "2025/b.jpg"));
    EXPECT_FALSE(fs::exists(b));
    EXPECT_TRUE(fs::exists(cfg.paths.backup / "2025/b.jpg"));
    EXPECT_EQ(engine->stats().skipped, 1u);
    EXPECT_EQ(engine->stats().uploaded, 0u);
}

TEST_F(EngineTest, DueRetryCompletesOnlyTheFailedChannel) {
    cfg.upload.protocol = Protocol::Both;
    fakeSmb = true;
    ftp->failures.push_back(ErrorKind::Network);
    const auto a = source("a.jpg", "alpha");

    auto engine = make();
    engine->runCycle();
    EXPECT_EQ(smb->uploads, 1);
    EXPECT_EQ(ftp->uploads, 1);
    EXPECT_TRUE(fs::exists(a));

    advancePastBackoff();
    engine->runCycle();

    EXPECT_EQ(smb->uploads, 1);
    EXPECT_EQ(ftp->uploads, 2);
    EXPECT_TRUE(ftp->has("/upload/a.jpg"));
    EXPECT_FALSE(fs::exists(a));
    EXPECT_EQ(engine->retries().size(), 0u);
    EXPECT_EQ(engine->stats().uploaded, 1u);
    EXPECT_EQ(engine->stats().failed, 0u);
}

TEST_F(EngineTest, PauseDuringRetryKeepsAttemptsAndDeliveredChannels) {
    cfg.upload.protocol = Protocol::Both;
    fakeSmb = true;
    ftp->failures = {ErrorKind::Network, ErrorKind::Network};
    const auto a = source("a.jpg", "alpha");
    const auto b = source("b.jpg", "beta");

    auto engine = make();
    engine->runCycle();
    ASSERT_EQ(engine->retries().size(), 2u);
    EXPECT_EQ(smb->uploads, 2);

    // The first retried upload pauses the engine; the second never starts.
    ftp->beforeUpload = [&engine] { engine->pause(); };
    advancePastBackoff();
    engine->runCycle();
    ftp->beforeUpload = nullptr;

    EXPECT_EQ(ftp->uploads, 2);
    ASSERT_EQ(engine->retries().size(), 2u);
    for (const auto& path : {a, b}) {
        const auto entry = engine->retries().peek(path);
        ASSERT_TRUE(entry.has_value()) << path;
        EXPECT_EQ(entry->item.attemptCount, 1u) << path;
        EXPECT_TRUE(entry->state.done(Protocol::Smb)) << path;
    }

    engine->resume();
    engine->runCycle();

    EXPECT_EQ(smb->uploads, 2);
    EXPECT_EQ(ftp->uploads, 4);
    EXPECT_TRUE(ftp->has("/upload/a.jpg"));
    EXPECT_TRUE(ftp->has("/upload/b.jpg"));
    EXPECT_EQ(engine->retries().size(), 0u);
    EXPECT_EQ(engine->stats().uploaded, 2u);
}

TEST_F(EngineTest, InterruptedLargeFileResumesToIdenticalCopy) {
    cfg.resume.threshold_bytes = 4096;
    cfg.upload.chunk_size = 1024;
    const auto data = randomBytes(64 * 1024);
    const auto src = source("big.jpg", data);
    const auto target = cfg.paths.target / "big.jpg";

    auto engine = make();
    auto* raw = engine.get();
    std::atomic<bool> paused{false};
    std::mutex percentsMutex;
    std::vector<int> percents;
    bus.on<FileProgress>([&](const FileProgress& p) {
        {
            std::scoped_lock lock(percentsMutex);
            percents.push_back(p.percent);
        }
        if (p.percent >= 30 && !paused.exchange(true)) raw->pause();
    });

    engine->runCycle();

    EXPECT_FALSE(fs::exists(target));
    EXPECT_TRUE(fs::exists(ferry::util::partialPathFor(target)));
    ASSERT_EQ(engine->ledger()->pending().size(), 1u);
    EXPECT_GT(engine->ledger()->pending().front().uploadedBytes, 0u);
    EXPECT_TRUE(fs::exists(src));
    EXPECT_EQ(engine->stats().failed, 0u);
    EXPECT_EQ(kinds(), (std::vector{FileOutcome::Kind::Interrupted}));

    {
        std::scoped_lock lock(percentsMutex);
        percents.clear();
    }
    engine->resume();
    engine->runCycle();

    EXPECT_EQ(readBytes(target), data);
    EXPECT_FALSE(fs::exists(ferry::util::partialPathFor(target)));
    EXPECT_TRUE(engine->ledger()->pending().empty());
    EXPECT_EQ(engine->stats().uploaded, 1u);

    // Picked up where it stopped rather than from zero.
    std::scoped_lock lock(percentsMutex);
    ASSERT_FALSE(percents.empty());
    EXPECT_GE(percents.front(), 25);
}

TEST_F(EngineTest, LowDiskSpaceHoldsUploads) {
    cfg.upload.mode = ferry::config::RunMode::Periodic;
    cfg.upload.disk_threshold_percent = 101;   // no volume has this much free
    const auto a = source("a.jpg", "alpha");

    std::atomic<int> warnings{0};
    bus.on<DiskWarning>([&](const DiskWarning& w) {
        EXPECT_EQ(w.threshold, 101u);
        ++warnings;
    });

    auto engine = make();
    engine->start();
    ASSERT_TRUE(eventually([&] { return warnings.load() > 0; }, 10s));
    std::this_thread::sleep_for(300ms);

    EXPECT_EQ(engine->stats().uploaded, 0u);
    EXPECT_FALSE(fs::exists(cfg.paths.target / "a.jpg"));
    EXPECT_TRUE(fs::exists(a));
    EXPECT_EQ(engine->state(), RunState::Running);

    engine->stop();
}

TEST_F(EngineTest, UnreachableNetworkHoldsUploadsUntilRecovery) {
    cfg.upload.mode = ferry::config::RunMode::Periodic;
    cfg.network.enabled = true;
    cfg.network.check_interval_seconds = 1;
    cfg.network.auto_pause = false;

    std::atomic<bool> reachable{false};
    auto engine = make();
    engine->setNetworkProbe([&reachable](const ProbeTarget&) { return reachable.load(); });
    engine->start();

    ASSERT_NE(engine->monitor(), nullptr);
    ASSERT_TRUE(eventually([&] { return engine->monitor()->status() == NetworkStatus::Disconnected; }, 10s));
    std::this_thread::sleep_for(200ms);   // let a cycle that began before the first check finish

    const auto a = source("a.jpg", "alpha");
    std::this_thread::sleep_for(1500ms);
    EXPECT_FALSE(fs::exists(cfg.paths.target / "a.jpg"));
    EXPECT_EQ(engine->state(), RunState::Running);

    reachable = true;
    ASSERT_TRUE(eventually([&] { return engine->stats().uploaded == 1; }, 10s));
    EXPECT_TRUE(fs::exists(cfg.paths.target / "a.jpg"));
    EXPECT_FALSE(fs::exists(a));

    engine->stop();
}
