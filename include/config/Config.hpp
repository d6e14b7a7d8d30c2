#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace ferry::config {

constexpr static uintmax_t DEFAULT_RESUME_THRESHOLD_BYTES = 10 * 1024 * 1024; // 10MB
constexpr static uintmax_t DEFAULT_CHUNK_SIZE_BYTES = 1024 * 1024;           // 1MB

enum class RunMode { Periodic, Once };
enum class Protocol { Smb, FtpClient, Both };
enum class HashAlgorithm { Md5, Sha256 };
enum class DuplicateStrategy { Skip, Rename, Overwrite, Ask };

struct PathsConfig {
    std::filesystem::path source;
    std::filesystem::path target;
    std::filesystem::path backup;
    std::filesystem::path state_dir = "/var/lib/ferry";
    std::filesystem::path log_dir = "/var/log/ferry";
};

struct UploadConfig {
    unsigned int interval_seconds = 30;
    RunMode mode = RunMode::Periodic;
    unsigned int disk_threshold_percent = 10;   // clamped to >= 5 on load
    unsigned int retry_count = 3;
    unsigned int disk_full_max_attempts = 2;
    bool retry_permission_errors = false;
    std::vector<std::string> filters = {".jpg", ".jpeg", ".png", ".bmp", ".gif", ".tif", ".tiff", ".raw"};
    bool enable_backup = true;
    Protocol protocol = Protocol::Smb;
    bool limit_upload_rate = false;
    double max_upload_rate_mbps = 10.0;          // megabytes per second
    unsigned int stall_timeout_seconds = 60;
    unsigned int io_timeout_seconds = 5;
    uintmax_t chunk_size = DEFAULT_CHUNK_SIZE_BYTES;
};

struct DedupConfig {
    bool enabled = false;
    HashAlgorithm hash_algorithm = HashAlgorithm::Md5;
    DuplicateStrategy strategy = DuplicateStrategy::Skip;
    bool quick_hash = false;
    unsigned int ask_timeout_seconds = 120;
};

struct NetworkConfig {
    bool enabled = true;
    unsigned int check_interval_seconds = 10;
    bool auto_pause = true;
    bool auto_resume = true;
    unsigned int probe_timeout_ms = 2000;
};

struct FTPClientConfig {
    std::string host;
    uint16_t port = 21;
    std::string username = "anonymous";
    std::string password;
    std::string remote_path = "/upload";
    bool enable_tls = false;
    bool passive_mode = true;
    unsigned int timeout_seconds = 30;
    unsigned int retry_count = 3;
};

struct ResumeConfig {
    uintmax_t threshold_bytes = DEFAULT_RESUME_THRESHOLD_BYTES;
    unsigned int expiry_days = 7;
};

struct CleanupConfig {
    bool enabled = false;
    std::filesystem::path folder;
    unsigned int threshold_percent = 80;
    unsigned int keep_days = 10;
    unsigned int check_interval_seconds = 300;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum ferry    = spdlog::level::info;   // Startup, shutdown, run state
    spdlog::level::level_enum sync     = spdlog::level::info;   // Per-file outcomes and scan passes
    spdlog::level::level_enum protocol = spdlog::level::info;   // Connects, directory walks, transfer errors
    spdlog::level::level_enum storage  = spdlog::level::warn;   // Ledger corruption, dedup store I/O
    spdlog::level::level_enum net      = spdlog::level::info;   // Reachability transitions
    spdlog::level::level_enum archive  = spdlog::level::info;   // Moves and deletes of uploaded sources
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
};

struct Config {
    PathsConfig paths;
    UploadConfig upload;
    DedupConfig dedup;
    NetworkConfig network;
    FTPClientConfig ftp;
    ResumeConfig resume;
    CleanupConfig cleanup;
    LoggingConfig logging;

    [[nodiscard]] std::filesystem::path resumeDir() const { return paths.state_dir / "resume_data"; }
    [[nodiscard]] std::filesystem::path dedupLedgerPath() const { return paths.state_dir / "file_hash_db.json"; }
    [[nodiscard]] std::filesystem::path failureLogPath() const { return paths.state_dir / "failed_files.log"; }
};

Config loadConfig(const std::string& path);
Config parseConfig(const std::string& yaml);

std::string to_string(RunMode m);
std::string to_string(Protocol p);
std::string to_string(HashAlgorithm a);
std::string to_string(DuplicateStrategy s);

RunMode runModeFromString(const std::string& s);
Protocol protocolFromString(const std::string& s);
HashAlgorithm hashAlgorithmFromString(const std::string& s);
DuplicateStrategy duplicateStrategyFromString(const std::string& s);

} // namespace ferry::config
