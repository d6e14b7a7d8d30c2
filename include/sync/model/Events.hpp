#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace ferry::sync::model {

enum class NetworkStatus { Good, Unstable, Disconnected };

enum class RunState { Running, Paused, Stopped };

struct LogLine {
    spdlog::level::level_enum level;
    std::string message;
};

struct Stats {
    uint64_t uploaded{};
    uint64_t failed{};
    uint64_t skipped{};
    std::string throughput{"0.00 MB/s"};
};

struct FileProgress {
    std::string file;
    int percent{};
};

struct NetworkStatusChanged {
    NetworkStatus status;
    NetworkStatus previous;
};

struct RunStateChanged {
    RunState state;
};

// Percentages are free space; nullopt when the path could not be measured.
struct DiskWarning {
    std::optional<double> targetPercent;
    std::optional<double> backupPercent;
    unsigned int threshold{};
};

struct UploadError {
    std::string file;
    std::string message;
};

struct FileOutcome {
    enum class Kind { Uploaded, Skipped, Failed, Interrupted };

    std::string file;
    Kind outcome;
    std::string reason;
};

std::string to_string(NetworkStatus s);
std::string to_string(RunState s);
std::string to_string(FileOutcome::Kind k);

}
