#include "sync/model/Events.hpp"

namespace ferry::sync::model {

std::string to_string(const NetworkStatus s) {
    switch (s) {
        case NetworkStatus::Good: return "good";
        case NetworkStatus::Unstable: return "unstable";
        case NetworkStatus::Disconnected: return "disconnected";
        default: return "unknown";
    }
}

std::string to_string(const RunState s) {
    switch (s) {
        case RunState::Running: return "running";
        case RunState::Paused: return "paused";
        case RunState::Stopped: return "stopped";
        default: return "unknown";
    }
}

std::string to_string(const FileOutcome::Kind k) {
    switch (k) {
        case FileOutcome::Kind::Uploaded: return "uploaded";
        case FileOutcome::Kind::Skipped: return "skipped";
        case FileOutcome::Kind::Failed: return "failed";
        case FileOutcome::Kind::Interrupted: return "interrupted";
        default: return "unknown";
    }
}

}
