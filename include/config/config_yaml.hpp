#pragma once

#include "config/Config.hpp"

#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ferry::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<std::filesystem::path> {
    static Node encode(const std::filesystem::path& rhs) {
        return Node(rhs.string());
    }

    static bool decode(const Node& node, std::filesystem::path& rhs) {
        if (!node.IsScalar()) return false;
        rhs = std::filesystem::path(node.as<std::string>());
        return true;
    }
};

// Enumerations are parsed case-insensitively. An unknown value throws from the
// *FromString helpers so loadConfig can name the offending key.
template<>
struct convert<RunMode> {
    static Node encode(const RunMode& rhs) { return Node(to_string(rhs)); }
    static bool decode(const Node& node, RunMode& rhs) {
        if (!node.IsScalar()) return false;
        rhs = runModeFromString(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<Protocol> {
    static Node encode(const Protocol& rhs) { return Node(to_string(rhs)); }
    static bool decode(const Node& node, Protocol& rhs) {
        if (!node.IsScalar()) return false;
        rhs = protocolFromString(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<HashAlgorithm> {
    static Node encode(const HashAlgorithm& rhs) { return Node(to_string(rhs)); }
    static bool decode(const Node& node, HashAlgorithm& rhs) {
        if (!node.IsScalar()) return false;
        rhs = hashAlgorithmFromString(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<DuplicateStrategy> {
    static Node encode(const DuplicateStrategy& rhs) { return Node(to_string(rhs)); }
    static bool decode(const Node& node, DuplicateStrategy& rhs) {
        if (!node.IsScalar()) return false;
        rhs = duplicateStrategyFromString(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<PathsConfig> {
    static Node encode(const PathsConfig& rhs) {
        Node node;
        node["source"] = rhs.source;
        node["target"] = rhs.target;
        node["backup"] = rhs.backup;
        node["state_dir"] = rhs.state_dir;
        node["log_dir"] = rhs.log_dir;
        return node;
    }

    static bool decode(const Node& node, PathsConfig& rhs) {
        if (!node.IsMap()) return false;
        const PathsConfig def;
        rhs.source = node["source"].as<std::filesystem::path>(def.source);
        rhs.target = node["target"].as<std::filesystem::path>(def.target);
        rhs.backup = node["backup"].as<std::filesystem::path>(def.backup);
        rhs.state_dir = node["state_dir"].as<std::filesystem::path>(def.state_dir);
        rhs.log_dir = node["log_dir"].as<std::filesystem::path>(def.log_dir);
        return true;
    }
};

template<>
struct convert<UploadConfig> {
    static Node encode(const UploadConfig& rhs) {
        Node node;
        node["interval_seconds"] = rhs.interval_seconds;
        node["mode"] = rhs.mode;
        node["disk_threshold_percent"] = rhs.disk_threshold_percent;
        node["retry_count"] = rhs.retry_count;
        node["disk_full_max_attempts"] = rhs.disk_full_max_attempts;
        node["retry_permission_errors"] = rhs.retry_permission_errors;
        node["filters"] = rhs.filters;
        node["enable_backup"] = rhs.enable_backup;
        node["protocol"] = rhs.protocol;
        node["limit_upload_rate"] = rhs.limit_upload_rate;
        node["max_upload_rate_mbps"] = rhs.max_upload_rate_mbps;
        node["stall_timeout_seconds"] = rhs.stall_timeout_seconds;
        node["io_timeout_seconds"] = rhs.io_timeout_seconds;
        node["chunk_size_kb"] = rhs.chunk_size / 1024;
        return node;
    }

    static bool decode(const Node& node, UploadConfig& rhs) {
        if (!node.IsMap()) return false;
        const UploadConfig def;
        rhs.interval_seconds = node["interval_seconds"].as<unsigned int>(def.interval_seconds);
        rhs.mode = node["mode"].as<RunMode>(def.mode);
        rhs.disk_threshold_percent = std::max(5u, node["disk_threshold_percent"].as<unsigned int>(def.disk_threshold_percent));
        rhs.retry_count = std::max(1u, node["retry_count"].as<unsigned int>(def.retry_count));
        rhs.disk_full_max_attempts = node["disk_full_max_attempts"].as<unsigned int>(def.disk_full_max_attempts);
        rhs.retry_permission_errors = node["retry_permission_errors"].as<bool>(def.retry_permission_errors);
        rhs.filters = node["filters"].as<std::vector<std::string>>(def.filters);
        rhs.enable_backup = node["enable_backup"].as<bool>(def.enable_backup);
        rhs.protocol = node["protocol"].as<Protocol>(def.protocol);
        rhs.limit_upload_rate = node["limit_upload_rate"].as<bool>(def.limit_upload_rate);
        rhs.max_upload_rate_mbps = node["max_upload_rate_mbps"].as<double>(def.max_upload_rate_mbps);
        rhs.stall_timeout_seconds = node["stall_timeout_seconds"].as<unsigned int>(def.stall_timeout_seconds);
        rhs.io_timeout_seconds = node["io_timeout_seconds"].as<unsigned int>(def.io_timeout_seconds);
        rhs.chunk_size = node["chunk_size_kb"].as<uintmax_t>(def.chunk_size / 1024) * 1024;
        if (rhs.chunk_size == 0) rhs.chunk_size = def.chunk_size;
        return true;
    }
};

template<>
struct convert<DedupConfig> {
    static Node encode(const DedupConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["hash_algorithm"] = rhs.hash_algorithm;
        node["strategy"] = rhs.strategy;
        node["quick_hash"] = rhs.quick_hash;
        node["ask_timeout_seconds"] = rhs.ask_timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, DedupConfig& rhs) {
        if (!node.IsMap()) return false;
        const DedupConfig def;
        rhs.enabled = node["enabled"].as<bool>(def.enabled);
        rhs.hash_algorithm = node["hash_algorithm"].as<HashAlgorithm>(def.hash_algorithm);
        rhs.strategy = node["strategy"].as<DuplicateStrategy>(def.strategy);
        rhs.quick_hash = node["quick_hash"].as<bool>(def.quick_hash);
        rhs.ask_timeout_seconds = node["ask_timeout_seconds"].as<unsigned int>(def.ask_timeout_seconds);
        return true;
    }
};

template<>
struct convert<NetworkConfig> {
    static Node encode(const NetworkConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["check_interval_seconds"] = rhs.check_interval_seconds;
        node["auto_pause"] = rhs.auto_pause;
        node["auto_resume"] = rhs.auto_resume;
        node["probe_timeout_ms"] = rhs.probe_timeout_ms;
        return node;
    }

    static bool decode(const Node& node, NetworkConfig& rhs) {
        if (!node.IsMap()) return false;
        const NetworkConfig def;
        rhs.enabled = node["enabled"].as<bool>(def.enabled);
        rhs.check_interval_seconds = std::max(1u, node["check_interval_seconds"].as<unsigned int>(def.check_interval_seconds));
        rhs.auto_pause = node["auto_pause"].as<bool>(def.auto_pause);
        rhs.auto_resume = node["auto_resume"].as<bool>(def.auto_resume);
        rhs.probe_timeout_ms = node["probe_timeout_ms"].as<unsigned int>(def.probe_timeout_ms);
        return true;
    }
};

template<>
struct convert<FTPClientConfig> {
    static Node encode(const FTPClientConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["username"] = rhs.username;
        node["password"] = rhs.password;
        node["remote_path"] = rhs.remote_path;
        node["enable_tls"] = rhs.enable_tls;
        node["passive_mode"] = rhs.passive_mode;
        node["timeout"] = rhs.timeout_seconds;
        node["retry_count"] = rhs.retry_count;
        return node;
    }

    static bool decode(const Node& node, FTPClientConfig& rhs) {
        if (!node.IsMap()) return false;
        const FTPClientConfig def;
        rhs.host = node["host"].as<std::string>(def.host);
        rhs.port = node["port"].as<uint16_t>(def.port);
        rhs.username = node["username"].as<std::string>(def.username);
        rhs.password = node["password"].as<std::string>(def.password);
        rhs.remote_path = node["remote_path"].as<std::string>(def.remote_path);
        rhs.enable_tls = node["enable_tls"].as<bool>(def.enable_tls);
        rhs.passive_mode = node["passive_mode"].as<bool>(def.passive_mode);
        rhs.timeout_seconds = node["timeout"].as<unsigned int>(def.timeout_seconds);
        rhs.retry_count = std::max(1u, node["retry_count"].as<unsigned int>(def.retry_count));
        return true;
    }
};

template<>
struct convert<ResumeConfig> {
    static Node encode(const ResumeConfig& rhs) {
        Node node;
        node["threshold_mb"] = rhs.threshold_bytes / (1024 * 1024);
        node["expiry_days"] = rhs.expiry_days;
        return node;
    }

    static bool decode(const Node& node, ResumeConfig& rhs) {
        if (!node.IsMap()) return false;
        const ResumeConfig def;
        rhs.threshold_bytes = node["threshold_mb"].as<uintmax_t>(def.threshold_bytes / (1024 * 1024)) * 1024 * 1024;
        rhs.expiry_days = node["expiry_days"].as<unsigned int>(def.expiry_days);
        return true;
    }
};

template<>
struct convert<CleanupConfig> {
    static Node encode(const CleanupConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["folder"] = rhs.folder;
        node["threshold_percent"] = rhs.threshold_percent;
        node["keep_days"] = rhs.keep_days;
        node["check_interval_seconds"] = rhs.check_interval_seconds;
        return node;
    }

    static bool decode(const Node& node, CleanupConfig& rhs) {
        if (!node.IsMap()) return false;
        const CleanupConfig def;
        rhs.enabled = node["enabled"].as<bool>(def.enabled);
        rhs.folder = node["folder"].as<std::filesystem::path>(def.folder);
        rhs.threshold_percent = std::min(100u, node["threshold_percent"].as<unsigned int>(def.threshold_percent));
        rhs.keep_days = node["keep_days"].as<unsigned int>(def.keep_days);
        rhs.check_interval_seconds = std::max(1u, node["check_interval_seconds"].as<unsigned int>(def.check_interval_seconds));
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["ferry"]    = to_std_string(spdlog::level::to_string_view(rhs.ferry));
        node["sync"]     = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["protocol"] = to_std_string(spdlog::level::to_string_view(rhs.protocol));
        node["storage"]  = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["net"]      = to_std_string(spdlog::level::to_string_view(rhs.net));
        node["archive"]  = to_std_string(spdlog::level::to_string_view(rhs.archive));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.ferry = spdlog::level::from_str(node["ferry"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.protocol = spdlog::level::from_str(node["protocol"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        rhs.net = spdlog::level::from_str(node["net"].as<std::string>("info"));
        rhs.archive = spdlog::level::from_str(node["archive"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
