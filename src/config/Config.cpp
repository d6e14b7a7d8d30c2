#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/files.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace ferry::config {

namespace {

template <typename T>
void decodeSection(const YAML::Node& root, const std::string& key, T& out) {
    const auto node = root[key];
    if (!node) return;
    try {
        if (!YAML::convert<T>::decode(node, out))
            throw std::runtime_error("expected a mapping");
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid config section '" + key + "': " + e.what());
    }
}

Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping");

    decodeSection(root, "paths", cfg.paths);
    decodeSection(root, "upload", cfg.upload);
    decodeSection(root, "deduplication", cfg.dedup);
    decodeSection(root, "network", cfg.network);
    decodeSection(root, "ftp_client", cfg.ftp);
    decodeSection(root, "resume", cfg.resume);
    decodeSection(root, "auto_delete", cfg.cleanup);
    decodeSection(root, "logging", cfg.logging);

    cfg.upload.filters = util::normalizeExtensions(cfg.upload.filters);
    return cfg;
}

}

Config loadConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config '" + path + "': " + e.what());
    }
    return fromRoot(root);
}

Config parseConfig(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse config: ") + e.what());
    }
    return fromRoot(root);
}

std::string to_string(const RunMode m) {
    switch (m) {
        case RunMode::Periodic: return "periodic";
        case RunMode::Once: return "once";
        default: return "unknown";
    }
}

std::string to_string(const Protocol p) {
    switch (p) {
        case Protocol::Smb: return "smb";
        case Protocol::FtpClient: return "ftp_client";
        case Protocol::Both: return "both";
        default: return "unknown";
    }
}

std::string to_string(const HashAlgorithm a) {
    switch (a) {
        case HashAlgorithm::Md5: return "md5";
        case HashAlgorithm::Sha256: return "sha256";
        default: return "unknown";
    }
}

std::string to_string(const DuplicateStrategy s) {
    switch (s) {
        case DuplicateStrategy::Skip: return "skip";
        case DuplicateStrategy::Rename: return "rename";
        case DuplicateStrategy::Overwrite: return "overwrite";
        case DuplicateStrategy::Ask: return "ask";
        default: return "unknown";
    }
}

RunMode runModeFromString(const std::string& s) {
    const auto v = util::toLower(s);
    if (v == "periodic") return RunMode::Periodic;
    if (v == "once") return RunMode::Once;
    throw std::invalid_argument("unknown mode: " + s);
}

Protocol protocolFromString(const std::string& s) {
    const auto v = util::toLower(s);
    if (v == "smb") return Protocol::Smb;
    if (v == "ftp_client" || v == "ftp") return Protocol::FtpClient;
    if (v == "both") return Protocol::Both;
    throw std::invalid_argument("unknown protocol: " + s);
}

HashAlgorithm hashAlgorithmFromString(const std::string& s) {
    const auto v = util::toLower(s);
    if (v == "md5") return HashAlgorithm::Md5;
    if (v == "sha256") return HashAlgorithm::Sha256;
    throw std::invalid_argument("unknown hash_algorithm: " + s);
}

DuplicateStrategy duplicateStrategyFromString(const std::string& s) {
    const auto v = util::toLower(s);
    if (v == "skip") return DuplicateStrategy::Skip;
    if (v == "rename") return DuplicateStrategy::Rename;
    if (v == "overwrite") return DuplicateStrategy::Overwrite;
    if (v == "ask") return DuplicateStrategy::Ask;
    throw std::invalid_argument("unknown strategy: " + s);
}

}
