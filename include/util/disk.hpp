#pragma once

#include <filesystem>
#include <optional>

namespace ferry::util {

// Free space of the volume holding path (or its nearest existing parent), in percent.
inline std::optional<double> freeSpacePercent(const std::filesystem::path& path) {
    namespace fs = std::filesystem;
    std::error_code ec;

    auto probe = path;
    while (!probe.empty() && !fs::exists(probe, ec)) {
        if (probe == probe.parent_path()) break;
        probe = probe.parent_path();
    }
    if (probe.empty()) return std::nullopt;

    const auto info = fs::space(probe, ec);
    if (ec || info.capacity == 0) return std::nullopt;
    return static_cast<double>(info.available) * 100.0 / static_cast<double>(info.capacity);
}

inline std::optional<double> usedSpacePercent(const std::filesystem::path& path) {
    const auto free = freeSpacePercent(path);
    if (!free) return std::nullopt;
    return 100.0 - *free;
}

}
