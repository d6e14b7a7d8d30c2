#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace ferry::util {

namespace fs = std::filesystem;

inline std::string toLower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Filters are stored lower-case with a leading dot (".jpg").
inline std::vector<std::string> normalizeExtensions(const std::vector<std::string>& filters) {
    std::vector<std::string> out;
    out.reserve(filters.size());
    for (const auto& f : filters) {
        if (f.empty()) continue;
        auto ext = toLower(f);
        if (ext.front() != '.') ext.insert(ext.begin(), '.');
        out.push_back(std::move(ext));
    }
    return out;
}

inline bool matchesExtension(const fs::path& p, const std::vector<std::string>& normalized) {
    if (normalized.empty()) return true;
    const auto ext = toLower(p.extension().string());
    return std::ranges::find(normalized, ext) != normalized.end();
}

// First free "<stem> (n)<ext>" next to base, or base itself when it does not exist.
inline fs::path uniqueName(const fs::path& base, const unsigned int maxTries = 9999) {
    std::error_code ec;
    if (!fs::exists(base, ec)) return base;

    const auto dir = base.parent_path();
    const auto stem = base.stem().string();
    const auto ext = base.extension().string();

    for (unsigned int n = 1; n <= maxTries; ++n) {
        auto candidate = dir / (stem + " (" + std::to_string(n) + ")" + ext);
        if (!fs::exists(candidate, ec)) return candidate;
    }
    return base;
}

// Temp file used by resumable transfers: ".<name>.part" beside the final target.
inline fs::path partialPathFor(const fs::path& target) {
    return target.parent_path() / ("." + target.filename().string() + ".part");
}

inline bool isPartialFile(const fs::path& p) {
    const auto name = p.filename().string();
    return name.size() > 6 && name.front() == '.' && name.ends_with(".part");
}

inline void copyTimes(const fs::path& from, const fs::path& to) {
    fs::last_write_time(to, fs::last_write_time(from));
}

inline std::string readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (size > 0 && !in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

inline void writeFile(const fs::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to write file: " + path.string());
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

// Atomic replace: write a sibling temp file then rename over the destination.
inline void writeFileAtomic(const fs::path& path, const std::string& data) {
    const auto tmp = path.parent_path() / (path.filename().string() + ".tmp");
    writeFile(tmp, data);
    fs::rename(tmp, path);
}

} // namespace ferry::util
