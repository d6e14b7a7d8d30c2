#pragma once

#include <cstdint>

namespace ferry::util {

constexpr std::uint64_t operator"" _KiB(unsigned long long v) { return v * 1024ULL; }
constexpr std::uint64_t operator"" _MiB(unsigned long long v) { return v * 1024ULL * 1024ULL; }
constexpr std::uint64_t operator"" _GiB(unsigned long long v) { return v * 1024ULL * 1024ULL * 1024ULL; }

inline double toMiB(const std::uint64_t bytes) { return static_cast<double>(bytes) / (1024.0 * 1024.0); }

}
