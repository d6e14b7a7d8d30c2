#pragma once

#include <chrono>
#include <cstdint>

namespace ferry::sync::model {

struct ScopedOp {
    uint64_t size_bytes{};
    std::chrono::steady_clock::time_point timestamp_begin{};
    std::chrono::steady_clock::time_point timestamp_end{};
    bool success{};

    void start();
    void start(uint64_t size_bytes);
    void stop(bool success = true);
    [[nodiscard]] uint64_t duration_ms() const;
};

}
