#pragma once

#include "sync/model/ScopedOp.hpp"

#include <cstdint>
#include <deque>
#include <string>

namespace ferry::sync::model {

// Rolling upload rate over the last `window` successful transfers.
struct Throughput {
    static constexpr size_t DEFAULT_WINDOW = 10;

    explicit Throughput(size_t window = DEFAULT_WINDOW) : window_(window) {}

    uint64_t num_ops{};
    uint64_t failed_ops{};
    uint64_t size_bytes{};
    uint64_t duration_ms{};

    void record(const ScopedOp& op);
    void clear();

    [[nodiscard]] double bytesPerSecond() const;

    // "12.34 MB/s"
    [[nodiscard]] std::string toString() const;

private:
    size_t window_;
    std::deque<ScopedOp> scoped_ops;

    void computeStats();
};

}
