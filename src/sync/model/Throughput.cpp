#include "sync/model/Throughput.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace ferry::sync::model;

void Throughput::record(const ScopedOp& op) {
    ++num_ops;
    if (!op.success) {
        ++failed_ops;
        return;
    }
    scoped_ops.push_back(op);
    while (scoped_ops.size() > window_) scoped_ops.pop_front();
    computeStats();
}

void Throughput::clear() {
    scoped_ops.clear();
    num_ops = failed_ops = size_bytes = duration_ms = 0;
}

void Throughput::computeStats() {
    size_bytes = 0;
    duration_ms = 0;
    for (const auto& op : scoped_ops) {
        size_bytes += op.size_bytes;
        duration_ms += op.duration_ms();
    }
}

double Throughput::bytesPerSecond() const {
    if (scoped_ops.empty()) return 0.0;
    // Sub-millisecond copies still count as 1ms to keep the rate finite.
    const auto ms = std::max<uint64_t>(duration_ms, 1);
    return static_cast<double>(size_bytes) * 1000.0 / static_cast<double>(ms);
}

std::string Throughput::toString() const {
    return fmt::format("{:.2f} MB/s", bytesPerSecond() / (1024.0 * 1024.0));
}
