#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

namespace ferry::util {

// Per-chunk pacing: after a chunk of n bytes, sleep whatever is left of n / cap seconds.
class RateLimiter {
public:
    explicit RateLimiter(const uint64_t bytesPerSecond = 0) : bytesPerSecond_(bytesPerSecond) {}

    [[nodiscard]] bool enabled() const { return bytesPerSecond_ > 0; }
    [[nodiscard]] uint64_t bytesPerSecond() const { return bytesPerSecond_; }

    void chunkStarted() { chunkStart_ = std::chrono::steady_clock::now(); }

    // Sleep in slices so a stop request is honoured while throttled.
    void chunkFinished(const uint64_t bytes, const std::function<bool()>& shouldCancel = {}) const {
        if (!enabled() || bytes == 0) return;

        using namespace std::chrono;
        const auto expected = duration<double>(static_cast<double>(bytes) / static_cast<double>(bytesPerSecond_));
        const auto deadline = chunkStart_ + duration_cast<steady_clock::duration>(expected);

        while (steady_clock::now() < deadline) {
            if (shouldCancel && shouldCancel()) return;
            std::this_thread::sleep_for(std::min<steady_clock::duration>(deadline - steady_clock::now(), milliseconds(100)));
        }
    }

private:
    uint64_t bytesPerSecond_;
    std::chrono::steady_clock::time_point chunkStart_{};
};

}
