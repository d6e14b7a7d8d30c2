#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

namespace ferry::sync {

// Auto-delete: once the watched folder's volume is at or above the usage
// threshold, files older than keep_days are removed.
class CleanupService : public concurrency::AsyncService {
public:
    using UsageFn = std::function<std::optional<double>(const std::filesystem::path&)>;

    struct Preview {
        size_t files{};
        uintmax_t bytes{};
    };

    struct Result {
        std::optional<double> usedPercent;
        bool triggered{};
        size_t deleted{};
        size_t errors{};
        uintmax_t freedBytes{};
    };

    explicit CleanupService(config::CleanupConfig cfg, UsageFn usage = {});
    ~CleanupService() override;

    [[nodiscard]] std::vector<std::filesystem::path> candidates(
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    [[nodiscard]] Preview preview() const;

    Result runOnce();

protected:
    void runLoop() override;

private:
    config::CleanupConfig cfg_;
    UsageFn usage_;
};

}
