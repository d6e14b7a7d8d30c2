#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace spdlog { class logger; }

namespace ferry::sync {

// Append-only audit trail of permanently failed files:
//   [YYYY-mm-dd HH:MM:SS] <path> - <reason>
// Flushed after every line so a crash cannot lose entries.
class FailureLog {
public:
    explicit FailureLog(std::filesystem::path file);
    ~FailureLog();

    FailureLog(const FailureLog&) = delete;
    FailureLog& operator=(const FailureLog&) = delete;

    void append(const std::filesystem::path& source, const std::string& reason);

    [[nodiscard]] const std::filesystem::path& path() const { return file_; }

private:
    std::filesystem::path file_;
    std::shared_ptr<spdlog::logger> logger_;
};

}
