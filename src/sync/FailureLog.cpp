#include "sync/FailureLog.hpp"
#include "log/Registry.hpp"

#include <atomic>
#include <spdlog/sinks/basic_file_sink.h>

using namespace ferry::sync;
using namespace ferry::log;

namespace {
std::atomic<unsigned int> instanceCounter{0};
}

FailureLog::FailureLog(std::filesystem::path file) : file_(std::move(file)) {
    if (file_.has_parent_path()) std::filesystem::create_directories(file_.parent_path());

    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_.string(), /*truncate=*/false);
    sink->set_pattern("[%Y-%m-%d %H:%M:%S] %v");

    // Not registered: the audit trail must never pick up console output or global level changes.
    logger_ = std::make_shared<spdlog::logger>("failures#" + std::to_string(instanceCounter.fetch_add(1)), sink);
    logger_->set_level(spdlog::level::info);
    logger_->flush_on(spdlog::level::info);
}

FailureLog::~FailureLog() {
    if (logger_) logger_->flush();
}

void FailureLog::append(const std::filesystem::path& source, const std::string& reason) {
    logger_->info("{} - {}", source.string(), reason);
    Registry::sync()->warn("[FailureLog] {} permanently failed: {}", source.filename().string(), reason);
}
