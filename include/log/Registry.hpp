#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace ferry::log {

class Registry {
public:
    // Initialize all loggers with console + rotating file sinks.
    static void init(const std::filesystem::path& logDir, const config::LoggingConfig& cnf);

    // Console-only loggers, no log directory required.
    static void initForTesting(spdlog::level::level_enum level = spdlog::level::warn);

    static void shutdown();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> ferry()    { return get("ferry"); }
    static std::shared_ptr<spdlog::logger> sync()     { return get("sync"); }
    static std::shared_ptr<spdlog::logger> protocol() { return get("protocol"); }
    static std::shared_ptr<spdlog::logger> storage()  { return get("storage"); }
    static std::shared_ptr<spdlog::logger> net()      { return get("net"); }
    static std::shared_ptr<spdlog::logger> archive()  { return get("archive"); }

    [[nodiscard]] static bool isInitialized();

    static void reopenMainLog();

    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

private:
    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    // keep the shared sinks so we can swap them later
    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static void makeLogger_(const std::string& name, spdlog::level::level_enum lvl,
                            const std::vector<spdlog::sink_ptr>& sinks);

    static void replaceSinkEverywhere_(const std::shared_ptr<spdlog::sinks::sink>& old_sink,
                                       const std::shared_ptr<spdlog::sinks::sink>& new_sink);
};

}
