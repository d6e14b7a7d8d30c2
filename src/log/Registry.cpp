#include "log/Registry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <array>
#include <filesystem>

namespace ferry::log {

static constexpr std::array<const char*, 6> LOGGER_NAMES = {"ferry", "sync", "protocol", "storage", "net", "archive"};

void Registry::makeLogger_(const std::string& name, const spdlog::level::level_enum lvl,
                           const std::vector<spdlog::sink_ptr>& sinks) {
    const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
}

void Registry::init(const std::filesystem::path& logDir, const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;
    main_log_path_ = log_dir_ / "ferry.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    const std::vector<spdlog::sink_ptr> sinks{console_sink_, main_file_sink_};
    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger_("ferry",    sub_levels.ferry,    sinks);
    makeLogger_("sync",     sub_levels.sync,     sinks);
    makeLogger_("protocol", sub_levels.protocol, sinks);
    makeLogger_("storage",  sub_levels.storage,  sinks);
    makeLogger_("net",      sub_levels.net,      sinks);
    makeLogger_("archive",  sub_levels.archive,  sinks);

    initialized_ = true;
    get("ferry")->info("[LogRegistry] Initialized, writing to {}", main_log_path_.string());
}

void Registry::initForTesting(const spdlog::level::level_enum level) {
    if (initialized_) return;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(level);
    console_sink_->set_pattern(LOG_FORMAT);

    const std::vector<spdlog::sink_ptr> sinks{console_sink_};
    for (const auto* name : LOGGER_NAMES) makeLogger_(name, level, sinks);

    initialized_ = true;
}

void Registry::shutdown() {
    if (!initialized_) return;
    for (const auto* name : LOGGER_NAMES) {
        if (const auto lg = spdlog::get(name)) lg->flush();
        spdlog::drop(name);
    }
    console_sink_.reset();
    main_file_sink_.reset();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::replaceSinkEverywhere_(
    const std::shared_ptr<spdlog::sinks::sink>& old_sink,
    const std::shared_ptr<spdlog::sinks::sink>& new_sink)
{
    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) {
        auto sinks_copy = lg->sinks();
        bool touched = false;
        for (auto& s : sinks_copy) {
            if (s.get() == old_sink.get()) {
                s = new_sink;
                touched = true;
            }
        }
        if (touched) {
            lg->flush();
            lg->sinks() = std::move(sinks_copy);
        }
    });
}

// Called on SIGHUP so external logrotate can move ferry.log away.
void Registry::reopenMainLog() {
    if (!initialized_ || !main_file_sink_) return;

    auto fresh = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);

    fresh->set_level(main_file_sink_->level());
    fresh->set_pattern(LOG_FORMAT);

    replaceSinkEverywhere_(main_file_sink_, fresh);
    main_file_sink_ = std::move(fresh);
}

}
