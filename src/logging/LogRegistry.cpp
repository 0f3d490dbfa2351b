#include "logging/LogRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace uc::logging {

void LogRegistry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    // main file sink (rotating), only when a log directory is configured
    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);
        main_log_path_ = cnf.log_dir / "update-creator.log";

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("uc",        sub_levels.uc);
    makeLogger("dist",      sub_levels.dist);
    makeLogger("scan",      sub_levels.scan);
    makeLogger("match",     sub_levels.match);
    makeLogger("placement", sub_levels.placement);
    makeLogger("manifest",  sub_levels.manifest);
    makeLogger("archive",   sub_levels.archive);
    makeLogger("shell",     sub_levels.shell);
    makeLogger("config",    sub_levels.config);

    initialized_ = true;
    get("uc")->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

void LogRegistry::setVerbosity(const spdlog::level::level_enum level) {
    if (!initialized_) return;

    console_sink_->set_level(level);
    if (main_file_sink_ && main_file_sink_->level() > level) main_file_sink_->set_level(level);

    spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& lg) {
        if (lg->level() > level) lg->set_level(level);
    });
}

bool LogRegistry::isInitialized() { return initialized_; }

}
