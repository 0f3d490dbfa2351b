#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace uc::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf = {});

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> uc()        { return get("uc"); }
    static std::shared_ptr<spdlog::logger> dist()      { return get("dist"); }
    static std::shared_ptr<spdlog::logger> scan()      { return get("scan"); }
    static std::shared_ptr<spdlog::logger> match()     { return get("match"); }
    static std::shared_ptr<spdlog::logger> placement() { return get("placement"); }
    static std::shared_ptr<spdlog::logger> manifest()  { return get("manifest"); }
    static std::shared_ptr<spdlog::logger> archive()   { return get("archive"); }
    static std::shared_ptr<spdlog::logger> shell()     { return get("shell"); }
    static std::shared_ptr<spdlog::logger> config()    { return get("config"); }

    // Lowers console and subsystem levels for the current run (--debug / --trace)
    static void setVerbosity(spdlog::level::level_enum level);

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
