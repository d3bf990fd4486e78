#pragma once

#include "config/Config.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace sk::log {

class Registry {
public:
    // Initialize all loggers from ConfigRegistry, which must already be initialized.
    static void init();

    static void init(const config::LoggingConfig& cnf);

    // Generic access by name. Before init() every name resolves to spdlog's default logger.
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> sessionkeeper() { return get("sessionkeeper"); }
    static std::shared_ptr<spdlog::logger> session()       { return get("session"); }
    static std::shared_ptr<spdlog::logger> crypto()        { return get("crypto"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline std::atomic<bool> initialized_{false};

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
