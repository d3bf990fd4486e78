#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace sk::config {

struct IdConfig {
    std::string namespace_token{};  // empty => no prefix
    size_t random_bytes = 16;
};

struct SessionConfig {
    std::chrono::minutes duration = std::chrono::minutes(60);
    std::string cookie_secret{};    // empty => unsigned cookies
    IdConfig id;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum sessionkeeper = spdlog::level::info;  // startup, configuration summary
    spdlog::level::level_enum session       = spdlog::level::warn;  // lifecycle events are debug
    spdlog::level::level_enum crypto        = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{};  // empty => console only
    LogLevelsConfig levels;
};

struct Config {
    SessionConfig session;
    LoggingConfig logging;
};

// Throws YAML::Exception when the file is missing or unparsable and std::runtime_error
// when a section has the wrong shape or an invalid value.
Config loadConfig(const std::filesystem::path& path);

}
