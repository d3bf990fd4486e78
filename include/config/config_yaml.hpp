#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sk::config;

template<>
struct convert<IdConfig> {
    static bool decode(const Node& node, IdConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.namespace_token = node["namespace"].as<std::string>("");
        rhs.random_bytes = node["random_bytes"].as<size_t>(16);
        return true;
    }
};

template<>
struct convert<SessionConfig> {
    static bool decode(const Node& node, SessionConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.duration = std::chrono::minutes(node["duration_minutes"].as<long>(60));
        rhs.cookie_secret = node["cookie_secret"].as<std::string>("");
        if (node["id"]) rhs.id = node["id"].as<IdConfig>();
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.sessionkeeper = spdlog::level::from_str(node["sessionkeeper"].as<std::string>("info"));
        rhs.session = spdlog::level::from_str(node["session"].as<std::string>("warn"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
