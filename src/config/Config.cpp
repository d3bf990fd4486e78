#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace sk::config {

template <typename T>
void decodeSection(const YAML::Node& root, const std::string& key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error("Invalid configuration section '" + key + "': expected a mapping");
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    decodeSection(root, "session", cfg.session);
    decodeSection(root, "logging", cfg.logging);

    if (cfg.session.duration.count() <= 0)
        throw std::runtime_error("session.duration_minutes must be > 0");
    if (cfg.session.id.random_bytes == 0)
        throw std::runtime_error("session.id.random_bytes must be > 0");

    return cfg;
}

}
