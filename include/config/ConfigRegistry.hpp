#pragma once

#include "config/Config.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>

namespace sk::config {

inline const std::filesystem::path DEFAULT_CONFIG_PATH = "/etc/sessionkeeper/config.yaml";

class ConfigRegistry {
public:
    // Loads the file once; later calls are no-ops.
    static void init(const std::filesystem::path& path = DEFAULT_CONFIG_PATH);
    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;
};

} // namespace sk::config
