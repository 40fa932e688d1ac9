#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace hs::config {

class ConfigRegistry {
public:
    // Loads once; a missing file leaves the built-in defaults in place
    static void init(const std::filesystem::path& path = defaultConfigPath());
    static const Config& get();
    [[nodiscard]] static bool isInitialized();

    // $HUBSH_CONFIG, else $XDG_CONFIG_HOME/hubsh/config.yaml, else ~/.config/hubsh/config.yaml
    static std::filesystem::path defaultConfigPath();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

}
