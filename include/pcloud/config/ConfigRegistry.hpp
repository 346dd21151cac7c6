#pragma once

#include "pcloud/config/Config.hpp"

#include <mutex>
#include <string>

namespace pcloud::config {

class ConfigRegistry {
public:
    // Loads $PCLOUD_CONFIG when set, otherwise keeps the built-in defaults.
    static void init();
    static void init(const std::string& path);

    // Replaces the active configuration outright.
    static void set(Config cfg);

    // Initializes lazily on first access.
    static Config get();

    // Forgets the active configuration; the next get() loads it again.
    static void reset();

    [[nodiscard]] static bool isInitialized();

private:
    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::mutex mutex_;
};

}
