#include "pcloud/config/ConfigRegistry.hpp"

#include <cstdlib>

namespace pcloud::config {

void ConfigRegistry::init() {
    std::scoped_lock lock(mutex_);
    if (initialized_) return;

    if (const char* path = std::getenv("PCLOUD_CONFIG"); path && *path)
        config_ = loadConfig(path);

    initialized_ = true;
}

void ConfigRegistry::init(const std::string& path) {
    auto cfg = loadConfig(path);
    std::scoped_lock lock(mutex_);
    config_ = std::move(cfg);
    initialized_ = true;
}

void ConfigRegistry::set(Config cfg) {
    std::scoped_lock lock(mutex_);
    config_ = std::move(cfg);
    initialized_ = true;
}

Config ConfigRegistry::get() {
    init();
    std::scoped_lock lock(mutex_);
    return config_;
}

void ConfigRegistry::reset() {
    std::scoped_lock lock(mutex_);
    config_ = Config{};
    initialized_ = false;
}

bool ConfigRegistry::isInitialized() {
    std::scoped_lock lock(mutex_);
    return initialized_;
}

}
