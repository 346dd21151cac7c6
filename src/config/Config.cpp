#include "pcloud/config/Config.hpp"
#include "pcloud/config/config_yaml.hpp"
#include "pcloud/errors/Errors.hpp"

#include <fmt/format.h>

#include <filesystem>

namespace pcloud::config {

namespace {

template<typename T>
void section(const YAML::Node& root, const char* key, T& out) {
    const auto node = root[key];
    if (!node || node.IsNull()) return;
    if (!YAML::convert<T>::decode(node, out))
        throw errors::ConfigurationError(fmt::format("Config section '{}' must be a mapping", key));
}

Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw errors::ConfigurationError("Config root must be a mapping");

    section<ApiConfig>(root, "api", cfg.api);
    section<TransportConfig>(root, "transport", cfg.transport);
    section<ConcurrencyConfig>(root, "concurrency", cfg.concurrency);
    section<LoggingConfig>(root, "logging", cfg.logging);

    return cfg;
}

}

Config loadConfig(const std::string& path) {
    if (!std::filesystem::exists(path))
        throw errors::ConfigurationError(fmt::format("Config file not found: {}", path));

    try {
        return fromRoot(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw errors::ConfigurationError(fmt::format("Failed to parse config {}: {}", path, e.what()));
    }
}

Config loadConfigFromString(const std::string& yaml) {
    try {
        return fromRoot(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw errors::ConfigurationError(fmt::format("Failed to parse config: {}", e.what()));
    }
}

}
