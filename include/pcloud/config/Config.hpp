#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <string>

namespace pcloud::config {

struct ApiConfig {
    std::string host = "https://eapi.pcloud.com";
    bool resolve_nearest_server = true;   // ask getapiserver after a password login
};

struct TransportConfig {
    unsigned int connect_timeout_seconds = 30;
    unsigned int request_timeout_seconds = 0;   // 0 = no overall limit
    std::string user_agent = "pcloud-cpp/0.1";
    bool verify_tls = true;
    bool follow_redirects = true;
};

struct ConcurrencyConfig {
    unsigned int worker_threads = 4;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum pcloud       = spdlog::level::info;   // Library lifecycle
    spdlog::level::level_enum client       = spdlog::level::warn;   // Rejected API calls
    spdlog::level::level_enum auth         = spdlog::level::warn;   // Failed logins, failed logouts
    spdlog::level::level_enum transport    = spdlog::level::warn;   // Connection failures, timeouts
    spdlog::level::level_enum upload       = spdlog::level::warn;   // Conflicts, partial batches
    spdlog::level::level_enum checksum     = spdlog::level::warn;   // Integrity mismatches
    spdlog::level::level_enum concurrency  = spdlog::level::warn;   // Worker failures
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::string log_file;   // empty = console only
    std::uintmax_t max_file_size_bytes = 10 * 1024 * 1024;
    unsigned int max_files = 3;
    LogLevelsConfig levels;
};

struct Config {
    ApiConfig api;
    TransportConfig transport;
    ConcurrencyConfig concurrency;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);

Config loadConfigFromString(const std::string& yaml);

}
