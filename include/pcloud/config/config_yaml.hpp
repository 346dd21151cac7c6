#pragma once

#include "pcloud/config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace pcloud::config;

template<>
struct convert<ApiConfig> {
    static Node encode(const ApiConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["resolve_nearest_server"] = rhs.resolve_nearest_server;
        return node;
    }

    static bool decode(const Node& node, ApiConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("https://eapi.pcloud.com");
        rhs.resolve_nearest_server = node["resolve_nearest_server"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<TransportConfig> {
    static Node encode(const TransportConfig& rhs) {
        Node node;
        node["connect_timeout_seconds"] = rhs.connect_timeout_seconds;
        node["request_timeout_seconds"] = rhs.request_timeout_seconds;
        node["user_agent"] = rhs.user_agent;
        node["verify_tls"] = rhs.verify_tls;
        node["follow_redirects"] = rhs.follow_redirects;
        return node;
    }

    static bool decode(const Node& node, TransportConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<unsigned int>(30);
        rhs.request_timeout_seconds = node["request_timeout_seconds"].as<unsigned int>(0);
        rhs.user_agent = node["user_agent"].as<std::string>("pcloud-cpp/0.1");
        rhs.verify_tls = node["verify_tls"].as<bool>(true);
        rhs.follow_redirects = node["follow_redirects"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<ConcurrencyConfig> {
    static Node encode(const ConcurrencyConfig& rhs) {
        Node node;
        node["worker_threads"] = rhs.worker_threads;
        return node;
    }

    static bool decode(const Node& node, ConcurrencyConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(4);
        if (rhs.worker_threads == 0) rhs.worker_threads = 1;
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["pcloud"]      = to_std_string(spdlog::level::to_string_view(rhs.pcloud));
        node["client"]      = to_std_string(spdlog::level::to_string_view(rhs.client));
        node["auth"]        = to_std_string(spdlog::level::to_string_view(rhs.auth));
        node["transport"]   = to_std_string(spdlog::level::to_string_view(rhs.transport));
        node["upload"]      = to_std_string(spdlog::level::to_string_view(rhs.upload));
        node["checksum"]    = to_std_string(spdlog::level::to_string_view(rhs.checksum));
        node["concurrency"] = to_std_string(spdlog::level::to_string_view(rhs.concurrency));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.pcloud = spdlog::level::from_str(node["pcloud"].as<std::string>("info"));
        rhs.client = spdlog::level::from_str(node["client"].as<std::string>("warn"));
        rhs.auth = spdlog::level::from_str(node["auth"].as<std::string>("warn"));
        rhs.transport = spdlog::level::from_str(node["transport"].as<std::string>("warn"));
        rhs.upload = spdlog::level::from_str(node["upload"].as<std::string>("warn"));
        rhs.checksum = spdlog::level::from_str(node["checksum"].as<std::string>("warn"));
        rhs.concurrency = spdlog::level::from_str(node["concurrency"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystems"] = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file"].as<std::string>("warn"));
        if (node["subsystems"]) rhs.subsystem_levels = node["subsystems"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_file"] = rhs.log_file;
        node["max_file_size_mb"] = rhs.max_file_size_bytes / (1024 * 1024);
        node["max_files"] = rhs.max_files;
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_file = node["log_file"].as<std::string>("");
        rhs.max_file_size_bytes = node["max_file_size_mb"].as<uintmax_t>(10) * 1024 * 1024;
        rhs.max_files = node["max_files"].as<unsigned int>(3);
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
