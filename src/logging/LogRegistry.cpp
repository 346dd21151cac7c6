#include "pcloud/logging/LogRegistry.hpp"
#include "pcloud/config/ConfigRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <stdexcept>
#include <vector>

namespace pcloud::logging {

static constexpr auto LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

void LogRegistry::init() {
    std::scoped_lock lock(mutex_);
    if (initialized_) return;

    const auto cnf = config::ConfigRegistry::get().logging;

    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(cnf.levels.console_log_level);
    console->set_color_mode(spdlog::color_mode::automatic);
    console->set_pattern(LOG_FORMAT);
    sinks.push_back(console);

    if (!cnf.log_file.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cnf.log_file, cnf.max_file_size_bytes, cnf.max_files);
        file->set_level(cnf.levels.file_log_level);
        file->set_pattern(LOG_FORMAT);
        sinks.push_back(file);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub = cnf.levels.subsystem_levels;
    makeLogger("pcloud",      sub.pcloud);
    makeLogger("client",      sub.client);
    makeLogger("auth",        sub.auth);
    makeLogger("transport",   sub.transport);
    makeLogger("upload",      sub.upload);
    makeLogger("checksum",    sub.checksum);
    makeLogger("concurrency", sub.concurrency);

    initialized_ = true;
    spdlog::get("pcloud")->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    if (!isInitialized()) init();
    auto logger = spdlog::get(name);
    if (!logger) throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    return logger;
}

bool LogRegistry::isInitialized() {
    std::scoped_lock lock(mutex_);
    return initialized_;
}

}
