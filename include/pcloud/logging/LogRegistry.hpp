#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>

namespace pcloud::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels from ConfigRegistry. Repeated calls are no-ops.
    static void init();

    // Generic access by name; initializes on first use.
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> pcloud()      { return get("pcloud"); }
    static std::shared_ptr<spdlog::logger> client()      { return get("client"); }
    static std::shared_ptr<spdlog::logger> auth()        { return get("auth"); }
    static std::shared_ptr<spdlog::logger> transport()   { return get("transport"); }
    static std::shared_ptr<spdlog::logger> upload()      { return get("upload"); }
    static std::shared_ptr<spdlog::logger> checksum()    { return get("checksum"); }
    static std::shared_ptr<spdlog::logger> concurrency() { return get("concurrency"); }

    [[nodiscard]] static bool isInitialized();

private:
    static inline bool initialized_ = false;
    static inline std::mutex mutex_;
};

}
