#pragma once

#include "pcloud/concurrency/ThreadPool.hpp"

#include <memory>
#include <mutex>

namespace pcloud::concurrency {

// Owns the process-wide pool every network operation runs on.
class ThreadPoolManager {
public:
    static ThreadPoolManager& instance() {
        static ThreadPoolManager instance;
        return instance;
    }

    // Created on first use, sized from concurrency.worker_threads. Null after shutdown().
    std::shared_ptr<ThreadPool> httpPool();

    void shutdown();

    ~ThreadPoolManager() { shutdown(); }

private:
    ThreadPoolManager() = default;

    std::mutex mutex_;
    std::shared_ptr<ThreadPool> http_;
    bool stopped_ = false;
};

}
