#include "pcloud/concurrency/ThreadPoolManager.hpp"
#include "pcloud/config/ConfigRegistry.hpp"
#include "pcloud/logging/LogRegistry.hpp"

using namespace pcloud::concurrency;
using namespace pcloud::logging;

std::shared_ptr<ThreadPool> ThreadPoolManager::httpPool() {
    std::scoped_lock lock(mutex_);
    if (stopped_) return nullptr;
    if (!http_) {
        const auto n = config::ConfigRegistry::get().concurrency.worker_threads;
        http_ = std::make_shared<ThreadPool>(n);
        LogRegistry::concurrency()->debug("[ThreadPoolManager] Started http pool with {} workers", n);
    }
    return http_;
}

void ThreadPoolManager::shutdown() {
    std::shared_ptr<ThreadPool> pool;
    {
        std::scoped_lock lock(mutex_);
        pool = std::move(http_);
        stopped_ = true;
    }
    if (pool) pool->stop();
}
