#include "pcloud/concurrency/ThreadPool.hpp"
#include "pcloud/logging/LogRegistry.hpp"

#include <algorithm>

using namespace pcloud::concurrency;
using namespace pcloud::logging;

ThreadPool::ThreadPool(const unsigned int nThreads) {
    for (unsigned int i = 0; i < std::max(1u, nThreads); ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.exchange(true)) return;
    }
    cv.notify_all();

    const auto self = std::this_thread::get_id();
    for (auto& t : threads_) {
        if (!t.joinable()) continue;
        if (t.get_id() == self) t.detach();   // stop() reached from inside a task
        else t.join();
    }

    threads_.clear();
}

bool ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) return false;
        queue.push(std::move(task));
    }
    cv.notify_one();
    return true;
}

void ThreadPool::waitIdle() {
    std::unique_lock lock(mutex);
    idleCv.wait(lock, [this] { return queue.empty() && active_ == 0; });
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task; {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
                ++active_;
            }

            try {
                (*task)();
            } catch (const std::exception& e) {
                LogRegistry::concurrency()->error("[ThreadPool] Task failed: {}", e.what());
            }
            task.reset();

            {
                std::scoped_lock lock(mutex);
                --active_;
                if (queue.empty() && active_ == 0) idleCv.notify_all();
            }
        }
    });
}
