#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace pcloud::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Runs what is already queued, then joins the workers.
    void stop();

    // False once the pool is stopping; the task is not queued then.
    bool submit(std::shared_ptr<Task> task);

    template<typename F>
    auto async(F&& fn) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<PromisedTask<R>>(std::function<R()>(std::forward<F>(fn)));
        auto fut = task->getFuture();
        if (!submit(task)) (*task)();   // pool gone: run on the caller
        return fut;
    }

    // Blocks until the queue is empty and no worker is running a task.
    void waitIdle();

    size_t queueDepth() const;

    [[nodiscard]] unsigned int workerCount() const;
    [[nodiscard]] bool isStopped() const { return stopFlag.load(); }

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    std::condition_variable idleCv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;
    unsigned int active_ = 0;

    std::atomic<bool> stopFlag{false};
};

}
