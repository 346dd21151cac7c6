#pragma once

#include <exception>
#include <functional>
#include <future>
#include <type_traits>

namespace pcloud::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// Runs a callable and publishes its result, or the exception it threw, through a promise.
template<typename T>
struct PromisedTask final : Task {
    std::promise<T> promise;
    std::function<T()> fn;

    explicit PromisedTask(std::function<T()> f) : fn(std::move(f)) {}

    std::future<T> getFuture() { return promise.get_future(); }

    void operator()() override {
        try {
            if constexpr (std::is_void_v<T>) {
                fn();
                promise.set_value();
            } else {
                promise.set_value(fn());
            }
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }
};

struct FireAndForgetTask final : Task {
    std::function<void()> fn;

    explicit FireAndForgetTask(std::function<void()> f) : fn(std::move(f)) {}

    void operator()() override { fn(); }
};

}
