#pragma once

#include <atomic>
#include <future>
#include <optional>
#include <stdexcept>

namespace fm::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Invoked instead of operator()() when the pool drops a queued task (stop or interrupt),
    // or after operator()() escaped with an exception.
    virtual void cancel() {}

    // Optional future for reporting
    virtual std::optional<std::future<bool>> getFuture() { return std::nullopt; }
};

struct PromisedTask : Task {
    std::promise<bool> promise;

    PromisedTask() = default;
    explicit PromisedTask(std::promise<bool> p) : promise(std::move(p)) {}

    std::optional<std::future<bool>> getFuture() override { return promise.get_future(); }

    void operator()() override { throw std::runtime_error("PromisedTask must implement operator()()"); }

    void cancel() override { resolve(false); }

protected:
    // Settles the promise exactly once; later calls are no-ops
    void resolve(const bool ok) {
        if (!resolved_.exchange(true)) promise.set_value(ok);
    }

private:
    std::atomic<bool> resolved_{false};
};

}
