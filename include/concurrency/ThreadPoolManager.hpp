#pragma once

#include "concurrency/ThreadPool.hpp"
#include "config/Config.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace fm::concurrency {

enum class PoolKind { Scan, Hash, IO };

// Owns the three pools of one command run. Pools are created on first use and
// torn down with the manager, so their lifetime never exceeds the operation.
class ThreadPoolManager {
public:
    ThreadPoolManager(std::shared_ptr<std::atomic<bool>> interruptFlag,
                      const config::ConcurrencyConfig& cnf);

    ~ThreadPoolManager() { shutdown(); }

    ThreadPoolManager(const ThreadPoolManager&) = delete;
    ThreadPoolManager& operator=(const ThreadPoolManager&) = delete;

    ThreadPool& scanPool() { return pool(PoolKind::Scan); }
    ThreadPool& hashPool() { return pool(PoolKind::Hash); }
    ThreadPool& ioPool()   { return pool(PoolKind::IO); }

    void shutdown();

    [[nodiscard]] bool isInterrupted() const { return interruptFlag_ && interruptFlag_->load(); }
    [[nodiscard]] const std::shared_ptr<std::atomic<bool>>& interruptFlag() const { return interruptFlag_; }

    // Worker count for a pool kind; a configured value of 0 means auto
    static unsigned int threadsFor(PoolKind kind, const config::ConcurrencyConfig& cnf);

private:
    ThreadPool& pool(PoolKind kind);

    static constexpr unsigned int IO_FACTOR = 2, IO_FLOOR = 4, IO_CEILING = 32;

    std::shared_ptr<std::atomic<bool>> interruptFlag_;
    config::ConcurrencyConfig cnf_;
    std::mutex mutex_;
    std::unique_ptr<ThreadPool> scan_, hash_, io_;
};

} // namespace fm::concurrency
