#include "concurrency/ThreadPoolManager.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <thread>

using namespace fm::concurrency;
using namespace fm::logging;

ThreadPoolManager::ThreadPoolManager(std::shared_ptr<std::atomic<bool>> interruptFlag,
                                     const config::ConcurrencyConfig& cnf)
    : interruptFlag_(std::move(interruptFlag)), cnf_(cnf) {}

unsigned int ThreadPoolManager::threadsFor(const PoolKind kind, const config::ConcurrencyConfig& cnf) {
    const unsigned int hw = std::max(1u, std::thread::hardware_concurrency());

    switch (kind) {
    case PoolKind::Hash:
        return cnf.hash_threads ? cnf.hash_threads : hw;
    case PoolKind::Scan:
        return cnf.scan_threads ? cnf.scan_threads : std::clamp(hw * IO_FACTOR, IO_FLOOR, IO_CEILING);
    case PoolKind::IO:
        return cnf.io_threads ? cnf.io_threads : std::clamp(hw * IO_FACTOR, IO_FLOOR, IO_CEILING);
    }
    return hw;
}

ThreadPool& ThreadPoolManager::pool(const PoolKind kind) {
    std::scoped_lock lock(mutex_);

    auto create = [&](std::unique_ptr<ThreadPool>& slot, const char* name) -> ThreadPool& {
        if (!slot) slot = std::make_unique<ThreadPool>(name, threadsFor(kind, cnf_), interruptFlag_);
        return *slot;
    };

    switch (kind) {
    case PoolKind::Scan: return create(scan_, "scan");
    case PoolKind::Hash: return create(hash_, "hash");
    case PoolKind::IO:   return create(io_, "io");
    }
    throw std::logic_error("Unknown pool kind");
}

void ThreadPoolManager::shutdown() {
    std::scoped_lock lock(mutex_);
    for (auto* p : {&scan_, &hash_, &io_}) {
        if (*p) {
            (*p)->stop();
            p->reset();
        }
    }
}
