#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

using namespace fm::concurrency;
using namespace fm::logging;

ThreadPool::ThreadPool(std::string name, const unsigned int nThreads,
                       std::shared_ptr<std::atomic<bool>> interruptFlag)
    : name_(std::move(name)), interruptFlag(std::move(interruptFlag)) {
    const auto n = std::max(1u, nThreads);
    threads_.reserve(n);
    for (unsigned int i = 0; i < n; ++i) spawnWorker();
    LogRegistry::filesmanager()->debug("[ThreadPool:{}] Started with {} workers", name_, n);
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    std::queue<std::shared_ptr<Task>> dropped;
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.exchange(true)) return;
        std::swap(queue, dropped);
    }
    cv.notify_all();

    while (!dropped.empty()) {
        dropped.front()->cancel();
        dropped.pop();
    }

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();

    {
        std::scoped_lock lock(mutex);
        joined_ = true;
    }
    idleCv.notify_all();
}

bool ThreadPool::submit(std::shared_ptr<Task> task) {
    if (!task) return false;
    {
        std::scoped_lock lock(mutex);
        if (!stopFlag.load() && !isInterrupted()) {
            queue.push(std::move(task));
            cv.notify_one();
            return true;
        }
    }
    task->cancel();
    return false;
}

void ThreadPool::wait() {
    std::unique_lock lock(mutex);
    idleCv.wait(lock, [this] {
        return (queue.empty() && inFlight_ == 0) || joined_;
    });
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

bool ThreadPool::isInterrupted() const {
    return interruptFlag && interruptFlag->load();
}

void ThreadPool::runTask(const std::shared_ptr<Task>& task) const {
    if (isInterrupted()) {
        task->cancel();
        return;
    }

    try {
        (*task)();
    } catch (const std::exception& e) {
        LogRegistry::filesmanager()->error("[ThreadPool:{}] Task escaped with exception: {}", name_, e.what());
        task->cancel();
    }
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
                ++inFlight_;
            }

            runTask(task);

            {
                std::scoped_lock lock(mutex);
                --inFlight_;
                if (queue.empty() && inFlight_ == 0) idleCv.notify_all();
            }
        }
    });
}
