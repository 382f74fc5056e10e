#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace fm::concurrency {

class ThreadPool {
public:
    ThreadPool(std::string name, unsigned int nThreads,
               std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Cancels queued tasks, lets in-flight tasks finish, joins workers
    void stop();

    // Returns false (and cancels the task) once the pool is stopped or interrupted
    bool submit(std::shared_ptr<Task> task);

    // Barrier: blocks until the queue is empty and no task is running,
    // including tasks submitted by running tasks.
    void wait();

    size_t queueDepth() const;

    [[nodiscard]] unsigned int workerCount() const;
    [[nodiscard]] bool isInterrupted() const;
    [[nodiscard]] const std::string& name() const { return name_; }

private:
    void spawnWorker();
    void runTask(const std::shared_ptr<Task>& task) const;

    std::string name_;
    std::vector<std::thread> threads_;

    std::condition_variable cv;
    std::condition_variable idleCv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;
    size_t inFlight_{0};
    bool joined_{false};

    std::shared_ptr<std::atomic<bool>> interruptFlag;
    std::atomic<bool> stopFlag{false};
};

} // namespace fm::concurrency
