#include "concurrency/ThreadPool.hpp"
#include "concurrency/ThreadPoolManager.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

using namespace fm::concurrency;

namespace {

struct CountTask final : Task {
    std::atomic<int>& counter;
    explicit CountTask(std::atomic<int>& c) : counter(c) {}
    void operator()() override {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        counter.fetch_add(1);
    }
};

// Submits `depth` generations of children, fanout each, back into its own pool
struct FanoutTask final : Task {
    ThreadPool& pool;
    std::atomic<int>& counter;
    int depth, fanout;

    FanoutTask(ThreadPool& p, std::atomic<int>& c, const int d, const int f)
        : pool(p), counter(c), depth(d), fanout(f) {}

    void operator()() override {
        counter.fetch_add(1);
        if (depth == 0) return;
        for (int i = 0; i < fanout; ++i)
            pool.submit(std::make_shared<FanoutTask>(pool, counter, depth - 1, fanout));
    }
};

struct ResolvingTask final : PromisedTask {
    void operator()() override { resolve(true); }
};

struct ThrowingTask final : PromisedTask {
    void operator()() override { throw std::runtime_error("boom"); }
};

}

TEST(ThreadPoolTest, WaitIsABarrierForAllSubmittedTasks) {
    ThreadPool pool("test", 4);
    std::atomic<int> counter{0};
    for (int i = 0; i < 200; ++i) pool.submit(std::make_shared<CountTask>(counter));
    pool.wait();
    EXPECT_EQ(counter.load(), 200);
    EXPECT_EQ(pool.queueDepth(), 0u);
}

TEST(ThreadPoolTest, WaitCoversTasksSubmittedByTasks) {
    ThreadPool pool("fanout", 3);
    std::atomic<int> counter{0};
    pool.submit(std::make_shared<FanoutTask>(pool, counter, 4, 3));
    pool.wait();
    // 1 + 3 + 9 + 27 + 81
    EXPECT_EQ(counter.load(), 121);
}

TEST(ThreadPoolTest, InterruptedPoolRejectsAndCancelsTasks) {
    const auto flag = std::make_shared<std::atomic<bool>>(false);
    ThreadPool pool("interrupt", 2, flag);

    flag->store(true);
    auto task = std::make_shared<ResolvingTask>();
    auto fut = task->getFuture().value();
    EXPECT_FALSE(pool.submit(task));
    EXPECT_FALSE(fut.get());
}

TEST(ThreadPoolTest, EscapingExceptionResolvesPromiseAsFailed) {
    ThreadPool pool("throwing", 1);
    auto task = std::make_shared<ThrowingTask>();
    auto fut = task->getFuture().value();
    ASSERT_TRUE(pool.submit(task));
    pool.wait();
    EXPECT_FALSE(fut.get());
}

TEST(ThreadPoolTest, StoppedPoolRejectsAndWaitReturns) {
    ThreadPool pool("stopped", 2);
    pool.stop();
    auto task = std::make_shared<ResolvingTask>();
    auto fut = task->getFuture().value();
    EXPECT_FALSE(pool.submit(task));
    EXPECT_FALSE(fut.get());
    pool.wait();
}

TEST(ThreadPoolManagerTest, SizesPoolsPerWorkload) {
    fm::config::ConcurrencyConfig cnf;
    const auto hw = std::max(1u, std::thread::hardware_concurrency());
    EXPECT_EQ(ThreadPoolManager::threadsFor(PoolKind::Hash, cnf), hw);

    const auto io = ThreadPoolManager::threadsFor(PoolKind::IO, cnf);
    EXPECT_GE(io, 4u);
    EXPECT_LE(io, 32u);

    cnf.scan_threads = 3;
    EXPECT_EQ(ThreadPoolManager::threadsFor(PoolKind::Scan, cnf), 3u);
}

TEST(ThreadPoolManagerTest, CreatesPoolsLazilyAndShutsDown) {
    fm::config::ConcurrencyConfig cnf;
    cnf.io_threads = 2;
    ThreadPoolManager pools(std::make_shared<std::atomic<bool>>(false), cnf);

    auto& io = pools.ioPool();
    EXPECT_EQ(&io, &pools.ioPool());
    EXPECT_EQ(io.workerCount(), 2u);

    std::atomic<int> counter{0};
    io.submit(std::make_shared<CountTask>(counter));
    io.wait();
    EXPECT_EQ(counter.load(), 1);

    pools.shutdown();
    EXPECT_FALSE(pools.isInterrupted());
}
