#pragma once

#include "concurrency/Task.hpp"
#include "fs/model/ScanSession.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>

namespace fm::concurrency {
class ThreadPool;
}

namespace fm::fs::tasks {

// Shared by every ScanDir task of one scan: an append-only collector
struct ScanState {
    model::ScanSession session;
    std::mutex mutex;
    concurrency::ThreadPool& pool;
    std::atomic<uint64_t> directories{0}, symlinks{0};
    std::atomic<bool> incomplete{false};

    ScanState(std::filesystem::path root, concurrency::ThreadPool& p)
        : session(std::move(root)), pool(p) {}
};

// Lists one directory; subdirectories are submitted back into the same pool
struct ScanDir final : concurrency::Task {
    std::shared_ptr<ScanState> state;
    std::filesystem::path dir;

    ScanDir(std::shared_ptr<ScanState> s, std::filesystem::path d)
        : state(std::move(s)), dir(std::move(d)) {}

    void operator()() override;
    void cancel() override { state->incomplete.store(true); }
};

}
