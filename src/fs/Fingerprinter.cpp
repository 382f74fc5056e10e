#include "fs/Fingerprinter.hpp"
#include "fs/tasks/Hash.hpp"
#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <future>
#include <memory>

using namespace fm::fs;
using namespace fm::fs::model;
using namespace fm::logging;

Fingerprinter::Fingerprinter(concurrency::ThreadPool& pool, const size_t chunkSize,
                             std::shared_ptr<std::atomic<bool>> interrupt)
    : pool_(pool), chunkSize_(chunkSize), interrupt_(std::move(interrupt)) {}

FingerprintOutcome Fingerprinter::fingerprint(const std::vector<FileRecord*>& records) const {
    FingerprintOutcome out;
    if (records.empty()) return out;

    LogRegistry::hash()->info("[Fingerprinter] Hashing {} files on {} workers...", records.size(), pool_.workerCount());

    std::vector<std::shared_ptr<tasks::Hash>> tasks;
    std::vector<std::future<bool>> futures;
    tasks.reserve(records.size());
    futures.reserve(records.size());

    for (const auto* r : records) {
        auto task = std::make_shared<tasks::Hash>(r->absolute_path, chunkSize_, interrupt_);
        futures.push_back(task->getFuture().value());
        tasks.push_back(task);
        pool_.submit(task);
    }

    // barrier: every digest is final before any caller groups or plans on them
    pool_.wait();
    for (auto& f : futures) f.get();

    for (size_t i = 0; i < records.size(); ++i) {
        auto& task = tasks[i];
        if (task->digest) {
            records[i]->digest = task->digest;
            ++out.hashed;
            out.bytes += records[i]->size_bytes;
        } else {
            records[i]->digest.reset();
            out.failures.push_back({task->path, task->error});
        }
    }

    out.interrupted = pool_.isInterrupted() || (interrupt_ && interrupt_->load());
    LogRegistry::hash()->info("[Fingerprinter] Hashed {} files ({}), {} failed{}", out.hashed,
                              util::bytesToSize(out.bytes), out.failures.size(),
                              out.interrupted ? " (interrupted)" : "");
    return out;
}
