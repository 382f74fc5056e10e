#include "fs/tasks/Hash.hpp"
#include "crypto/util/hash.hpp"
#include "error/Error.hpp"
#include "logging/LogRegistry.hpp"

using namespace fm::fs::tasks;
using namespace fm::logging;

void Hash::operator()() {
    try {
        digest = crypto::hash::blake2b(path, chunkSize, interrupt.get());
        LogRegistry::hash()->debug("[Hash] {} {}", digest->hex(), path.string());
        resolve(true);
    } catch (const error::Interrupted& e) {
        error = e.what();
        resolve(false);
    } catch (const error::Error& e) {
        error = std::string(e.kind()) + ": " + e.what();
        LogRegistry::hash()->error("[Hash] {}", error);
        resolve(false);
    }
}

void Hash::cancel() {
    if (error.empty()) error = "cancelled";
    PromisedTask::cancel();
}
