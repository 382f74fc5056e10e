#pragma once

#include "concurrency/Task.hpp"
#include "fs/model/FileRecord.hpp"

#include <string>

namespace fm::dupes::tasks {

struct Delete final : concurrency::PromisedTask {
    enum class Outcome { Pending, Deleted, WouldDelete, Missing, Changed, Failed, Cancelled };

    fs::model::FileRecord target;
    bool dryRun = false;

    Outcome outcome{Outcome::Pending};
    std::string error{};

    Delete(fs::model::FileRecord tgt, bool dryRun);

    // Re-stats the target first: a vanished file or one whose size no longer matches the
    // group is left alone.
    void operator()() override;
    void cancel() override;
};

}
