#pragma once

#include "dupes/model/Group.hpp"

#include <vector>

namespace fm::concurrency {
class ThreadPool;
}

namespace fm::dupes {

struct Removal {
    uint64_t files_deleted{};      // would-delete in dry-run
    uintmax_t bytes_reclaimed{};
    uint64_t files_missing{};
    uint64_t files_changed{};
    uint64_t groups_skipped{};
    uint64_t errors{};
    uint64_t cancelled{};
};

struct Remover {
    // Deletes every member except members[0] on ioPool. A group whose retained file is no
    // longer a regular file of the expected size is skipped as a whole.
    static Removal run(const std::vector<model::DuplicateGroup>& groups, concurrency::ThreadPool& ioPool, bool dryRun);
};

}
