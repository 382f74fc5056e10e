#pragma once

#include "fs/model/ScanSession.hpp"

#include <filesystem>
#include <vector>

namespace fm::concurrency {
class ThreadPool;
}

namespace fm::fs {

struct Scanner {
    // Walks root on the given pool and blocks until every reachable directory was listed
    // or the pool was interrupted. Paths in exclude are left out of the result.
    static model::ScanSession scan(const std::filesystem::path& root,
                                   concurrency::ThreadPool& pool,
                                   const std::vector<std::filesystem::path>& exclude = {});
};

}
