#pragma once

#include "fs/model/FileRecord.hpp"

#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fm::dupes::model {

// Files sharing size and digest. members[0] is the retained file; the rest are the
// deletion candidates.
struct DuplicateGroup {
    crypto::Digest256 digest{};
    uintmax_t size_bytes{};
    std::vector<fs::model::FileRecord> members{};

    [[nodiscard]] uintmax_t totalWastedBytes() const {
        return members.size() < 2 ? 0 : (members.size() - 1) * size_bytes;
    }

    [[nodiscard]] const fs::model::FileRecord& retained() const { return members.front(); }
};

// Report entry: {digest, size_bytes, size_human, files}
void to_json(nlohmann::json& j, const DuplicateGroup& g);

uintmax_t totalWastedBytes(const std::vector<DuplicateGroup>& groups);
uint64_t duplicateFileCount(const std::vector<DuplicateGroup>& groups);

}
