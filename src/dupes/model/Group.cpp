#include "dupes/model/Group.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>

namespace fm::dupes::model {

void to_json(nlohmann::json& j, const DuplicateGroup& g) {
    auto files = nlohmann::json::array();
    for (const auto& m : g.members) files.push_back(m.absolute_path.string());

    j = {
        {"digest", g.digest.hex()},
        {"size_bytes", g.size_bytes},
        {"size_human", util::bytesToSize(g.size_bytes)},
        {"files", std::move(files)}
    };
}

uintmax_t totalWastedBytes(const std::vector<DuplicateGroup>& groups) {
    uintmax_t total = 0;
    for (const auto& g : groups) total += g.totalWastedBytes();
    return total;
}

uint64_t duplicateFileCount(const std::vector<DuplicateGroup>& groups) {
    uint64_t count = 0;
    for (const auto& g : groups)
        if (!g.members.empty()) count += g.members.size() - 1;
    return count;
}

}
