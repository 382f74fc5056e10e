#include "dupes/Detector.hpp"
#include "fs/model/ScanSession.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <map>
#include <tuple>
#include <unordered_map>

using namespace fm::dupes;
using namespace fm::dupes::model;
using namespace fm::fs::model;
using namespace fm::logging;

Detection Detector::detect(ScanSession& session, concurrency::ThreadPool& hashPool, const DetectorOptions& opts) {
    Detection out;

    std::unordered_map<uintmax_t, std::vector<FileRecord*>> bySize;
    for (auto& r : session.records)
        if (r.size_bytes >= opts.min_size_bytes) bySize[r.size_bytes].push_back(&r);

    std::vector<FileRecord*> candidates;
    size_t sizeBuckets = 0;
    for (auto& [_, bucket] : bySize) {
        if (bucket.size() < 2) continue;
        ++sizeBuckets;
        candidates.insert(candidates.end(), bucket.begin(), bucket.end());
    }
    out.candidates = candidates.size();

    LogRegistry::dupes()->info("[Detector] {} size buckets with more than one file, {} candidates to hash",
                               sizeBuckets, candidates.size());

    out.hashing = fs::Fingerprinter(hashPool, opts.chunk_size, opts.interrupt).fingerprint(candidates);
    for (const auto& f : out.hashing.failures)
        LogRegistry::dupes()->warn("[Detector] Excluding {}: {}", f.path.string(), f.reason);

    out.interrupted = out.hashing.interrupted;
    if (out.interrupted) {
        LogRegistry::dupes()->warn("[Detector] Hashing was interrupted, no groups reported");
        return out;
    }

    std::map<std::pair<uintmax_t, crypto::Digest256>, std::vector<FileRecord*>> byContent;
    for (auto* r : candidates)
        if (r->digest) byContent[{r->size_bytes, *r->digest}].push_back(r);

    for (auto& [key, members] : byContent) {
        if (members.size() < 2) continue;
        DuplicateGroup g{ .digest = key.second, .size_bytes = key.first };
        g.members.reserve(members.size());
        for (const auto* m : members) g.members.push_back(*m);
        orderMembers(g);
        out.groups.push_back(std::move(g));
    }

    orderGroups(out.groups);

    LogRegistry::dupes()->info("[Detector] Found {} duplicate groups ({} duplicate files, {} wasted)",
                               out.groups.size(), duplicateFileCount(out.groups),
                               util::bytesToSize(totalWastedBytes(out.groups)));
    return out;
}

void Detector::orderMembers(DuplicateGroup& group) {
    std::ranges::sort(group.members, [](const FileRecord& a, const FileRecord& b) {
        return std::tie(a.modified_time, a.relative_path) < std::tie(b.modified_time, b.relative_path);
    });
}

void Detector::orderGroups(std::vector<DuplicateGroup>& groups) {
    std::ranges::sort(groups, [](const DuplicateGroup& a, const DuplicateGroup& b) {
        if (a.size_bytes != b.size_bytes) return a.size_bytes > b.size_bytes;
        return a.digest < b.digest;
    });
}
