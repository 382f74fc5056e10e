#pragma once

#include "sync/model/Action.hpp"

#include <vector>

namespace fm::sync {

struct Context;

struct Planner {
    // One action per source file, ordered by relative path. Destination-only files get
    // no action. In deep mode this hashes on the hash pool and queues verified skips in
    // ctx.pendingUpserts; unreadable sources are counted in ctx.summary.plan_errors.
    static std::vector<model::Action> build(Context& ctx);

private:
    static std::vector<model::Action> buildShallow(Context& ctx);
    static std::vector<model::Action> buildDeep(Context& ctx);
};

}
