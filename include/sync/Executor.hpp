#pragma once

#include <cstddef>
#include <vector>

namespace fm::sync {

namespace model {
struct Action;
}

struct Context;

class Executor {
public:
    // Runs the plan on the I/O pool and blocks until every copy settled. At most
    // ctx.options.max_copies copies are dispatched.
    static void run(Context& ctx, const std::vector<model::Action>& plan);

private:
    static void dryRun(Context& ctx, const std::vector<model::Action>& plan);
};

}
