#include "cli/commands.hpp"
#include "dupes/Controller.hpp"
#include "concurrency/Interrupt.hpp"
#include "concurrency/ThreadPoolManager.hpp"
#include "config/ConfigRegistry.hpp"
#include "util/timestamp.hpp"

namespace fm::cli {

std::shared_ptr<CommandUsage> duplicatesUsage() {
    auto u = std::make_shared<CommandUsage>();
    u->command = "duplicates";
    u->description = "Find files with identical content and optionally delete the extra copies";
    u->options = {
        {"--path", "Directory to scan", {"-p"}, "DIR"},
        {"--input-json", "Load duplicate groups from a previous report instead of scanning (wins over --path)", {"-i"}, "FILE"},
        {"--output-json", "Where to write the report (default: <report_dir>/out_<timestamp>.json)", {"-o"}, "FILE"},
        {"--delete", "Delete every duplicate except the oldest file of each group", {"-d"}},
        {"--dry-run", "With --delete, only log what would be deleted", {}}
    };
    u->examples = {
        {"fm duplicates --path ~/Pictures", "Scan and write a report"},
        {"fm duplicates -i reports/out_20260101_120000.json --delete --dry-run", "Preview deletions from a saved report"}
    };
    return u;
}

CommandResult handleDuplicates(const CommandCall& call) {
    const auto& cnf = config::ConfigRegistry::get();

    dupes::Options opts;
    if (const auto v = call.value("path")) opts.path = *v;
    if (const auto v = call.value("input-json")) opts.input_json = *v;
    if (const auto v = call.value("output-json")) opts.output_json = *v;
    opts.remove = call.has("delete");
    opts.dry_run = call.has("dry-run");
    opts.stamp = util::getCurrentTimestamp();

    concurrency::ThreadPoolManager pools(concurrency::processInterruptFlag(), cnf.concurrency);
    const auto summary = dupes::Controller::run(opts, pools, cnf);
    pools.shutdown();

    return {summary.interrupted ? EXIT_INTERRUPTED : EXIT_OK, {}, {}};
}

}
