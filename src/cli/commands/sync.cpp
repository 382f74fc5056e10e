#include "cli/commands.hpp"
#include "sync/Controller.hpp"
#include "concurrency/Interrupt.hpp"
#include "concurrency/ThreadPoolManager.hpp"
#include "config/ConfigRegistry.hpp"

namespace fm::cli {

std::shared_ptr<CommandUsage> syncUsage() {
    auto u = std::make_shared<CommandUsage>();
    u->command = "sync";
    u->description = "One-way copy of new and changed files from SOURCE to DEST";
    u->positionals = {
        {"SOURCE", "Directory to read from"},
        {"DEST", "Directory to update; created when missing, files only found here are kept"}
    };
    u->options = {
        {"--cache", "Fingerprint cache file (default: <cache_dir>/sync_<id>.json)", {"-c"}, "FILE"},
        {"--enable-deep-scan", "Compare file contents instead of size and modification time", {}},
        {"--dry-run", "Plan and log the copies without touching DEST or the cache", {}}
    };
    u->examples = {
        {"fm sync ~/Documents /mnt/backup/Documents", "Shallow sync"},
        {"fm sync src dst --enable_deep_scan --cache /var/cache/fm/docs.json", "Deep sync with an explicit cache"}
    };
    return u;
}

CommandResult handleSync(const CommandCall& call) {
    const auto& cnf = config::ConfigRegistry::get();

    sync::Options opts;
    opts.source = call.positionals.at(0);
    opts.destination = call.positionals.at(1);
    if (const auto v = call.value("cache")) opts.cache_path = *v;
    opts.deep = call.has("enable-deep-scan");
    opts.dry_run = call.has("dry-run");

    concurrency::ThreadPoolManager pools(concurrency::processInterruptFlag(), cnf.concurrency);
    const auto summary = sync::Controller::run(opts, pools, cnf);
    pools.shutdown();

    return {summary.interrupted ? EXIT_INTERRUPTED : EXIT_OK, {}, {}};
}

}
