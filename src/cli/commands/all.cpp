#include "cli/commands.hpp"
#include "cli/Router.hpp"

namespace fm::cli {

void registerAllCommands(Router& router) {
    router.registerCommand(duplicatesUsage(), handleDuplicates);
    router.registerCommand(syncUsage(), handleSync);
}

}
