#pragma once

#include "cli/CommandUsage.hpp"
#include "cli/types.hpp"

#include <memory>

namespace fm::cli {

class Router;

void registerAllCommands(Router& router);

std::shared_ptr<CommandUsage> duplicatesUsage();
std::shared_ptr<CommandUsage> syncUsage();

CommandResult handleDuplicates(const CommandCall& call);
CommandResult handleSync(const CommandCall& call);

}
