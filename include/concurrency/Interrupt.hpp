#pragma once

#include <atomic>
#include <memory>

namespace fm::concurrency {

// Process-wide interruption flag shared by every pool of the current run
std::shared_ptr<std::atomic<bool>> processInterruptFlag();

// SIGINT/SIGTERM raise processInterruptFlag(); a second signal restores the default action
void installSignalHandlers();

}
