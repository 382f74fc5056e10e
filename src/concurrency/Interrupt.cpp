#include "concurrency/Interrupt.hpp"

#include <csignal>

namespace {

std::atomic<bool>* g_flag = nullptr;

void signalHandler(const int signum) {
    if (g_flag) g_flag->store(true);
    std::signal(signum, SIG_DFL);
}

}

namespace fm::concurrency {

std::shared_ptr<std::atomic<bool>> processInterruptFlag() {
    static const auto flag = std::make_shared<std::atomic<bool>>(false);
    return flag;
}

void installSignalHandlers() {
    g_flag = processInterruptFlag().get();
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

}
