#include <stdlib.h>

#include "util/signal_manager.h"

volatile sig_atomic_t SignalManager::exiting = 0;
volatile sig_atomic_t SignalManager::numSignals = 0;

void SignalManager::install() {
    struct sigaction action;
    action.sa_handler = SignalManager::handle;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void SignalManager::signalExit() {
    exiting = 1;
    numSignals = numSignals + 1;
    if (numSignals >= 5) _Exit(1);
}

void SignalManager::reset() {
    exiting = 0;
    numSignals = 0;
}

void SignalManager::handle(int signum) {
    signalExit();
}
