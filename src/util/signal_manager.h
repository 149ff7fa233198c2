#ifndef DOCKPLAN_SIGNAL_MANAGER_H
#define DOCKPLAN_SIGNAL_MANAGER_H

#include <signal.h>

/*
 * Records SIGINT/SIGTERM so that the planner backends can stop at the next
 * check. The fifth signal terminates the process immediately.
 */
class SignalManager {

private:
    static volatile sig_atomic_t exiting;
    static volatile sig_atomic_t numSignals;

public:
    // Installs signalExit() as handler of SIGINT and SIGTERM.
    static void install();
    static void signalExit();
    static inline bool isExitSet() {
        return exiting != 0;
    }
    static void reset();

private:
    static void handle(int signum);
};

#endif
