#ifndef DOCKPLAN_TIMER_H
#define DOCKPLAN_TIMER_H

#include <chrono>

class Timer {

private:
    static double startTime;

public:

    static void init(double start = -1) {
        startTime = start == -1 ? now() : start;
    }

    static double now() {
        using namespace std::chrono;
        return 0.001 * 0.001 * duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count();
    }

    /**
     * Returns elapsed time since Timer::init() in seconds.
     */
    static float elapsedSeconds() {
        return now() - startTime;
    }
};

/**
 * A point in time after which a blocking call must give up.
 * A budget of zero (or less) seconds never expires.
 */
class Deadline {

private:
    double _start;
    double _budget;

public:
    explicit Deadline(double budgetSeconds) : _start(Timer::now()), _budget(budgetSeconds) {}

    bool isUnlimited() const {return _budget <= 0;}
    double elapsed() const {return Timer::now() - _start;}
    bool expired() const {
        return !isUnlimited() && elapsed() >= _budget;
    }
    double remaining() const {
        if (isUnlimited()) return -1;
        double rem = _budget - elapsed();
        return rem < 0 ? 0 : rem;
    }
};

#endif
