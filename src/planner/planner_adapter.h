#ifndef DOCKPLAN_PLANNER_ADAPTER_H
#define DOCKPLAN_PLANNER_ADAPTER_H

#include <string>

#include "data/problem.h"
#include "data/plan.h"
#include "util/timer.h"

enum PlannerStatus {SOLVED = 0, UNSATISFIABLE = 1, TIMEOUT = 2, ADAPTER_ERROR = 3};

struct PlannerResult {
    PlannerStatus status = ADAPTER_ERROR;
    // Only non-empty if status == SOLVED
    Plan plan;
    double time = 0;
    std::string message;
};

/*
 * A planner backend. solve() runs the backend within a time budget and 
 * replays every found plan with the PlanValidator before it reports SOLVED;
 * a plan which fails the replay is reported as ADAPTER_ERROR.
 * Failures are never thrown, only reported as statuses.
 */
class PlannerAdapter {

public:
    virtual ~PlannerAdapter() = default;

    // timeBudget in seconds, 0 for no limit
    PlannerResult solve(const Problem& problem, double timeBudget);

    virtual std::string getName() const = 0;

    static std::string statusName(PlannerStatus status);

protected:
    virtual PlannerResult findPlan(const Problem& problem, const Deadline& deadline) = 0;
};

#endif
