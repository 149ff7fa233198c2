#ifndef DOCKPLAN_PLAN_VALIDATOR_H
#define DOCKPLAN_PLAN_VALIDATOR_H

#include <string>
#include <vector>

#include "data/problem.h"
#include "data/plan.h"

struct ValidationReport {
    bool ok = false;
    // Index of the offending step; equal to the plan length
    // if all steps are fine but the goal is not reached
    int failedStep = -1;
    std::string message;
    State finalState;
    // The action indices replayed so far
    Plan replayed;
};

/*
 * Replays a plan from the initial state of a problem. Each step must 
 * name an existing action whose preconditions hold; each successor state
 * must satisfy all physical invariants; the final state must satisfy the goal.
 */
class PlanValidator {

private:
    const Problem& _problem;
    bool _verbose;

public:
    explicit PlanValidator(const Problem& problem, bool verbose = false) : 
            _problem(problem), _verbose(verbose) {}

    ValidationReport validate(const Plan& plan) const;
    // Steps are action keys or display names such as "pickup(r1, c1, p1, d1)"
    ValidationReport validate(const std::vector<std::string>& steps) const;

private:
    bool step(ValidationReport& report, int step, int actionIndex) const;
    bool finish(ValidationReport& report, int numSteps) const;
};

#endif
