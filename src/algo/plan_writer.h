#ifndef DOCKPLAN_PLAN_WRITER_H
#define DOCKPLAN_PLAN_WRITER_H

#include <string>

#include "data/problem.h"
#include "data/plan.h"

class PlanWriter {

private:
    const Problem& _problem;

public:
    explicit PlanWriter(const Problem& problem) : _problem(problem) {}

    // Prints the plan between "==>" and "<==" markers, one step per line.
    void outputPlan(const Plan& plan) const;
    // Writes the plan in the format external planners emit: one "(key)" per line.
    bool writePlanFile(const Plan& plan, const std::string& path) const;
};

#endif
