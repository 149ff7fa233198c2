#ifndef DOCKPLAN_SAT_PLANNER_H
#define DOCKPLAN_SAT_PLANNER_H

#include <string>
#include <vector>

#include "planner/planner_adapter.h"

struct SatPlannerConfig {
    // Largest number of steps to try
    int maxHorizon = 40;
    bool printVariableNames = false;
    // Write the formula of the last horizon to formulaFile (DIMACS)
    bool writeFormula = false;
    std::string formulaFile = "f.cnf";
};

/*
 * Bounded-horizon SAT planning over an incremental IPASIR solver.
 * Step t carries one variable per dynamic fluent and, between t and t+1,
 * one variable per action. Preconditions and effects are implications,
 * frame axioms are explanatory, at most one action is chosen per step.
 * The horizon grows from 0; the goal is checked at the current horizon
 * by assumptions only, so that all clauses remain valid for larger horizons.
 */
class SatPlanner : public PlannerAdapter {

private:
    SatPlannerConfig _config;

public:
    explicit SatPlanner(const SatPlannerConfig& config) : _config(config) {}

    std::string getName() const override {return "sat";}

protected:
    PlannerResult findPlan(const Problem& problem, const Deadline& deadline) override;
};

#endif
