#ifndef DOCKPLAN_PROCESS_PLANNER_H
#define DOCKPLAN_PROCESS_PLANNER_H

#include <string>
#include <vector>

#include "planner/planner_adapter.h"

struct ProcessPlannerConfig {
    // Shell command line; {domain}, {problem} and {plan} are replaced 
    // by the (quoted) paths of the respective files in workDir.
    std::string command;
    std::string workDir = ".";
    // Exit codes by which the planner reports that no plan exists
    std::vector<int> unsolvableExitCodes = {11, 12};
    // Interval for polling the planner process
    int pollMillis = 10;
};

/*
 * Runs an external classical planner on PDDL files in its own process group
 * and reads back the plan file it writes. On timeout or interruption, the
 * whole process group is killed.
 */
class ProcessPlanner : public PlannerAdapter {

private:
    ProcessPlannerConfig _config;

public:
    explicit ProcessPlanner(const ProcessPlannerConfig& config) : _config(config) {}

    std::string getName() const override {return "process";}

    std::string getDomainFile() const {return _config.workDir + "/domain.pddl";}
    std::string getProblemFile() const {return _config.workDir + "/problem.pddl";}
    std::string getPlanFile() const {return _config.workDir + "/plan.txt";}
    std::string getLogFile() const {return _config.workDir + "/planner.log";}

    // The command line with all placeholders replaced.
    std::string buildCommand() const;

protected:
    PlannerResult findPlan(const Problem& problem, const Deadline& deadline) override;

private:
    bool isUnsolvableExitCode(int code) const;
};

#endif
