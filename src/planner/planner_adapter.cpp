
#include "planner/planner_adapter.h"
#include "algo/plan_validator.h"
#include "util/log.h"

PlannerResult PlannerAdapter::solve(const Problem& problem, double timeBudget) {

    Deadline deadline(timeBudget);
    Log::i("Solving %s with the %s backend (time budget: %s)\n", problem.getName().c_str(), getName().c_str(), 
            deadline.isUnlimited() ? "none" : (std::to_string(timeBudget) + "s").c_str());

    PlannerResult result = findPlan(problem, deadline);
    result.time = deadline.elapsed();

    if (result.status == SOLVED) {
        ValidationReport report = PlanValidator(problem).validate(result.plan);
        if (!report.ok) {
            result.status = ADAPTER_ERROR;
            result.message = "Returned plan is invalid: " + report.message;
            Log::w("%s\n", result.message.c_str());
        }
    }
    // No partial plans
    if (result.status != SOLVED) result.plan.clear();

    Log::i("%s backend: %s after %.3fs%s%s\n", getName().c_str(), statusName(result.status).c_str(), result.time,
            result.message.empty() ? "" : " - ", result.message.c_str());
    return result;
}

std::string PlannerAdapter::statusName(PlannerStatus status) {
    switch (status) {
    case SOLVED: return "SOLVED";
    case UNSATISFIABLE: return "UNSATISFIABLE";
    case TIMEOUT: return "TIMEOUT";
    case ADAPTER_ERROR: return "ADAPTER_ERROR";
    }
    return "?";
}
