
#include "algo/plan_validator.h"
#include "util/log.h"

ValidationReport PlanValidator::validate(const Plan& plan) const {
    ValidationReport report;
    report.finalState = _problem.getInitialState();
    for (size_t i = 0; i < plan.size(); i++) {
        if (!step(report, i, plan[i])) return report;
    }
    finish(report, plan.size());
    return report;
}

ValidationReport PlanValidator::validate(const std::vector<std::string>& steps) const {
    ValidationReport report;
    report.finalState = _problem.getInitialState();
    for (size_t i = 0; i < steps.size(); i++) {
        int actionIndex = _problem.findAction(steps[i]);
        if (actionIndex < 0) {
            // A display name: pick the variant which fits the current state
            const std::vector<int>& variants = _problem.findActionsByName(steps[i]);
            if (variants.empty()) {
                report.failedStep = i;
                report.message = "Step " + std::to_string(i) + ": unknown action \"" + steps[i] + "\"";
                Log::v("%s\n", report.message.c_str());
                return report;
            }
            actionIndex = variants.front();
            for (int v : variants) {
                if (_problem.isApplicable(report.finalState, v)) {
                    actionIndex = v;
                    break;
                }
            }
        }
        if (!step(report, i, actionIndex)) return report;
    }
    finish(report, steps.size());
    return report;
}

bool PlanValidator::step(ValidationReport& report, int step, int actionIndex) const {
    const Registry& registry = _problem.getRegistry();

    if (actionIndex < 0 || actionIndex >= (int)_problem.getNumActions()) {
        report.failedStep = step;
        report.message = "Step " + std::to_string(step) + ": no action with index " + std::to_string(actionIndex);
        Log::v("%s\n", report.message.c_str());
        return false;
    }
    const Action& action = _problem.getAction(actionIndex);
    std::string name = action.getDisplayName(registry);

    if (!_problem.isApplicable(report.finalState, actionIndex)) {
        std::string unmet;
        for (const Signature& pre : sortedLiterals(action.getPreconditions())) {
            if (!_problem.holds(report.finalState, pre)) unmet += " " + _problem.toString(pre);
        }
        report.failedStep = step;
        report.message = "Step " + std::to_string(step) + ": " + name + " is not applicable, unmet:" + unmet;
        Log::v("%s\n", report.message.c_str());
        return false;
    }

    State next = _problem.apply(report.finalState, actionIndex);
    std::vector<std::string> violations = _problem.getEncoder().checkInvariants(next);
    if (!violations.empty()) {
        report.failedStep = step;
        report.message = "Step " + std::to_string(step) + ": " + name + " leads to an illegal state: " + violations[0];
        Log::e("%s\n", report.message.c_str());
        return false;
    }
    report.finalState = std::move(next);
    report.replayed.push_back(actionIndex);

    if (_verbose) {
        PhysicalState physical;
        std::vector<std::string> ignored;
        _problem.getEncoder().decodeState(report.finalState, physical, ignored);
        Log::i("  %i %s => %s\n", step, name.c_str(), _problem.getEncoder().toString(physical).c_str());
    }
    return true;
}

bool PlanValidator::finish(ValidationReport& report, int numSteps) const {
    std::vector<Signature> open = _problem.getUnsatisfiedGoals(report.finalState);
    if (!open.empty()) {
        report.failedStep = numSteps;
        report.message = "Goal not reached, unsatisfied:";
        for (const Signature& lit : open) report.message += " " + _problem.toString(lit);
        Log::v("%s\n", report.message.c_str());
        return false;
    }
    report.ok = true;
    report.message = "Plan of length " + std::to_string(numSteps) + " reaches the goal";
    return true;
}
