
#include <assert.h>
#include <cctype>

#include "util/timer.h"
#include "util/log.h"
#include "util/params.h"

#include "algo/problem_assembler.h"
#include "algo/plan_validator.h"
#include "algo/plan_writer.h"
#include "data/scenarios.h"

Problem buildLineProblem(bool exclusiveDocks) {
    const Scenario* scenario = Scenarios::find("line_transfer");
    assert(scenario != nullptr);
    TopologyDescription topology = scenario->topology;
    topology.exclusiveDocks = exclusiveDocks;
    ProblemAssembler assembler(topology, scenario->name);
    assembler.setInitialPlacement(scenario->placement);
    for (const FluentValue& g : scenario->goal) assembler.addGoal(assembler.literal(g.predicate, g.args, g.value));
    return assembler.assemble();
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    Problem problem = buildLineProblem(false);
    PlanValidator validator(problem, /*verbose=*/verbosity >= Log::V3_VERBOSE);

    std::vector<std::string> steps = {
        "pickup(r1, c1, p1, d1)", 
        "move(r1, d1, d2)", 
        "move(r1, d2, d3)", 
        "putdown(r1, c1, p3, d3)"
    };

    // A valid plan by display names
    {
        ValidationReport report = validator.validate(steps);
        assert(report.ok);
        assert(report.failedStep == -1);
        assert(report.replayed.size() == 4);
        assert(problem.satisfiesGoal(report.finalState));

        // c1 ends up on top of c3
        PhysicalState physical;
        std::vector<std::string> violations;
        assert(problem.getEncoder().decodeState(report.finalState, physical, violations));
        int p3 = problem.getRegistry().nameId("p3");
        assert(physical.stackOf(p3).size() == 2);
        assert(physical.stackOf(p3).back() == problem.getRegistry().nameId("c1"));

        // The same plan by action indices and by keys
        assert(validator.validate(report.replayed).ok);
        std::vector<std::string> keys;
        for (int a : report.replayed) keys.push_back(problem.getAction(a).getKey());
        assert(keys[0] == "pickup_r1_c1_p1_d1_bottom_s1_l0");
        assert(keys[3] == "putdown_r1_c1_p3_d3_onto_c3_s1_l2");
        assert(validator.validate(keys).ok);

        // Keys in upper case resolve to the same actions
        std::vector<std::string> upperKeys;
        for (std::string key : keys) {
            for (char& c : key) c = std::toupper((unsigned char)c);
            upperKeys.push_back(key);
        }
        assert(problem.findAction(upperKeys[0]) == report.replayed[0]);
        ValidationReport upperReport = validator.validate(upperKeys);
        assert(upperReport.ok || Log::e("%s\n", upperReport.message.c_str()));
        assert(upperReport.replayed == report.replayed);

        PlanWriter(problem).outputPlan(report.replayed);
    }

    // Putdown at a dock the robot is not at
    {
        std::vector<std::string> bad = {steps[0], steps[1], "putdown(r1, c1, p3, d3)"};
        ValidationReport report = validator.validate(bad);
        assert(!report.ok);
        assert(report.failedStep == 2);
        assert(report.replayed.size() == 2);
    }

    // Moving to a non-adjacent dock
    {
        ValidationReport report = validator.validate(std::vector<std::string>{"move(r1, d1, d3)"});
        assert(!report.ok);
        assert(report.failedStep == 0);
    }

    // Picking up a container which is not on top
    {
        ValidationReport report = validator.validate(std::vector<std::string>{"pickup(r2, c1, p1, d1)"});
        assert(!report.ok);
        assert(report.failedStep == 0);
    }

    // Picking up the same container twice
    {
        std::vector<std::string> bad = {"pickup(r2, c2, p2, d2)", "pickup(r2, c2, p2, d2)"};
        ValidationReport report = validator.validate(bad);
        assert(!report.ok);
        assert(report.failedStep == 1);
    }

    // Unknown action
    {
        ValidationReport report = validator.validate(std::vector<std::string>{"fly(r1, d3)"});
        assert(!report.ok);
        assert(report.failedStep == 0);
        assert(validator.validate(Plan{-1}).failedStep == 0);
        assert(validator.validate(Plan{(int)problem.getNumActions()}).failedStep == 0);
    }

    // All steps fine, but the goal is not reached
    {
        ValidationReport report = validator.validate(std::vector<std::string>{steps[0], steps[1]});
        assert(!report.ok);
        assert(report.failedStep == 2);
        assert(report.replayed.size() == 2);
        assert(!validator.validate(Plan()).ok);
    }

    // With exclusive docks, r1 cannot pass r2 waiting at d2
    {
        Problem exclusive = buildLineProblem(true);
        PlanValidator exclusiveValidator(exclusive);
        ValidationReport report = exclusiveValidator.validate(steps);
        assert(!report.ok);
        assert(report.failedStep == 1);

        // ... unless r2 makes way first
        std::vector<std::string> detour = {"move(r2, d2, d3)", "pickup(r1, c1, p1, d1)", "move(r1, d1, d2)", 
            "putdown(r1, c1, p2, d2)", "move(r1, d2, d1)", "move(r2, d3, d2)", "pickup(r2, c1, p2, d2)", 
            "move(r2, d2, d3)", "putdown(r2, c1, p3, d3)"};
        assert(exclusiveValidator.validate(detour).ok);
    }

    Log::i("All plan validator tests passed.\n");
    return 0;
}
