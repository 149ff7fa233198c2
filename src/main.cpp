
#include <iostream>
#include <memory>
#include <cstdlib>

#include "data/scenarios.h"
#include "algo/problem_assembler.h"
#include "algo/plan_validator.h"
#include "algo/plan_writer.h"
#include "planner/pddl_writer.h"
#include "planner/process_planner.h"
#include "sat/sat_planner.h"
#include "util/params.h"
#include "util/timer.h"
#include "util/log.h"
#include "util/errors.h"
#include "util/signal_manager.h"

#ifndef DOCKPLAN_VERSION
#define DOCKPLAN_VERSION "(dbg)"
#endif

#ifndef IPASIRSOLVER
#define IPASIRSOLVER "(unknown)"
#endif

void listScenarios() {
    Log::setForcePrint(true);
    Log::i("Built-in scenarios:\n");
    for (const Scenario& s : Scenarios::all()) {
        Log::i("  %-18s %s%s\n", s.name.c_str(), s.description.c_str(), 
                s.name == Scenarios::defaultName() ? " (default)" : "");
    }
    Log::setForcePrint(false);
}

Problem buildProblem(const Parameters& params) {

    std::string name = params.getScenarioName();
    if (name.empty()) name = Scenarios::defaultName();
    const Scenario* scenario = Scenarios::find(name);
    if (scenario == nullptr) {
        throw ConfigurationError("No scenario named \"" + name + "\" (use -list)");
    }
    Log::i("Scenario %s: %s\n", scenario->name.c_str(), scenario->description.c_str());

    TopologyDescription topology = scenario->topology;
    if (params.isSet("xd")) topology.exclusiveDocks = params.isNonzero("xd");

    ProblemAssembler assembler(topology, scenario->name);
    assembler.setInitialPlacement(scenario->placement);
    for (const FluentValue& g : scenario->goal) {
        assembler.addGoal(assembler.literal(g.predicate, g.args, g.value));
    }
    return assembler.assemble();
}

std::unique_ptr<PlannerAdapter> createPlanner(const Parameters& params) {

    std::string backend = params.getParam("planner");
    if (backend == "sat") {
        SatPlannerConfig config;
        config.maxHorizon = params.getIntParam("H");
        config.printVariableNames = params.isNonzero("pvn");
        config.writeFormula = params.isNonzero("wf");
        Log::i("Backend: SAT (solver %s, max. horizon %i)\n", IPASIRSOLVER, config.maxHorizon);
        return std::unique_ptr<PlannerAdapter>(new SatPlanner(config));
    }
    if (backend == "process") {
        ProcessPlannerConfig config;
        config.command = params.getParam("cmd");
        config.workDir = params.getParam("wd");
        config.unsolvableExitCodes = params.getIntListParam("unsat");
        Log::i("Backend: external planner \"%s\"\n", config.command.c_str());
        return std::unique_ptr<PlannerAdapter>(new ProcessPlanner(config));
    }
    throw ConfigurationError("Unknown planner backend \"" + backend + "\"");
}

int run(Parameters& params) {

    Problem problem = buildProblem(params);
    problem.printStatistics();

    if (params.isNonzero("wp")) {
        std::string dir = params.getParam("wd");
        PddlWriter writer(problem);
        if (!writer.writeFiles(dir + "/domain.pddl", dir + "/problem.pddl")) {
            Log::e("Could not write PDDL files to %s\n", dir.c_str());
            return 1;
        }
        Log::i("Wrote %s/domain.pddl and %s/problem.pddl\n", dir.c_str(), dir.c_str());
        return 0;
    }

    std::unique_ptr<PlannerAdapter> planner = createPlanner(params);
    PlannerResult result = planner->solve(problem, params.getFloatParam("T"));

    if (result.status != SOLVED) return 1;

    PlanWriter(problem).outputPlan(result.plan);
    if (params.isNonzero("vp")) {
        ValidationReport report = PlanValidator(problem, /*verbose=*/true).validate(result.plan);
        Log::i("Validation: %s\n", report.ok ? "ok" : report.message.c_str());
    }
    return 0;
}

int main(int argc, char** argv) {
    
    SignalManager::install();

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"), params.getParam("log"));

    if (verbosity >= Log::V2_INFORMATION) {
        Log::log_notime(Log::V0_ESSENTIAL, "dockplan version %s\n", DOCKPLAN_VERSION);
        Log::log_notime(Log::V0_ESSENTIAL, "using SAT solver %s\n", IPASIRSOLVER);
        Log::log_notime(Log::V0_ESSENTIAL, "\n");
    }

    if (params.isSet("h") || params.isSet("help")) {
        params.printUsage();
        exit(0);
    }
    if (params.isSet("list")) {
        listScenarios();
        exit(0);
    }

    try {
        int result = run(params);
        Log::i("Exiting.\n");
        return result;
    } catch (const ConfigurationError& e) {
        Log::e("Invalid problem: %s\n", e.what());
    } catch (const EncodingError& e) {
        Log::e("Encoding error: %s\n", e.what());
    }
    return 2;
}
