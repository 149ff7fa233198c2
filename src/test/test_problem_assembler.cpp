
#include <assert.h>
#include <functional>

#include "util/timer.h"
#include "util/log.h"
#include "util/params.h"
#include "util/errors.h"

#include "algo/problem_assembler.h"
#include "data/scenarios.h"

TopologyDescription lineTopology() {
    TopologyDescription desc;
    desc.docks = {"d1", "d2", "d3"};
    desc.adjacencies = {{"d1", "d2"}, {"d2", "d3"}};
    desc.piles = {{"p1", "d1"}, {"p2", "d2"}, {"p3", "d3"}};
    desc.robots = {{"r1", 1, 6}, {"r2", 1, 6}};
    desc.containers = {{"c1", 2}, {"c2", 4}, {"c3", 6}};
    return desc;
}

Placement linePlacement() {
    Placement placement;
    placement.robotLocations = {{"r1", "d1"}, {"r2", "d2"}};
    placement.piles = {{"p1", {"c1"}}, {"p2", {"c2"}}, {"p3", {"c3"}}};
    return placement;
}

// The same state as linePlacement(), listing only the true fluents
InitialAssignment lineAssignment() {
    InitialAssignment a;
    a.push_back({"robot_at", {"r1", "d1"}});
    a.push_back({"robot_at", {"r2", "d2"}});
    a.push_back({"load_0", {"r1"}});
    a.push_back({"load_0", {"r2"}});
    for (int i = 1; i <= 3; i++) {
        std::string c = "c" + std::to_string(i), p = "p" + std::to_string(i), d = "d" + std::to_string(i);
        a.push_back({"in_pile", {c, p}});
        a.push_back({"bottom", {c, p}});
        a.push_back({"top", {c, p}});
        a.push_back({"at_dock", {c, d}});
    }
    return a;
}

bool throwsConfigurationError(const std::function<void()>& f) {
    try {
        f();
    } catch (const ConfigurationError& e) {
        Log::d("Caught: %s\n", e.what());
        return true;
    }
    return false;
}

void testPhysicalInitialState() {
    ProblemAssembler assembler(lineTopology(), "line");
    assembler.setInitialPlacement(linePlacement());
    assembler.addGoal(assembler.containerAtDock("c1", "d3"));

    Problem problem = assembler.assemble();
    assert(problem.getName() == "line");
    assert(problem.getNumActions() == assembler.getActions().size());
    assert(problem.getGoal().size() == 1);
    assert(problem.getNumValuesFrom(DEFAULT_FALSE) == 0);
    assert(problem.getNumValuesFrom(STATIC) + problem.getNumValuesFrom(EXPLICIT) == problem.getVocabulary().size());
    assert(!problem.satisfiesGoal(problem.getInitialState()));
    assert(problem.getUnsatisfiedGoals(problem.getInitialState()).size() == 1);

    // Assembling again yields the same problem
    Problem again = assembler.assemble();
    assert(again.getInitialState() == problem.getInitialState());
    assert(again.getNumActions() == problem.getNumActions());

    // Stepping through the problem
    int move = problem.findAction("move_r1_d1_d2");
    assert(move >= 0);
    assert(problem.findAction("move_r1_d1_d3") < 0);
    assert(!problem.isApplicable(problem.getInitialState(), problem.findAction("move_r1_d2_d3")));
    assert(problem.isApplicable(problem.getInitialState(), move));
    State s = problem.apply(problem.getInitialState(), move);
    assert(problem.holds(s, assembler.robotAt("r1", "d2")));
    assert(!problem.holds(s, assembler.robotAt("r1", "d1")));
    assert(problem.getEncoder().checkInvariants(s).empty());

    // Display names address all variants of a binding
    const auto& variants = problem.findActionsByName("pickup(r1, c1, p1, d1)");
    assert(!variants.empty());
    for (int v : variants) assert(problem.getAction(v).getDisplayName(problem.getRegistry()) == "(pickup r1 c1 p1 d1)");
    assert(problem.findActionsByName("(PICKUP r1 c1 p1 d1)").size() == variants.size());
    assert(problem.findActionsByName("pickup r1 c9 p1 d1").empty());

    problem.printStatistics();
}

void testExplicitAssignment() {
    ProblemAssembler physical(lineTopology());
    physical.setInitialPlacement(linePlacement());
    std::vector<ValueSource> physicalSources;
    State expected = physical.computeInitialState(physicalSources);

    ProblemAssembler assembler(lineTopology());
    assembler.setInitialAssignment(lineAssignment());
    std::vector<ValueSource> sources;
    State state = assembler.computeInitialState(sources);
    assert(state == expected);
    size_t numDefaulted = 0;
    for (ValueSource s : sources) if (s == DEFAULT_FALSE) numDefaulted++;
    assert(numDefaulted > 0);

    // Static values may be repeated if they agree with the registry
    InitialAssignment a = lineAssignment();
    a.push_back({"adjacent", {"d1", "d2"}});
    a.push_back({"weight_2", {"c1"}});
    a.push_back({"empty", {"p1"}, false});
    assembler.setInitialAssignment(a);
    assert(assembler.computeInitialState(sources) == expected);

    auto invalid = [&](const std::function<void(InitialAssignment&)>& edit) {
        return [&assembler, edit]() {
            InitialAssignment a = lineAssignment();
            edit(a);
            assembler.setInitialAssignment(a);
            std::vector<ValueSource> sources;
            assembler.computeInitialState(sources);
        };
    };
    // Two tops in one pile
    assert(throwsConfigurationError(invalid([](InitialAssignment& a) {a.push_back({"top", {"c2", "p1"}});})));
    // Contradicting the registry
    assert(throwsConfigurationError(invalid([](InitialAssignment& a) {a.push_back({"adjacent", {"d1", "d3"}});})));
    assert(throwsConfigurationError(invalid([](InitialAssignment& a) {a.push_back({"weight_4", {"c1"}});})));
    // Both values for one fluent
    assert(throwsConfigurationError(invalid([](InitialAssignment& a) {a.push_back({"robot_at", {"r1", "d1"}, false});})));
    // Unknown predicate, wrong arity, wrong type, unknown entity
    assert(throwsConfigurationError(invalid([](InitialAssignment& a) {a.push_back({"flying", {"r1"}});})));
    assert(throwsConfigurationError(invalid([](InitialAssignment& a) {a.push_back({"robot_at", {"r1"}});})));
    assert(throwsConfigurationError(invalid([](InitialAssignment& a) {a.push_back({"robot_at", {"c1", "d1"}});})));
    assert(throwsConfigurationError(invalid([](InitialAssignment& a) {a.push_back({"load_4", {"r9"}});})));
    // Missing robot location
    assert(throwsConfigurationError(invalid([](InitialAssignment& a) {a.erase(a.begin());})));
    // Missing load level
    assert(throwsConfigurationError(invalid([](InitialAssignment& a) {a.erase(a.begin()+2);})));

    // The same faulty input fails the same way every time
    std::string first, second;
    assembler.setInitialAssignment(InitialAssignment{{"top", {"c2", "p1"}}});
    try {assembler.validate();} catch (const ConfigurationError& e) {first = e.what();}
    try {assembler.validate();} catch (const ConfigurationError& e) {second = e.what();}
    assert(!first.empty());
    assert(first == second);
}

void testInvalidSetups() {
    ProblemAssembler assembler(lineTopology());
    // No initial state
    assert(throwsConfigurationError([&]() {assembler.assemble();}));

    // Two robots at an exclusive dock
    TopologyDescription exclusive = lineTopology();
    exclusive.exclusiveDocks = true;
    ProblemAssembler exclusiveAssembler(exclusive);
    Placement crowded = linePlacement();
    crowded.robotLocations[1].second = "d1";
    assert(throwsConfigurationError([&]() {exclusiveAssembler.setInitialPlacement(crowded);}));
    exclusiveAssembler.setInitialPlacement(linePlacement());
    exclusiveAssembler.validate();

    // Goals
    assembler.setInitialPlacement(linePlacement());
    assert(throwsConfigurationError([&]() {assembler.literal("flying", {"r1"});}));
    assert(throwsConfigurationError([&]() {assembler.robotAt("c1", "d1");}));
    assert(throwsConfigurationError([&]() {assembler.containerInPile("c1", "p9");}));

    assembler.addGoal(assembler.literal("adjacent", {"d1", "d3"}));
    assert(throwsConfigurationError([&]() {assembler.assemble();}));
    assembler.clearGoal();

    assembler.addGoal(assembler.robotAt("r1", "d3"));
    assembler.addGoal(assembler.literal("robot_at", {"r1", "d3"}, false));
    assert(throwsConfigurationError([&]() {assembler.assemble();}));
    assembler.clearGoal();

    // Static goal literals which hold are fine, as is an empty goal
    assembler.addGoal(assembler.literal("adjacent", {"d1", "d2"}));
    assembler.validate();
    assembler.clearGoal();
    Problem problem = assembler.assemble();
    assert(problem.satisfiesGoal(problem.getInitialState()));
}

void testBuiltinScenarios() {
    const std::vector<std::string> names = {"line_transfer", "move_robot", "move_container", "robot_carrying",
            "complex_goal", "capacity_demo", "weight_limit", "swap_containers", "one_way"};
    const std::vector<size_t> goalSizes = {1, 1, 1, 1, 2, 3, 2, 6, 1};

    const auto& scenarios = Scenarios::all();
    assert(scenarios.size() == names.size());
    for (size_t i = 0; i < scenarios.size(); i++) {
        const Scenario& scenario = scenarios[i];
        assert(scenario.name == names[i] || Log::e("Scenario %zu is %s\n", i, scenario.name.c_str()));
        assert(Scenarios::find(scenario.name) == &scenario);

        ProblemAssembler assembler(scenario.topology, scenario.name);
        assembler.setInitialPlacement(scenario.placement);
        for (const FluentValue& g : scenario.goal) assembler.addGoal(assembler.literal(g.predicate, g.args, g.value));
        Problem problem = assembler.assemble();
        assert(problem.getGoal().size() == goalSizes[i]);

        bool classic = i >= 1 && i <= 4;
        assert(problem.getRegistry().hasExclusiveDocks() == classic);
        assert(problem.getRegistry().hasSymmetricAdjacency() == (scenario.name != "one_way"));
        // Nothing is already achieved in the initial state
        assert(!problem.satisfiesGoal(problem.getInitialState()));
    }
    assert(Scenarios::find("no_such_scenario") == nullptr);
    assert(Scenarios::find(Scenarios::defaultName()) == &scenarios.front());
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    testPhysicalInitialState();
    testExplicitAssignment();
    testInvalidSetups();
    testBuiltinScenarios();

    Log::i("All problem assembler tests passed.\n");
    return 0;
}
