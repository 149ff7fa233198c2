
#include <assert.h>
#include <deque>
#include <set>

#include "util/timer.h"
#include "util/log.h"
#include "util/params.h"

#include "algo/problem_assembler.h"
#include "data/scenarios.h"

// Explores all states reachable from the initial state of a scenario and 
// checks that each of them is a legal physical state.
size_t explore(const std::string& name, int exclusiveDocks, size_t maxStates) {
    const Scenario* scenario = Scenarios::find(name);
    assert(scenario != nullptr);
    TopologyDescription topology = scenario->topology;
    if (exclusiveDocks >= 0) topology.exclusiveDocks = exclusiveDocks > 0;
    ProblemAssembler assembler(topology, scenario->name);
    assembler.setInitialPlacement(scenario->placement);
    for (const FluentValue& g : scenario->goal) assembler.addGoal(assembler.literal(g.predicate, g.args, g.value));
    Problem problem = assembler.assemble();
    const ConstraintEncoder& enc = problem.getEncoder();
    const Registry& registry = problem.getRegistry();

    std::set<State> visited;
    std::deque<State> open;
    visited.insert(problem.getInitialState());
    open.push_back(problem.getInitialState());
    bool goalReached = false;
    size_t numTransitions = 0;

    while (!open.empty() && visited.size() < maxStates) {
        State state = std::move(open.front());
        open.pop_front();
        goalReached |= problem.satisfiesGoal(state);

        PhysicalState before;
        std::vector<std::string> violations;
        assert(enc.decodeState(state, before, violations));

        for (size_t a = 0; a < problem.getNumActions(); a++) {
            if (!problem.isApplicable(state, a)) continue;
            numTransitions++;
            State next = problem.apply(state, a);
            PhysicalState after;
            bool legal = enc.decodeState(next, after, violations);
            assert(legal || Log::e("%s leads from %s to an illegal state: %s\n", 
                problem.getAction(a).getKey().c_str(), enc.toString(before).c_str(), violations[0].c_str()));

            // Each action changes exactly what it names
            const Action& action = problem.getAction(a);
            int robot = action.getArguments()[0];
            if (action.getType() == MOVE) {
                assert(after.robotLocation.at(robot) == action.getArguments()[2]);
                assert(after.pileStack == before.pileStack);
                assert(after.robotCargo == before.robotCargo);
            } else {
                int container = action.getArguments()[1];
                int pile = action.getArguments()[2];
                const auto& cargo = after.cargoOf(robot);
                const auto& stack = after.stackOf(pile);
                if (action.getType() == PICKUP) {
                    assert(!cargo.empty() && cargo.back() == container);
                    assert(before.stackOf(pile).back() == container);
                    assert(stack.size() + 1 == before.stackOf(pile).size());
                } else {
                    assert(!stack.empty() && stack.back() == container);
                    assert(before.cargoOf(robot).back() == container);
                    assert(cargo.size() + 1 == before.cargoOf(robot).size());
                }
                int load = 0;
                for (int c : cargo) load += registry.getWeight(c);
                assert(load <= registry.getMaxWeight(robot));
                assert((int)cargo.size() <= registry.getSlotCapacity(robot));
            }
            if (registry.hasExclusiveDocks()) {
                std::set<int> docks;
                for (const auto& [r, d] : after.robotLocation) assert(docks.insert(d).second);
            }

            if (visited.insert(next).second) open.push_back(std::move(next));
        }
    }
    Log::i("%s%s: %zu reachable states, %zu transitions%s\n", name.c_str(), 
        topology.exclusiveDocks ? " (exclusive docks)" : "", visited.size(), numTransitions, 
        goalReached ? ", goal reachable" : "");
    return visited.size();
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    size_t maxStates = params.getIntParam("max", 50000);

    explore("line_transfer", 0, maxStates);
    explore("line_transfer", 1, maxStates);
    explore("move_container", -1, maxStates);
    explore("capacity_demo", -1, maxStates);
    explore("weight_limit", -1, maxStates);

    // Exclusive docks reduce the reachable state space
    size_t shared = explore("complex_goal", 0, maxStates);
    size_t exclusive = explore("complex_goal", 1, maxStates);
    assert(exclusive < shared);

    // Without a way back the robot can only be at d2 or d3
    assert(explore("one_way", -1, maxStates) == 2);

    Log::i("All invariant tests passed.\n");
    return 0;
}
