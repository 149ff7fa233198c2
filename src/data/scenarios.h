#ifndef DOCKPLAN_SCENARIOS_H
#define DOCKPLAN_SCENARIOS_H

#include <string>
#include <vector>

#include "data/registry.h"
#include "data/placement.h"
#include "data/problem.h"

// A built-in example problem, given completely by entity names.
struct Scenario {
    std::string name;
    std::string description;
    TopologyDescription topology;
    Placement placement;
    // Conjunction of goal literals
    std::vector<FluentValue> goal;
};

namespace Scenarios {
    const std::vector<Scenario>& all();
    // nullptr if no scenario has the given name
    const Scenario* find(const std::string& name);
    const std::string& defaultName();
}

#endif
