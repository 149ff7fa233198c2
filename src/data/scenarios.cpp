
#include "data/scenarios.h"

namespace {

RobotSpec robot(const std::string& name, int slots, int maxWeight) {
    RobotSpec r;
    r.name = name;
    r.slotCapacity = slots;
    r.maxWeight = maxWeight;
    return r;
}

ContainerSpec container(const std::string& name, int weight) {
    ContainerSpec c;
    c.name = name;
    c.weight = weight;
    return c;
}

FluentValue goal(const std::string& predicate, const std::vector<std::string>& args) {
    FluentValue g;
    g.predicate = predicate;
    g.args = args;
    return g;
}

// Three docks in a triangle with exclusive occupancy: p1 at d1 holds c2 
// below c1, p2 at d2 holds c3, p3 at d2 is empty; r1 at d1, r2 at d2.
Scenario classic(const std::string& name, const std::string& description) {
    Scenario s;
    s.name = name;
    s.description = description;
    s.topology.docks = {"d1", "d2", "d3"};
    s.topology.adjacencies = {{"d1", "d2"}, {"d2", "d3"}, {"d3", "d1"}};
    s.topology.exclusiveDocks = true;
    s.topology.piles = {{"p1", "d1"}, {"p2", "d2"}, {"p3", "d2"}};
    s.topology.robots = {robot("r1", 1, 6), robot("r2", 1, 6)};
    s.topology.containers = {container("c1", 2), container("c2", 4), container("c3", 6)};
    s.placement.robotLocations = {{"r1", "d1"}, {"r2", "d2"}};
    s.placement.piles = {{"p1", {"c2", "c1"}}, {"p2", {"c3"}}, {"p3", {}}};
    return s;
}

std::vector<Scenario> buildAll() {
    std::vector<Scenario> scenarios;

    {
        Scenario s;
        s.name = "line_transfer";
        s.description = "Bring the container at d1 to d3 along the line d1-d2-d3";
        s.topology.docks = {"d1", "d2", "d3"};
        s.topology.adjacencies = {{"d1", "d2"}, {"d2", "d3"}};
        s.topology.piles = {{"p1", "d1"}, {"p2", "d2"}, {"p3", "d3"}};
        s.topology.robots = {robot("r1", 1, 6), robot("r2", 1, 6)};
        s.topology.containers = {container("c1", 2), container("c2", 4), container("c3", 6)};
        s.placement.robotLocations = {{"r1", "d1"}, {"r2", "d2"}};
        s.placement.piles = {{"p1", {"c1"}}, {"p2", {"c2"}}, {"p3", {"c3"}}};
        s.goal = {goal("at_dock", {"c1", "d3"})};
        scenarios.push_back(s);
    }
    {
        Scenario s = classic("move_robot", "Move robot r1 to dock d3");
        s.goal = {goal("robot_at", {"r1", "d3"})};
        scenarios.push_back(s);
    }
    {
        Scenario s = classic("move_container", "Move container c1 to pile p2");
        s.goal = {goal("in_pile", {"c1", "p2"})};
        scenarios.push_back(s);
    }
    {
        Scenario s = classic("robot_carrying", "Have robot r1 carry container c1");
        s.goal = {goal("held_by", {"c1", "r1"})};
        scenarios.push_back(s);
    }
    {
        Scenario s = classic("complex_goal", "Move r1 to d3 and c1 to pile p2");
        s.goal = {goal("robot_at", {"r1", "d3"}), goal("in_pile", {"c1", "p2"})};
        scenarios.push_back(s);
    }
    {
        Scenario s;
        s.name = "capacity_demo";
        s.description = "Robots with one, two and three slots; move the top container of p1 to p3";
        s.topology.docks = {"d1", "d2", "d3"};
        s.topology.adjacencies = {{"d1", "d2"}, {"d2", "d3"}, {"d3", "d1"}};
        s.topology.piles = {{"p1", "d1"}, {"p2", "d2"}, {"p3", "d3"}};
        s.topology.robots = {robot("r1", 1, 5), robot("r2", 2, 8), robot("r3", 3, 10)};
        s.topology.containers = {container("c1", 4), container("c2", 2), container("c3", 4)};
        s.placement.robotLocations = {{"r1", "d1"}, {"r2", "d2"}, {"r3", "d3"}};
        s.placement.piles = {{"p1", {"c1", "c2"}}, {"p2", {"c3"}}, {"p3", {}}};
        s.goal = {goal("in_pile", {"c2", "p3"}), goal("in_pile", {"c1", "p1"}), goal("in_pile", {"c3", "p2"})};
        scenarios.push_back(s);
    }
    {
        Scenario s;
        s.name = "weight_limit";
        s.description = "Two 4t containers and a 5t robot with two slots: two trips are needed";
        s.topology.docks = {"d1", "d2"};
        s.topology.adjacencies = {{"d1", "d2"}};
        s.topology.piles = {{"p1", "d1"}, {"p2", "d2"}};
        s.topology.robots = {robot("r1", 2, 5)};
        s.topology.containers = {container("c1", 4), container("c2", 4)};
        s.placement.robotLocations = {{"r1", "d1"}};
        s.placement.piles = {{"p1", {"c1", "c2"}}, {"p2", {}}};
        s.goal = {goal("in_pile", {"c1", "p2"}), goal("in_pile", {"c2", "p2"})};
        scenarios.push_back(s);
    }
    {
        Scenario s;
        s.name = "swap_containers";
        s.description = "Swap the contents of two piles, keeping their stacking order";
        s.topology.docks = {"d1", "d2"};
        s.topology.adjacencies = {{"d1", "d2"}};
        s.topology.piles = {{"p1", "d1"}, {"p2", "d2"}};
        s.topology.robots = {robot("r1", 2, 6), robot("r2", 2, 6)};
        s.topology.containers = {container("c1", 2), container("c2", 2), container("c3", 2), container("c4", 2)};
        s.placement.robotLocations = {{"r1", "d1"}, {"r2", "d2"}};
        s.placement.piles = {{"p1", {"c1", "c2"}}, {"p2", {"c3", "c4"}}};
        s.goal = {goal("bottom", {"c3", "p1"}), goal("on", {"c4", "c3"}), goal("top", {"c4", "p1"}),
                  goal("bottom", {"c1", "p2"}), goal("on", {"c2", "c1"}), goal("top", {"c2", "p2"})};
        scenarios.push_back(s);
    }
    {
        Scenario s;
        s.name = "one_way";
        s.description = "Directed adjacency d1->d2->d3: r1 can never return to d1";
        s.topology.docks = {"d1", "d2", "d3"};
        s.topology.adjacencies = {{"d1", "d2"}, {"d2", "d3"}};
        s.topology.symmetricAdjacency = false;
        s.topology.piles = {{"p1", "d1"}};
        s.topology.robots = {robot("r1", 1, 6)};
        s.topology.containers = {container("c1", 2)};
        s.placement.robotLocations = {{"r1", "d2"}};
        s.placement.piles = {{"p1", {"c1"}}};
        s.goal = {goal("robot_at", {"r1", "d1"})};
        scenarios.push_back(s);
    }
    return scenarios;
}

}

namespace Scenarios {

const std::vector<Scenario>& all() {
    static const std::vector<Scenario> SCENARIOS = buildAll();
    return SCENARIOS;
}

const Scenario* find(const std::string& name) {
    for (const Scenario& s : all()) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

const std::string& defaultName() {
    static const std::string NAME = "line_transfer";
    return NAME;
}

}
