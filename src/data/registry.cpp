
#include <algorithm>
#include <set>
#include <assert.h>

#include "data/registry.h"
#include "util/errors.h"
#include "util/log.h"

namespace {
    bool inEnumeration(const std::vector<int>& levels, int value) {
        return std::find(levels.begin(), levels.end(), value) != levels.end();
    }
    std::string enumerationToString(const std::vector<int>& levels) {
        std::string out = "{";
        for (size_t i = 0; i < levels.size(); i++) 
            out += (i == 0 ? "" : ",") + std::to_string(levels[i]);
        return out + "}";
    }
}

Registry::Registry(const TopologyDescription& desc) : _entities_by_type(NUM_ENTITY_TYPES),
        _symmetric_adjacency(desc.symmetricAdjacency), _exclusive_docks(desc.exclusiveDocks) {

    // ID 0 is never assigned
    _name_back_table.emplace_back();
    _types.push_back(ROBOT);
    _slot_capacity.push_back(Levels::UNSET);
    _max_weight.push_back(Levels::UNSET);
    _weight.push_back(Levels::UNSET);
    _dock_of_pile.push_back(Levels::UNSET);

    if (desc.docks.empty()) throw ConfigurationError("Topology contains no docks");

    for (const auto& dock : desc.docks) addEntity(dock, DOCK);

    for (const auto& pile : desc.piles) {
        int id = addEntity(pile.name, PILE);
        if (!hasName(pile.dock) || getType(nameId(pile.dock)) != DOCK) 
            throw ConfigurationError("Pile " + pile.name + " is hosted at unknown dock \"" + pile.dock + "\"");
        int dock = nameId(pile.dock);
        _dock_of_pile[id] = dock;
        _piles_at_dock[dock].push_back(id);
    }

    for (const auto& robot : desc.robots) {
        int id = addEntity(robot.name, ROBOT);
        if (robot.slotCapacity == Levels::UNSET) 
            throw ConfigurationError("Robot " + robot.name + " has no slot capacity assigned");
        if (robot.maxWeight == Levels::UNSET) 
            throw ConfigurationError("Robot " + robot.name + " has no weight threshold assigned");
        if (!inEnumeration(Levels::SLOT_CAPACITIES, robot.slotCapacity)) 
            throw EncodingError("Slot capacity " + std::to_string(robot.slotCapacity) + " of robot " 
                + robot.name + " is not in " + enumerationToString(Levels::SLOT_CAPACITIES));
        if (!inEnumeration(Levels::MAX_WEIGHTS, robot.maxWeight)) 
            throw EncodingError("Weight threshold " + std::to_string(robot.maxWeight) + " of robot " 
                + robot.name + " is not in " + enumerationToString(Levels::MAX_WEIGHTS));
        _slot_capacity[id] = robot.slotCapacity;
        _max_weight[id] = robot.maxWeight;
    }

    std::set<int> usedWeights;
    for (const auto& container : desc.containers) {
        int id = addEntity(container.name, CONTAINER);
        if (container.weight == Levels::UNSET) 
            throw ConfigurationError("Container " + container.name + " has no weight class assigned");
        if (!inEnumeration(Levels::WEIGHT_CLASSES, container.weight)) 
            throw EncodingError("Weight class " + std::to_string(container.weight) + " of container " 
                + container.name + " is not in " + enumerationToString(Levels::WEIGHT_CLASSES));
        _weight[id] = container.weight;
        usedWeights.insert(container.weight);
    }
    _used_weight_classes.assign(usedWeights.begin(), usedWeights.end());

    for (const auto& [from, to] : desc.adjacencies) {
        addAdjacency(from, to);
        if (_symmetric_adjacency) addAdjacency(to, from);
    }

    Log::v("Registry: %lu robots, %lu docks, %lu piles, %lu containers, %lu adjacencies\n", 
        getRobots().size(), getDocks().size(), getPiles().size(), getContainers().size(), _adjacent.size());
}

int Registry::addEntity(const std::string& name, EntityType type) {
    if (name.empty()) 
        throw ConfigurationError("Empty name given for a " + typeName(type));
    if (_name_table.count(name)) 
        throw ConfigurationError("Duplicate entity name \"" + name + "\"");
    int id = _name_back_table.size();
    _name_table[name] = id;
    _name_back_table.push_back(name);
    _types.push_back(type);
    _entities_by_type[type].push_back(id);
    _slot_capacity.push_back(Levels::UNSET);
    _max_weight.push_back(Levels::UNSET);
    _weight.push_back(Levels::UNSET);
    _dock_of_pile.push_back(Levels::UNSET);
    return id;
}

void Registry::addAdjacency(const std::string& from, const std::string& to) {
    if (!hasName(from) || getType(nameId(from)) != DOCK)
        throw ConfigurationError("Adjacency refers to unknown dock \"" + from + "\"");
    if (!hasName(to) || getType(nameId(to)) != DOCK)
        throw ConfigurationError("Adjacency refers to unknown dock \"" + to + "\"");
    if (from == to) 
        throw ConfigurationError("Dock " + from + " cannot be adjacent to itself");
    IntPair edge(nameId(from), nameId(to));
    if (_adjacent.count(edge)) return;
    _adjacent.insert(edge);
    _successors[edge.first].push_back(edge.second);
}

int Registry::nameId(const std::string& name) const {
    auto it = _name_table.find(name);
    if (it == _name_table.end()) 
        throw ConfigurationError("Unknown entity \"" + name + "\"");
    return it->second;
}

bool Registry::hasName(const std::string& name) const {
    return _name_table.count(name);
}

int Registry::nameIdOfType(const std::string& name, EntityType type) const {
    int id = nameId(name);
    if (getType(id) != type) 
        throw ConfigurationError("Entity \"" + name + "\" is a " + typeName(getType(id)) 
            + ", expected a " + typeName(type));
    return id;
}

const std::string& Registry::toString(int id) const {
    assert((id > 0 && id < (int)_name_back_table.size()) || Log::e("No entity known with ID %i!\n", id));
    return _name_back_table[id];
}

EntityType Registry::getType(int id) const {
    assert(id > 0 && id < (int)_types.size());
    return _types[id];
}

bool Registry::isOfType(int id, EntityType type) const {
    return id > 0 && id < (int)_types.size() && _types[id] == type;
}

int Registry::getSlotCapacity(int robot) const {
    assert(isOfType(robot, ROBOT));
    return _slot_capacity[robot];
}
int Registry::getMaxWeight(int robot) const {
    assert(isOfType(robot, ROBOT));
    return _max_weight[robot];
}
int Registry::getWeight(int container) const {
    assert(isOfType(container, CONTAINER));
    return _weight[container];
}
int Registry::getDockOfPile(int pile) const {
    assert(isOfType(pile, PILE));
    return _dock_of_pile[pile];
}

const std::vector<int>& Registry::getPilesAtDock(int dock) const {
    static const std::vector<int> NONE;
    auto it = _piles_at_dock.find(dock);
    return it == _piles_at_dock.end() ? NONE : it->second;
}

bool Registry::isAdjacent(int fromDock, int toDock) const {
    return _adjacent.count(IntPair(fromDock, toDock));
}

const std::vector<int>& Registry::getSuccessors(int dock) const {
    static const std::vector<int> NONE;
    auto it = _successors.find(dock);
    return it == _successors.end() ? NONE : it->second;
}

std::string Registry::typeName(EntityType type) {
    switch (type) {
    case ROBOT: return "robot";
    case DOCK: return "dock";
    case PILE: return "pile";
    case CONTAINER: return "container";
    }
    return "?";
}
