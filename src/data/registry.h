#ifndef DOCKPLAN_REGISTRY_H
#define DOCKPLAN_REGISTRY_H

#include <string>
#include <vector>

#include "util/hashmap.h"

enum EntityType {ROBOT = 0, DOCK = 1, PILE = 2, CONTAINER = 3};
const int NUM_ENTITY_TYPES = 4;

// The fixed enumerations of all static entity attributes.
namespace Levels {
    const int UNSET = -1;
    const std::vector<int> WEIGHT_CLASSES = {2, 4, 6};
    const std::vector<int> MAX_WEIGHTS = {5, 6, 8, 10};
    // 0 is a robot which can move but never hold anything
    const std::vector<int> SLOT_CAPACITIES = {0, 1, 2, 3};
}

struct PileSpec {
    std::string name;
    std::string dock;
};

struct RobotSpec {
    std::string name;
    int slotCapacity = Levels::UNSET;
    int maxWeight = Levels::UNSET;
};

struct ContainerSpec {
    std::string name;
    int weight = Levels::UNSET;
};

struct TopologyDescription {
    std::vector<std::string> docks;
    // Each pair (a, b) allows moving from a to b 
    // (and from b to a if symmetricAdjacency is set).
    std::vector<std::pair<std::string, std::string>> adjacencies;
    bool symmetricAdjacency = true;
    // If set, at most one robot may be located at a dock at any time.
    bool exclusiveDocks = false;
    std::vector<PileSpec> piles;
    std::vector<RobotSpec> robots;
    std::vector<ContainerSpec> containers;
};

/*
 * Immutable set of all entities of a problem instance together with
 * their static attributes and the dock topology.
 * Entity IDs are positive, dense, and unique across all entity types.
 */
class Registry {

private:
    // Maps an entity name to its ID.
    FlatHashMap<std::string, int> _name_table;
    // Maps an ID to its entity name (index 0 is unused).
    std::vector<std::string> _name_back_table;
    std::vector<EntityType> _types;
    std::vector<std::vector<int>> _entities_by_type;

    // Static attributes, indexed by entity ID (UNSET where not applicable).
    std::vector<int> _slot_capacity;
    std::vector<int> _max_weight;
    std::vector<int> _weight;
    std::vector<int> _dock_of_pile;

    FlatHashSet<IntPair, IntPairHasher> _adjacent;
    NodeHashMap<int, std::vector<int>> _successors;
    NodeHashMap<int, std::vector<int>> _piles_at_dock;

    // Weight classes which occur among the containers, ascending.
    std::vector<int> _used_weight_classes;

    bool _symmetric_adjacency;
    bool _exclusive_docks;

public:
    explicit Registry(const TopologyDescription& desc);

    int nameId(const std::string& name) const;
    bool hasName(const std::string& name) const;
    int nameIdOfType(const std::string& name, EntityType type) const;
    const std::string& toString(int id) const;
    EntityType getType(int id) const;
    bool isOfType(int id, EntityType type) const;
    size_t getNumEntities() const {return _name_back_table.size()-1;}

    const std::vector<int>& getEntitiesOfType(EntityType type) const {return _entities_by_type[type];}
    const std::vector<int>& getRobots() const {return _entities_by_type[ROBOT];}
    const std::vector<int>& getDocks() const {return _entities_by_type[DOCK];}
    const std::vector<int>& getPiles() const {return _entities_by_type[PILE];}
    const std::vector<int>& getContainers() const {return _entities_by_type[CONTAINER];}

    int getSlotCapacity(int robot) const;
    int getMaxWeight(int robot) const;
    int getWeight(int container) const;
    int getDockOfPile(int pile) const;
    const std::vector<int>& getPilesAtDock(int dock) const;

    bool isAdjacent(int fromDock, int toDock) const;
    const std::vector<int>& getSuccessors(int dock) const;
    const std::vector<int>& getUsedWeightClasses() const {return _used_weight_classes;}

    bool hasSymmetricAdjacency() const {return _symmetric_adjacency;}
    bool hasExclusiveDocks() const {return _exclusive_docks;}

    static std::string typeName(EntityType type);

private:
    int addEntity(const std::string& name, EntityType type);
    void addAdjacency(const std::string& from, const std::string& to);
};

#endif
