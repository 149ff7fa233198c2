#ifndef DOCKPLAN_CONSTRAINT_ENCODER_H
#define DOCKPLAN_CONSTRAINT_ENCODER_H

#include <string>
#include <vector>

#include "data/registry.h"
#include "data/vocabulary.h"
#include "data/signature.h"
#include "data/placement.h"
#include "util/hashmap.h"

namespace Predicates {
    const std::string ADJACENT = "adjacent";
    const std::string PILE_AT = "pile_at";
    const std::string ROBOT_AT = "robot_at";
    const std::string OCCUPIED = "occupied";
    const std::string IN_PILE = "in_pile";
    const std::string ON = "on";
    const std::string BOTTOM = "bottom";
    const std::string TOP = "top";
    const std::string EMPTY = "empty";
    const std::string AT_DOCK = "at_dock";
    const std::string HELD_BY = "held_by";

    inline std::string weight(int w) {return "weight_" + std::to_string(w);}
    inline std::string maxWeight(int t) {return "max_weight_" + std::to_string(t);}
    inline std::string slots(int k) {return "slots_" + std::to_string(k);}
    inline std::string slotUsed(int i) {return "slot_used_" + std::to_string(i);}
    inline std::string inSlot(int i) {return "in_slot_" + std::to_string(i);}
    inline std::string load(int l) {return "load_" + std::to_string(l);}
}

// One admissible (slot, current load, moved weight) combination of a robot.
// For a pickup, the container enters "slot" and the load grows from "load"
// to load+weight; for a putdown, the container leaves "slot" and the load
// shrinks from "load" to load-weight.
struct LoadTransition {
    int slot;
    int load;
    int weight;
};

/*
 * Encodes the physical model (integer weights and capacities, LIFO stacks,
 * robot slots) into the boolean fluents of a Vocabulary and decodes
 * boolean assignments back, reporting each violated physical invariant.
 * An encoder is a read-only view on a registry and a vocabulary built
 * by buildVocabulary() from the same registry.
 */
class ConstraintEncoder {

private:
    const Registry& _registry;
    const Vocabulary& _vocab;

    int _pred_adjacent;
    int _pred_pile_at;
    int _pred_robot_at;
    int _pred_occupied;
    int _pred_in_pile;
    int _pred_on;
    int _pred_bottom;
    int _pred_top;
    int _pred_empty;
    int _pred_at_dock;
    int _pred_held_by;
    FlatHashMap<int, int> _pred_weight;
    FlatHashMap<int, int> _pred_max_weight;
    FlatHashMap<int, int> _pred_slots;
    FlatHashMap<int, int> _pred_load;
    // Indexed by slot number (index 0 unused)
    std::vector<int> _pred_slot_used;
    std::vector<int> _pred_in_slot;
    // Maps the ID of each level predicate to its level
    FlatHashMap<int, int> _level_of_pred;

    // Per robot: the load levels admissible with exactly i held containers
    NodeHashMap<int, std::vector<std::vector<int>>> _load_levels;
    NodeHashMap<int, std::vector<LoadTransition>> _pickup_transitions;
    NodeHashMap<int, std::vector<LoadTransition>> _putdown_transitions;

public:
    ConstraintEncoder(const Registry& registry, const Vocabulary& vocab);

    // Declares all predicates and ground fluents for the given registry.
    static Vocabulary buildVocabulary(const Registry& registry);

    // Load levels a robot can have while holding exactly numHeld containers.
    static std::vector<std::vector<int>> computeLoadLevels(int slotCapacity, int maxWeight,
            const std::vector<int>& weightClasses);

    const Registry& getRegistry() const {return _registry;}
    const Vocabulary& getVocabulary() const {return _vocab;}

    const std::vector<int>& getLoadLevels(int robot, int numHeld) const;
    std::vector<int> getAllLoadLevels(int robot) const;
    const std::vector<LoadTransition>& getPickupTransitions(int robot) const;
    const std::vector<LoadTransition>& getPutdownTransitions(int robot) const;

    USignature sigAdjacent(int from, int to) const {return USignature(_pred_adjacent, {from, to});}
    USignature sigPileAt(int pile, int dock) const {return USignature(_pred_pile_at, {pile, dock});}
    USignature sigWeight(int container, int w) const {return USignature(predicate(_pred_weight, w), {container});}
    USignature sigMaxWeight(int robot, int t) const {return USignature(predicate(_pred_max_weight, t), {robot});}
    USignature sigSlots(int robot, int k) const {return USignature(predicate(_pred_slots, k), {robot});}
    USignature sigRobotAt(int robot, int dock) const {return USignature(_pred_robot_at, {robot, dock});}
    USignature sigOccupied(int dock) const {assert(_pred_occupied >= 0); return USignature(_pred_occupied, {dock});}
    USignature sigInPile(int container, int pile) const {return USignature(_pred_in_pile, {container, pile});}
    USignature sigOn(int upper, int lower) const {return USignature(_pred_on, {upper, lower});}
    USignature sigBottom(int container, int pile) const {return USignature(_pred_bottom, {container, pile});}
    USignature sigTop(int container, int pile) const {return USignature(_pred_top, {container, pile});}
    USignature sigEmpty(int pile) const {return USignature(_pred_empty, {pile});}
    USignature sigAtDock(int container, int dock) const {return USignature(_pred_at_dock, {container, dock});}
    USignature sigHeldBy(int container, int robot) const {return USignature(_pred_held_by, {container, robot});}
    USignature sigSlotUsed(int robot, int slot) const {
        assert(slot >= 1 && slot < (int)_pred_slot_used.size());
        return USignature(_pred_slot_used[slot], {robot});
    }
    USignature sigInSlot(int robot, int slot, int container) const {
        assert(slot >= 1 && slot < (int)_pred_in_slot.size());
        return USignature(_pred_in_slot[slot], {robot, container});
    }
    USignature sigLoad(int robot, int load) const {return USignature(predicate(_pred_load, load), {robot});}

    // The fixed truth value of a fluent of a static predicate.
    bool staticValue(const USignature& sig) const;

    // Throws a ConfigurationError if some name is unknown or of the wrong type,
    // or if the resolved state is not physically legal.
    PhysicalState resolvePlacement(const Placement& placement) const;

    // Throws a ConfigurationError describing the first violated invariant.
    void checkPhysical(const PhysicalState& state) const;

    // The complete boolean assignment corresponding to a legal physical state.
    State encodeState(const PhysicalState& state) const;

    // Reconstructs the physical state of an assignment. Returns false
    // and appends a description of each violated invariant if the
    // assignment does not correspond to a legal physical state.
    bool decodeState(const State& state, PhysicalState& out, std::vector<std::string>& violations) const;

    // All invariant violations of an assignment (empty if it is legal).
    std::vector<std::string> checkInvariants(const State& state) const;

    std::string toString(const PhysicalState& state) const;

private:
    int predicate(const FlatHashMap<int, int>& table, int level) const;
    int fluent(const USignature& sig) const;
    bool holds(const State& state, const USignature& sig) const;
    std::string name(const USignature& sig) const;
};

#endif
