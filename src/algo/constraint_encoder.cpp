
#include <algorithm>
#include <set>

#include "algo/constraint_encoder.h"
#include "algo/arg_iterator.h"
#include "util/errors.h"
#include "util/log.h"

namespace {
    std::string joinNames(const std::vector<std::string>& names) {
        std::string out;
        for (size_t i = 0; i < names.size(); i++) {
            if (i > 0) out += ", ";
            out += names[i];
        }
        return out;
    }
}

std::vector<std::vector<int>> ConstraintEncoder::computeLoadLevels(int slotCapacity, int maxWeight,
        const std::vector<int>& weightClasses) {

    std::vector<std::vector<int>> levels;
    levels.push_back(std::vector<int>(1, 0));
    for (int numHeld = 1; numHeld <= slotCapacity; numHeld++) {
        std::set<int> reachable;
        for (int load : levels.back()) for (int w : weightClasses) {
            if (load + w <= maxWeight) reachable.insert(load + w);
        }
        levels.emplace_back(reachable.begin(), reachable.end());
    }
    return levels;
}

Vocabulary ConstraintEncoder::buildVocabulary(const Registry& registry) {

    Vocabulary vocab;
    const auto& weights = registry.getUsedWeightClasses();

    int maxSlots = 0;
    std::set<int> loadLevels;
    for (int robot : registry.getRobots()) {
        int k = registry.getSlotCapacity(robot);
        maxSlots = std::max(maxSlots, k);
        for (const auto& levels : computeLoadLevels(k, registry.getMaxWeight(robot), weights))
            loadLevels.insert(levels.begin(), levels.end());
    }

    // Static predicates
    int adjacent = vocab.addPredicate(Predicates::ADJACENT, {DOCK, DOCK}, true);
    for (const USignature& sig : ArgIterator::getFullInstantiation(adjacent, {DOCK, DOCK}, registry)) {
        if (sig._args[0] != sig._args[1]) vocab.addFluent(sig);
    }
    int pileAt = vocab.addPredicate(Predicates::PILE_AT, {PILE, DOCK}, true);
    for (const USignature& sig : ArgIterator::getFullInstantiation(pileAt, {PILE, DOCK}, registry))
        vocab.addFluent(sig);
    for (int w : Levels::WEIGHT_CLASSES) {
        int pred = vocab.addPredicate(Predicates::weight(w), {CONTAINER}, true);
        for (int c : registry.getContainers()) vocab.addFluent(USignature(pred, {c}));
    }
    for (int t : Levels::MAX_WEIGHTS) {
        int pred = vocab.addPredicate(Predicates::maxWeight(t), {ROBOT}, true);
        for (int r : registry.getRobots()) vocab.addFluent(USignature(pred, {r}));
    }
    for (int k : Levels::SLOT_CAPACITIES) {
        int pred = vocab.addPredicate(Predicates::slots(k), {ROBOT}, true);
        for (int r : registry.getRobots()) vocab.addFluent(USignature(pred, {r}));
    }

    // Robot location
    int robotAt = vocab.addPredicate(Predicates::ROBOT_AT, {ROBOT, DOCK}, false);
    for (const USignature& sig : ArgIterator::getFullInstantiation(robotAt, {ROBOT, DOCK}, registry))
        vocab.addFluent(sig);
    if (registry.hasExclusiveDocks()) {
        int occupied = vocab.addPredicate(Predicates::OCCUPIED, {DOCK}, false);
        for (int d : registry.getDocks()) vocab.addFluent(USignature(occupied, {d}));
    }

    // Pile state
    int inPile = vocab.addPredicate(Predicates::IN_PILE, {CONTAINER, PILE}, false);
    int on = vocab.addPredicate(Predicates::ON, {CONTAINER, CONTAINER}, false);
    int bottom = vocab.addPredicate(Predicates::BOTTOM, {CONTAINER, PILE}, false);
    int top = vocab.addPredicate(Predicates::TOP, {CONTAINER, PILE}, false);
    int empty = vocab.addPredicate(Predicates::EMPTY, {PILE}, false);
    int atDock = vocab.addPredicate(Predicates::AT_DOCK, {CONTAINER, DOCK}, false);
    for (int pred : {inPile, bottom, top}) {
        for (const USignature& sig : ArgIterator::getFullInstantiation(pred, {CONTAINER, PILE}, registry))
            vocab.addFluent(sig);
    }
    for (const USignature& sig : ArgIterator::getFullInstantiation(on, {CONTAINER, CONTAINER}, registry)) {
        if (sig._args[0] != sig._args[1]) vocab.addFluent(sig);
    }
    for (int p : registry.getPiles()) vocab.addFluent(USignature(empty, {p}));
    for (const USignature& sig : ArgIterator::getFullInstantiation(atDock, {CONTAINER, DOCK}, registry))
        vocab.addFluent(sig);

    // Robot slots and load
    int heldBy = vocab.addPredicate(Predicates::HELD_BY, {CONTAINER, ROBOT}, false);
    for (const USignature& sig : ArgIterator::getFullInstantiation(heldBy, {CONTAINER, ROBOT}, registry))
        vocab.addFluent(sig);
    for (int slot = 1; slot <= maxSlots; slot++) {
        int slotUsed = vocab.addPredicate(Predicates::slotUsed(slot), {ROBOT}, false);
        int inSlot = vocab.addPredicate(Predicates::inSlot(slot), {ROBOT, CONTAINER}, false);
        for (int r : registry.getRobots()) {
            if (registry.getSlotCapacity(r) < slot) continue;
            vocab.addFluent(USignature(slotUsed, {r}));
            for (int c : registry.getContainers()) vocab.addFluent(USignature(inSlot, {r, c}));
        }
    }
    FlatHashMap<int, int> loadPreds;
    for (int load : loadLevels) {
        loadPreds[load] = vocab.addPredicate(Predicates::load(load), {ROBOT}, false);
    }
    for (int r : registry.getRobots()) {
        for (const auto& levels : computeLoadLevels(registry.getSlotCapacity(r), registry.getMaxWeight(r), weights)) {
            for (int load : levels) vocab.addFluent(USignature(loadPreds[load], {r}));
        }
    }

    Log::v("Vocabulary: %zu predicates, %zu fluents\n", vocab.getNumPredicates(), vocab.size());
    return vocab;
}

ConstraintEncoder::ConstraintEncoder(const Registry& registry, const Vocabulary& vocab) :
        _registry(registry), _vocab(vocab) {

    auto lookup = [&](const std::string& name) {
        int id = _vocab.getPredicateId(name);
        assert(id >= 0 || Log::e("Predicate %s missing from vocabulary\n", name.c_str()));
        return id;
    };
    _pred_adjacent = lookup(Predicates::ADJACENT);
    _pred_pile_at = lookup(Predicates::PILE_AT);
    _pred_robot_at = lookup(Predicates::ROBOT_AT);
    _pred_occupied = _registry.hasExclusiveDocks() ? lookup(Predicates::OCCUPIED) : -1;
    _pred_in_pile = lookup(Predicates::IN_PILE);
    _pred_on = lookup(Predicates::ON);
    _pred_bottom = lookup(Predicates::BOTTOM);
    _pred_top = lookup(Predicates::TOP);
    _pred_empty = lookup(Predicates::EMPTY);
    _pred_at_dock = lookup(Predicates::AT_DOCK);
    _pred_held_by = lookup(Predicates::HELD_BY);
    for (int w : Levels::WEIGHT_CLASSES) {
        _pred_weight[w] = lookup(Predicates::weight(w));
        _level_of_pred[_pred_weight[w]] = w;
    }
    for (int t : Levels::MAX_WEIGHTS) {
        _pred_max_weight[t] = lookup(Predicates::maxWeight(t));
        _level_of_pred[_pred_max_weight[t]] = t;
    }
    for (int k : Levels::SLOT_CAPACITIES) {
        _pred_slots[k] = lookup(Predicates::slots(k));
        _level_of_pred[_pred_slots[k]] = k;
    }

    const auto& weights = _registry.getUsedWeightClasses();
    _pred_slot_used.push_back(-1);
    _pred_in_slot.push_back(-1);
    for (int r : _registry.getRobots()) {
        int k = _registry.getSlotCapacity(r);
        int threshold = _registry.getMaxWeight(r);
        while ((int)_pred_slot_used.size() <= k) {
            int slot = _pred_slot_used.size();
            _pred_slot_used.push_back(lookup(Predicates::slotUsed(slot)));
            _pred_in_slot.push_back(lookup(Predicates::inSlot(slot)));
        }

        auto& levels = _load_levels[r];
        levels = computeLoadLevels(k, threshold, weights);
        for (const auto& levelsOfCount : levels) for (int load : levelsOfCount) {
            if (!_pred_load.count(load)) {
                _pred_load[load] = lookup(Predicates::load(load));
                _level_of_pred[_pred_load[load]] = load;
            }
        }

        auto& pickups = _pickup_transitions[r];
        auto& putdowns = _putdown_transitions[r];
        for (int slot = 1; slot <= k; slot++) {
            for (int load : levels[slot-1]) for (int w : weights) {
                if (load + w <= threshold) pickups.push_back(LoadTransition{slot, load, w});
            }
            const auto& below = levels[slot-1];
            for (int load : levels[slot]) for (int w : weights) {
                if (std::binary_search(below.begin(), below.end(), load - w))
                    putdowns.push_back(LoadTransition{slot, load, w});
            }
        }
        Log::d("Robot %s: %zu pickup and %zu putdown load transitions\n", _registry.toString(r).c_str(),
                pickups.size(), putdowns.size());
    }
}

const std::vector<int>& ConstraintEncoder::getLoadLevels(int robot, int numHeld) const {
    static const std::vector<int> NONE;
    auto it = _load_levels.find(robot);
    if (it == _load_levels.end() || numHeld < 0 || numHeld >= (int)it->second.size()) return NONE;
    return it->second[numHeld];
}

std::vector<int> ConstraintEncoder::getAllLoadLevels(int robot) const {
    std::set<int> all;
    auto it = _load_levels.find(robot);
    if (it != _load_levels.end()) {
        for (const auto& levels : it->second) all.insert(levels.begin(), levels.end());
    }
    return std::vector<int>(all.begin(), all.end());
}

const std::vector<LoadTransition>& ConstraintEncoder::getPickupTransitions(int robot) const {
    static const std::vector<LoadTransition> NONE;
    auto it = _pickup_transitions.find(robot);
    return it == _pickup_transitions.end() ? NONE : it->second;
}

const std::vector<LoadTransition>& ConstraintEncoder::getPutdownTransitions(int robot) const {
    static const std::vector<LoadTransition> NONE;
    auto it = _putdown_transitions.find(robot);
    return it == _putdown_transitions.end() ? NONE : it->second;
}

bool ConstraintEncoder::staticValue(const USignature& sig) const {
    int pred = sig._name_id;
    if (pred == _pred_adjacent) return _registry.isAdjacent(sig._args[0], sig._args[1]);
    if (pred == _pred_pile_at) return _registry.getDockOfPile(sig._args[0]) == sig._args[1];

    auto it = _level_of_pred.find(pred);
    assert(it != _level_of_pred.end() || Log::e("%s is not a static fluent\n", name(sig).c_str()));
    if (it == _level_of_pred.end()) return false;
    int level = it->second;
    if (_pred_weight.count(level) && _pred_weight.at(level) == pred)
        return _registry.getWeight(sig._args[0]) == level;
    if (_pred_max_weight.count(level) && _pred_max_weight.at(level) == pred)
        return _registry.getMaxWeight(sig._args[0]) == level;
    if (_pred_slots.count(level) && _pred_slots.at(level) == pred)
        return _registry.getSlotCapacity(sig._args[0]) == level;

    assert(Log::e("%s is not a static fluent\n", name(sig).c_str()));
    return false;
}

PhysicalState ConstraintEncoder::resolvePlacement(const Placement& placement) const {
    PhysicalState out;
    for (const auto& [robotName, dockName] : placement.robotLocations) {
        int robot = _registry.nameIdOfType(robotName, ROBOT);
        int dock = _registry.nameIdOfType(dockName, DOCK);
        if (out.robotLocation.count(robot))
            throw ConfigurationError("Robot " + robotName + " is placed twice");
        out.robotLocation[robot] = dock;
    }
    for (const auto& [pileName, containerNames] : placement.piles) {
        int pile = _registry.nameIdOfType(pileName, PILE);
        if (out.pileStack.count(pile))
            throw ConfigurationError("Contents of pile " + pileName + " are given twice");
        auto& stack = out.pileStack[pile];
        for (const auto& c : containerNames) stack.push_back(_registry.nameIdOfType(c, CONTAINER));
    }
    for (const auto& [robotName, containerNames] : placement.cargo) {
        int robot = _registry.nameIdOfType(robotName, ROBOT);
        if (out.robotCargo.count(robot))
            throw ConfigurationError("Cargo of robot " + robotName + " is given twice");
        auto& cargo = out.robotCargo[robot];
        for (const auto& c : containerNames) cargo.push_back(_registry.nameIdOfType(c, CONTAINER));
    }
    checkPhysical(out);
    return out;
}

void ConstraintEncoder::checkPhysical(const PhysicalState& state) const {

    for (int r : _registry.getRobots()) {
        if (!state.robotLocation.count(r))
            throw ConfigurationError("Robot " + _registry.toString(r) + " has no location");
    }
    FlatHashMap<int, int> robotsAtDock;
    for (const auto& [robot, dock] : state.robotLocation) {
        if (!_registry.isOfType(robot, ROBOT))
            throw ConfigurationError("Entity " + std::to_string(robot) + " located at a dock is not a robot");
        if (!_registry.isOfType(dock, DOCK))
            throw ConfigurationError("Robot " + _registry.toString(robot) + " is located at a non-dock");
        if (++robotsAtDock[dock] > 1 && _registry.hasExclusiveDocks())
            throw ConfigurationError("Dock " + _registry.toString(dock) + " hosts more than one robot");
    }

    FlatHashMap<int, int> numPlacements;
    auto countContainer = [&](int c, const std::string& holder) {
        if (!_registry.isOfType(c, CONTAINER))
            throw ConfigurationError("Non-container entity " + std::to_string(c) + " placed in " + holder);
        numPlacements[c]++;
    };
    for (const auto& [pile, stack] : state.pileStack) {
        if (!_registry.isOfType(pile, PILE))
            throw ConfigurationError("Entity " + std::to_string(pile) + " holding a stack is not a pile");
        for (int c : stack) countContainer(c, "pile " + _registry.toString(pile));
    }
    for (const auto& [robot, cargo] : state.robotCargo) {
        if (!_registry.isOfType(robot, ROBOT))
            throw ConfigurationError("Entity " + std::to_string(robot) + " holding cargo is not a robot");
        const std::string& rName = _registry.toString(robot);
        if ((int)cargo.size() > _registry.getSlotCapacity(robot))
            throw ConfigurationError("Robot " + rName + " holds " + std::to_string(cargo.size())
                + " containers but has only " + std::to_string(_registry.getSlotCapacity(robot)) + " slots");
        int load = 0;
        for (int c : cargo) {
            countContainer(c, "robot " + rName);
            load += _registry.getWeight(c);
        }
        if (load > _registry.getMaxWeight(robot))
            throw ConfigurationError("Robot " + rName + " holds " + std::to_string(load)
                + " t, exceeding its threshold of " + std::to_string(_registry.getMaxWeight(robot)) + " t");
    }
    for (int c : _registry.getContainers()) {
        auto it = numPlacements.find(c);
        if (it == numPlacements.end())
            throw ConfigurationError("Container " + _registry.toString(c) + " is neither in a pile nor held by a robot");
        if (it->second > 1)
            throw ConfigurationError("Container " + _registry.toString(c) + " is placed "
                + std::to_string(it->second) + " times");
    }
}

State ConstraintEncoder::encodeState(const PhysicalState& state) const {

    checkPhysical(state);

    State out(_vocab.size(), false);
    for (size_t f = 0; f < _vocab.size(); f++) {
        if (_vocab.isStatic(f)) out[f] = staticValue(_vocab.getFluent(f));
    }
    auto set = [&](const USignature& sig) {out[fluent(sig)] = true;};

    for (const auto& [robot, dock] : state.robotLocation) {
        set(sigRobotAt(robot, dock));
        if (_registry.hasExclusiveDocks()) set(sigOccupied(dock));
    }
    for (int p : _registry.getPiles()) {
        const auto& stack = state.stackOf(p);
        int dock = _registry.getDockOfPile(p);
        if (stack.empty()) {
            set(sigEmpty(p));
            continue;
        }
        set(sigBottom(stack.front(), p));
        for (size_t i = 0; i < stack.size(); i++) {
            set(sigInPile(stack[i], p));
            set(sigAtDock(stack[i], dock));
            if (i > 0) set(sigOn(stack[i], stack[i-1]));
        }
        set(sigTop(stack.back(), p));
    }
    for (int r : _registry.getRobots()) {
        const auto& cargo = state.cargoOf(r);
        int load = 0;
        for (size_t i = 0; i < cargo.size(); i++) {
            set(sigSlotUsed(r, i+1));
            set(sigInSlot(r, i+1, cargo[i]));
            set(sigHeldBy(cargo[i], r));
            load += _registry.getWeight(cargo[i]);
        }
        set(sigLoad(r, load));
    }
    return out;
}

bool ConstraintEncoder::decodeState(const State& state, PhysicalState& out, std::vector<std::string>& violations) const {

    out = PhysicalState();
    size_t numViolationsBefore = violations.size();
    auto fail = [&](const std::string& msg) {violations.push_back(msg);};

    if (state.size() != _vocab.size()) {
        fail("Assignment has " + std::to_string(state.size()) + " values, but there are "
            + std::to_string(_vocab.size()) + " fluents");
        return false;
    }
    const auto& robots = _registry.getRobots();
    const auto& docks = _registry.getDocks();
    const auto& piles = _registry.getPiles();
    const auto& containers = _registry.getContainers();

    // Static attributes
    for (size_t f = 0; f < _vocab.size(); f++) {
        if (!_vocab.isStatic(f)) continue;
        const USignature& sig = _vocab.getFluent(f);
        if (state[f] != staticValue(sig))
            fail(name(sig) + " is " + (state[f] ? "true" : "false") + ", contradicting the registry");
    }
    auto checkOneLevel = [&](int entity, const FlatHashMap<int, int>& table, const std::vector<int>& levels,
            const std::string& what) {
        std::vector<std::string> trueFlags;
        for (int level : levels) {
            USignature sig(table.at(level), {entity});
            if (holds(state, sig)) trueFlags.push_back(name(sig));
        }
        if (trueFlags.size() != 1)
            fail(_registry.toString(entity) + " has " + std::to_string(trueFlags.size()) + " " + what
                + " flags set: " + joinNames(trueFlags));
    };
    for (int c : containers) checkOneLevel(c, _pred_weight, Levels::WEIGHT_CLASSES, "weight class");
    for (int r : robots) {
        checkOneLevel(r, _pred_max_weight, Levels::MAX_WEIGHTS, "weight threshold");
        checkOneLevel(r, _pred_slots, Levels::SLOT_CAPACITIES, "slot capacity");
    }

    // Robot locations and dock occupancy
    for (int r : robots) {
        std::vector<int> locations;
        for (int d : docks) if (holds(state, sigRobotAt(r, d))) locations.push_back(d);
        if (locations.size() == 1) out.robotLocation[r] = locations[0];
        else {
            std::vector<std::string> names;
            for (int d : locations) names.push_back(name(sigRobotAt(r, d)));
            fail("Robot " + _registry.toString(r) + " is at " + std::to_string(locations.size())
                + " docks: " + joinNames(names));
        }
    }
    if (_registry.hasExclusiveDocks()) {
        for (int d : docks) {
            int numRobots = 0;
            for (const auto& [r, dock] : out.robotLocation) if (dock == d) numRobots++;
            if (numRobots > 1)
                fail("Dock " + _registry.toString(d) + " hosts " + std::to_string(numRobots) + " robots");
            bool occupied = holds(state, sigOccupied(d));
            if (occupied != (numRobots > 0))
                fail(name(sigOccupied(d)) + " is " + (occupied ? "true" : "false") + " while "
                    + std::to_string(numRobots) + " robots are at the dock");
        }
    }

    // Each container is in exactly one pile or robot
    FlatHashMap<int, int> heldByRobot;
    for (int c : containers) {
        std::vector<std::string> places;
        for (int p : piles) if (holds(state, sigInPile(c, p))) places.push_back(name(sigInPile(c, p)));
        for (int r : robots) if (holds(state, sigHeldBy(c, r))) {
            places.push_back(name(sigHeldBy(c, r)));
            heldByRobot[c] = r;
        }
        if (places.empty())
            fail("Container " + _registry.toString(c) + " is neither in a pile nor held by a robot");
        else if (places.size() > 1)
            fail("Container " + _registry.toString(c) + " is in several places: " + joinNames(places));
    }
    for (int c : containers) for (int d : docks) {
        bool inPileAtDock = false;
        for (int p : _registry.getPilesAtDock(d)) inPileAtDock |= holds(state, sigInPile(c, p));
        if (holds(state, sigAtDock(c, d)) != inPileAtDock)
            fail(name(sigAtDock(c, d)) + " disagrees with the piles the container is in");
    }

    // Pile chains
    NodeHashMap<int, std::vector<int>> above;
    NodeHashMap<int, std::vector<int>> below;
    for (int upper : containers) for (int lower : containers) {
        if (upper != lower && holds(state, sigOn(upper, lower))) {
            above[lower].push_back(upper);
            below[upper].push_back(lower);
        }
    }
    for (int c : containers) {
        if (below[c].size() > 1)
            fail("Container " + _registry.toString(c) + " lies on " + std::to_string(below[c].size()) + " containers");
        if (heldByRobot.count(c) && (!below[c].empty() || !above[c].empty()))
            fail("Held container " + _registry.toString(c) + " is still stacked with other containers");
    }
    for (int p : piles) {
        const std::string& pName = _registry.toString(p);
        FlatHashSet<int> members;
        std::vector<int> tops, bottoms;
        for (int c : containers) {
            if (holds(state, sigInPile(c, p))) members.insert(c);
            if (holds(state, sigTop(c, p))) tops.push_back(c);
            if (holds(state, sigBottom(c, p))) bottoms.push_back(c);
        }
        bool isEmpty = holds(state, sigEmpty(p));
        if (members.empty()) {
            if (!isEmpty) fail("Pile " + pName + " holds no container but " + name(sigEmpty(p)) + " is false");
            if (!tops.empty()) fail("Pile " + pName + " holds no container but has a top");
            if (!bottoms.empty()) fail("Pile " + pName + " holds no container but has a bottom");
            continue;
        }
        if (isEmpty) fail("Pile " + pName + " holds " + std::to_string(members.size())
            + " containers but " + name(sigEmpty(p)) + " is true");
        if (tops.size() != 1 || bottoms.size() != 1) {
            std::vector<std::string> names;
            for (int c : tops) names.push_back(name(sigTop(c, p)));
            for (int c : bottoms) names.push_back(name(sigBottom(c, p)));
            fail("Pile " + pName + " has " + std::to_string(tops.size()) + " tops and "
                + std::to_string(bottoms.size()) + " bottoms: " + joinNames(names));
            continue;
        }
        int top = tops[0];
        int bottom = bottoms[0];
        if (!members.count(top) || !members.count(bottom)) {
            fail("Top or bottom of pile " + pName + " is not in the pile");
            continue;
        }
        if (!below[bottom].empty()) {
            fail("Bottom container " + _registry.toString(bottom) + " of pile " + pName + " lies on another container");
            continue;
        }
        if (!above[top].empty()) {
            fail("Top container " + _registry.toString(top) + " of pile " + pName + " has containers on it");
            continue;
        }
        std::vector<int> stack(1, bottom);
        FlatHashSet<int> visited;
        visited.insert(bottom);
        bool broken = false;
        while (stack.back() != top) {
            const auto& ups = above[stack.back()];
            if (ups.size() != 1 || !members.count(ups[0]) || visited.count(ups[0])) {
                fail("Pile " + pName + " is broken above container " + _registry.toString(stack.back()));
                broken = true;
                break;
            }
            stack.push_back(ups[0]);
            visited.insert(ups[0]);
        }
        if (broken) continue;
        if (stack.size() != members.size()) {
            fail("Pile " + pName + " contains " + std::to_string(members.size()) + " containers but only "
                + std::to_string(stack.size()) + " are chained from bottom to top");
            continue;
        }
        out.pileStack[p] = stack;
    }

    // Robot slots and load
    FlatHashMap<int, int> numSlots;
    for (int r : robots) {
        const std::string& rName = _registry.toString(r);
        int capacity = _registry.getSlotCapacity(r);
        std::vector<int> cargo;
        bool gap = false;
        int load = 0;
        FlatHashSet<int> slotted;
        for (int slot = 1; slot <= capacity; slot++) {
            bool used = holds(state, sigSlotUsed(r, slot));
            std::vector<int> occupants;
            for (int c : containers) if (holds(state, sigInSlot(r, slot, c))) occupants.push_back(c);
            if (occupants.size() > 1)
                fail("Slot " + std::to_string(slot) + " of robot " + rName + " holds "
                    + std::to_string(occupants.size()) + " containers");
            if (used != !occupants.empty())
                fail(name(sigSlotUsed(r, slot)) + " is " + (used ? "true" : "false") + " while the slot holds "
                    + std::to_string(occupants.size()) + " containers");
            if (used && gap)
                fail("Slot " + std::to_string(slot) + " of robot " + rName + " is used above an empty slot");
            if (!used) gap = true;
            for (int c : occupants) {
                if (++numSlots[c] > 1)
                    fail("Container " + _registry.toString(c) + " occupies more than one slot");
                if (!holds(state, sigHeldBy(c, r)))
                    fail(name(sigInSlot(r, slot, c)) + " is true but " + name(sigHeldBy(c, r)) + " is false");
                slotted.insert(c);
                load += _registry.getWeight(c);
            }
            if (used && !gap && occupants.size() == 1) cargo.push_back(occupants[0]);
        }
        for (int c : containers) {
            if (holds(state, sigHeldBy(c, r)) && !slotted.count(c))
                fail(name(sigHeldBy(c, r)) + " is true but the container is in no slot of the robot");
        }

        std::vector<int> loads;
        for (int level : getAllLoadLevels(r)) if (holds(state, sigLoad(r, level))) loads.push_back(level);
        if (loads.size() != 1)
            fail("Robot " + rName + " has " + std::to_string(loads.size()) + " load levels set");
        else if (loads[0] != load)
            fail(name(sigLoad(r, loads[0])) + " is true but the robot holds " + std::to_string(load) + " t");
        if (load > _registry.getMaxWeight(r))
            fail("Robot " + rName + " holds " + std::to_string(load) + " t, exceeding its threshold of "
                + std::to_string(_registry.getMaxWeight(r)) + " t");
        if (!cargo.empty()) out.robotCargo[r] = cargo;
    }

    return violations.size() == numViolationsBefore;
}

std::vector<std::string> ConstraintEncoder::checkInvariants(const State& state) const {
    PhysicalState decoded;
    std::vector<std::string> violations;
    decodeState(state, decoded, violations);
    return violations;
}

std::string ConstraintEncoder::toString(const PhysicalState& state) const {
    std::string out;
    for (int r : _registry.getRobots()) {
        auto it = state.robotLocation.find(r);
        out += _registry.toString(r) + "@" + (it == state.robotLocation.end() ? "?" : _registry.toString(it->second));
        out += "[";
        const auto& cargo = state.cargoOf(r);
        for (size_t i = 0; i < cargo.size(); i++) out += (i > 0 ? " " : "") + _registry.toString(cargo[i]);
        out += "] ";
    }
    for (int p : _registry.getPiles()) {
        out += _registry.toString(p) + ":(";
        const auto& stack = state.stackOf(p);
        for (size_t i = 0; i < stack.size(); i++) out += (i > 0 ? " " : "") + _registry.toString(stack[i]);
        out += ") ";
    }
    if (!out.empty()) out.pop_back();
    return out;
}

int ConstraintEncoder::predicate(const FlatHashMap<int, int>& table, int level) const {
    auto it = table.find(level);
    assert(it != table.end() || Log::e("No predicate for level %i\n", level));
    return it == table.end() ? -1 : it->second;
}

int ConstraintEncoder::fluent(const USignature& sig) const {
    int id = _vocab.getFluentId(sig);
    assert(id >= 0 || Log::e("Unknown fluent %s\n", name(sig).c_str()));
    return id;
}

bool ConstraintEncoder::holds(const State& state, const USignature& sig) const {
    int id = _vocab.getFluentId(sig);
    return id >= 0 && state[id];
}

std::string ConstraintEncoder::name(const USignature& sig) const {
    return _vocab.toString(sig, _registry);
}
