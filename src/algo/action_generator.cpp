
#include "algo/action_generator.h"
#include "util/errors.h"
#include "util/log.h"

std::vector<Action> ActionGenerator::generate() const {
    std::vector<Action> actions;
    generateMoves(actions);
    size_t numMoves = actions.size();
    generatePickups(actions);
    size_t numPickups = actions.size() - numMoves;
    generatePutdowns(actions);
    size_t numPutdowns = actions.size() - numMoves - numPickups;

    // Keys serve as action names in serialized problems
    FlatHashSet<std::string> keys;
    for (Action& a : actions) {
        std::string key = a.buildKey(_registry);
        if (keys.count(key)) {
            // Distinct entity names may coincide after sanitizing
            int suffix = 2;
            while (keys.count(key + "_" + std::to_string(suffix))) suffix++;
            key += "_" + std::to_string(suffix);
        }
        keys.insert(key);
        a.setKey(key);
    }

    Log::i("Generated %zu actions (%zu moves, %zu pickups, %zu putdowns)\n", 
            actions.size(), numMoves, numPickups, numPutdowns);
    return actions;
}

void ActionGenerator::generateMoves(std::vector<Action>& out) const {
    for (int r : _registry.getRobots()) {
        for (int from : _registry.getDocks()) {
            for (int to : _registry.getSuccessors(from)) {
                if (from == to) continue;
                add(out, createMove(r, from, to));
            }
        }
    }
}

void ActionGenerator::generatePickups(std::vector<Action>& out) const {
    for (int r : _registry.getRobots()) {
        for (const LoadTransition& t : _enc.getPickupTransitions(r)) {
            for (int p : _registry.getPiles()) {
                for (int c : _registry.getContainers()) {
                    if (_registry.getWeight(c) != t.weight) continue;
                    // c lies at the pile bottom or on some other container
                    add(out, createPickup(r, c, p, 0, t));
                    for (int resting : _registry.getContainers()) {
                        if (resting != c) add(out, createPickup(r, c, p, resting, t));
                    }
                }
            }
        }
    }
}

void ActionGenerator::generatePutdowns(std::vector<Action>& out) const {
    for (int r : _registry.getRobots()) {
        for (const LoadTransition& t : _enc.getPutdownTransitions(r)) {
            for (int p : _registry.getPiles()) {
                for (int c : _registry.getContainers()) {
                    if (_registry.getWeight(c) != t.weight) continue;
                    // onto an empty pile or onto its current top
                    add(out, createPutdown(r, c, p, 0, t));
                    for (int resting : _registry.getContainers()) {
                        if (resting != c) add(out, createPutdown(r, c, p, resting, t));
                    }
                }
            }
        }
    }
}

Action ActionGenerator::createMove(int robot, int from, int to) const {
    Action a(MOVE, {robot, from, to});
    a.addPrecondition(Signature(_enc.sigRobotAt(robot, from), false));
    a.addPrecondition(Signature(_enc.sigAdjacent(from, to), false));
    a.addEffect(Signature(_enc.sigRobotAt(robot, from), true));
    a.addEffect(Signature(_enc.sigRobotAt(robot, to), false));
    if (_registry.hasExclusiveDocks()) {
        a.addPrecondition(Signature(_enc.sigOccupied(to), true));
        a.addEffect(Signature(_enc.sigOccupied(from), true));
        a.addEffect(Signature(_enc.sigOccupied(to), false));
    }
    return a;
}

Action ActionGenerator::createPickup(int robot, int container, int pile, int resting, const LoadTransition& t) const {
    int dock = _registry.getDockOfPile(pile);
    int slot = t.slot;
    Action a(PICKUP, {robot, container, pile, dock}, ActionVariant{resting, slot, t.load});

    a.addPrecondition(Signature(_enc.sigPileAt(pile, dock), false));
    a.addPrecondition(Signature(_enc.sigRobotAt(robot, dock), false));
    a.addPrecondition(Signature(_enc.sigTop(container, pile), false));
    a.addPrecondition(Signature(_enc.sigInPile(container, pile), false));
    a.addPrecondition(Signature(_enc.sigSlotUsed(robot, slot), true));
    if (slot > 1) a.addPrecondition(Signature(_enc.sigSlotUsed(robot, slot-1), false));
    a.addPrecondition(Signature(_enc.sigWeight(container, t.weight), false));
    a.addPrecondition(Signature(_enc.sigLoad(robot, t.load), false));

    // The container leaves the pile
    a.addEffect(Signature(_enc.sigTop(container, pile), true));
    a.addEffect(Signature(_enc.sigInPile(container, pile), true));
    a.addEffect(Signature(_enc.sigAtDock(container, dock), true));
    if (resting > 0) {
        a.addPrecondition(Signature(_enc.sigOn(container, resting), false));
        a.addEffect(Signature(_enc.sigOn(container, resting), true));
        a.addEffect(Signature(_enc.sigTop(resting, pile), false));
    } else {
        a.addPrecondition(Signature(_enc.sigBottom(container, pile), false));
        a.addEffect(Signature(_enc.sigBottom(container, pile), true));
        a.addEffect(Signature(_enc.sigEmpty(pile), false));
    }

    // ... and enters the next free slot
    a.addEffect(Signature(_enc.sigSlotUsed(robot, slot), false));
    a.addEffect(Signature(_enc.sigInSlot(robot, slot, container), false));
    a.addEffect(Signature(_enc.sigHeldBy(container, robot), false));
    a.addEffect(Signature(_enc.sigLoad(robot, t.load), true));
    a.addEffect(Signature(_enc.sigLoad(robot, t.load + t.weight), false));
    return a;
}

Action ActionGenerator::createPutdown(int robot, int container, int pile, int resting, const LoadTransition& t) const {
    int dock = _registry.getDockOfPile(pile);
    int slot = t.slot;
    Action a(PUTDOWN, {robot, container, pile, dock}, ActionVariant{resting, slot, t.load});

    a.addPrecondition(Signature(_enc.sigPileAt(pile, dock), false));
    a.addPrecondition(Signature(_enc.sigRobotAt(robot, dock), false));
    a.addPrecondition(Signature(_enc.sigInSlot(robot, slot, container), false));
    a.addPrecondition(Signature(_enc.sigSlotUsed(robot, slot), false));
    if (slot < _registry.getSlotCapacity(robot)) 
        a.addPrecondition(Signature(_enc.sigSlotUsed(robot, slot+1), true));
    a.addPrecondition(Signature(_enc.sigWeight(container, t.weight), false));
    a.addPrecondition(Signature(_enc.sigLoad(robot, t.load), false));

    // The container leaves the highest used slot
    a.addEffect(Signature(_enc.sigSlotUsed(robot, slot), true));
    a.addEffect(Signature(_enc.sigInSlot(robot, slot, container), true));
    a.addEffect(Signature(_enc.sigHeldBy(container, robot), true));
    a.addEffect(Signature(_enc.sigLoad(robot, t.load), true));
    a.addEffect(Signature(_enc.sigLoad(robot, t.load - t.weight), false));

    // ... and becomes the new pile top
    a.addEffect(Signature(_enc.sigTop(container, pile), false));
    a.addEffect(Signature(_enc.sigInPile(container, pile), false));
    a.addEffect(Signature(_enc.sigAtDock(container, dock), false));
    if (resting > 0) {
        a.addPrecondition(Signature(_enc.sigTop(resting, pile), false));
        a.addEffect(Signature(_enc.sigTop(resting, pile), true));
        a.addEffect(Signature(_enc.sigOn(container, resting), false));
    } else {
        a.addPrecondition(Signature(_enc.sigEmpty(pile), false));
        a.addEffect(Signature(_enc.sigEmpty(pile), true));
        a.addEffect(Signature(_enc.sigBottom(container, pile), false));
    }
    return a;
}

void ActionGenerator::add(std::vector<Action>& out, Action&& action) const {
    // Every referenced fluent must be part of the vocabulary
    for (const SigSet* set : {&action.getPreconditions(), &action.getEffects()}) {
        for (const Signature& sig : *set) {
            if (!_enc.getVocabulary().hasFluent(sig._usig))
                throw EncodingError("Action " + action.buildKey(_registry) + " refers to unknown fluent "
                    + _enc.getVocabulary().toString(sig._usig, _registry));
        }
    }
    if (action.hasInconsistentEffects()) {
        Log::w("Skipping %s: inconsistent effects\n", action.buildKey(_registry).c_str());
        return;
    }
    out.push_back(std::move(action));
}
