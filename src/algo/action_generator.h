#ifndef DOCKPLAN_ACTION_GENERATOR_H
#define DOCKPLAN_ACTION_GENERATOR_H

#include <vector>

#include "algo/constraint_encoder.h"
#include "data/action.h"

/*
 * Grounds the move, pickup and putdown templates over all matching 
 * entity tuples. Capacity and LIFO legality is compiled into the 
 * instances: one pickup/putdown instance per admissible load transition
 * of the robot and per container the moved container rests on
 * (or is put onto), so that no instance requires arithmetic or
 * a scan of a stack at planning time.
 */
class ActionGenerator {

private:
    const ConstraintEncoder& _enc;
    const Registry& _registry;

public:
    explicit ActionGenerator(const ConstraintEncoder& encoder) : 
            _enc(encoder), _registry(encoder.getRegistry()) {}

    // All instances, moves first, each with a unique key.
    std::vector<Action> generate() const;

    void generateMoves(std::vector<Action>& out) const;
    void generatePickups(std::vector<Action>& out) const;
    void generatePutdowns(std::vector<Action>& out) const;

    Action createMove(int robot, int from, int to) const;
    Action createPickup(int robot, int container, int pile, int resting, const LoadTransition& t) const;
    Action createPutdown(int robot, int container, int pile, int resting, const LoadTransition& t) const;

private:
    void add(std::vector<Action>& out, Action&& action) const;
};

#endif
