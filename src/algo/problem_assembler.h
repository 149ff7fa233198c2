#ifndef DOCKPLAN_PROBLEM_ASSEMBLER_H
#define DOCKPLAN_PROBLEM_ASSEMBLER_H

#include <string>
#include <vector>

#include "data/problem.h"
#include "data/placement.h"
#include "algo/constraint_encoder.h"

/*
 * Binds a topology, an initial state and a goal conjunction into a Problem.
 * The initial state is given either physically (Placement, PhysicalState)
 * or as an explicit assignment of fluent values; in both cases it is 
 * checked against all physical invariants before a Problem is returned.
 * An assembler can produce any number of problems.
 */
class ProblemAssembler {

private:
    std::string _name;
    Registry _registry;
    Vocabulary _vocab;
    ConstraintEncoder _encoder;
    std::vector<Action> _actions;

    enum InitialStateKind {NONE, PHYSICAL, ASSIGNMENT} _init_kind = NONE;
    PhysicalState _initial_physical;
    InitialAssignment _initial_assignment;

    std::vector<Signature> _goal;

public:
    explicit ProblemAssembler(const TopologyDescription& topology, const std::string& name = "dockplan");
    ProblemAssembler(const ProblemAssembler& other) = delete;

    const Registry& getRegistry() const {return _registry;}
    const Vocabulary& getVocabulary() const {return _vocab;}
    const ConstraintEncoder& getEncoder() const {return _encoder;}
    const std::vector<Action>& getActions() const {return _actions;}

    void setInitialPlacement(const Placement& placement);
    void setInitialState(const PhysicalState& state);
    void setInitialAssignment(const InitialAssignment& assignment);

    void addGoal(const Signature& literal);
    void clearGoal() {_goal.clear();}
    const std::vector<Signature>& getGoal() const {return _goal;}

    // Goal literal helpers, all by entity names
    Signature robotAt(const std::string& robot, const std::string& dock) const;
    Signature containerInPile(const std::string& container, const std::string& pile) const;
    Signature containerAtDock(const std::string& container, const std::string& dock) const;
    Signature containerOn(const std::string& upper, const std::string& lower) const;
    Signature containerOnTop(const std::string& container, const std::string& pile) const;
    Signature containerHeldBy(const std::string& container, const std::string& robot) const;
    Signature pileEmpty(const std::string& pile) const;
    Signature literal(const std::string& predicate, const std::vector<std::string>& args, bool positive = true) const;

    // Builds the complete initial state and checks it. Throws a
    // ConfigurationError on any violation; the same input always
    // yields the same outcome.
    State computeInitialState(std::vector<ValueSource>& sources) const;
    void validate() const;

    Problem assemble() const;

private:
    void validateGoal() const;
};

#endif
