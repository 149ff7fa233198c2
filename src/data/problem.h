#ifndef DOCKPLAN_PROBLEM_H
#define DOCKPLAN_PROBLEM_H

#include <memory>
#include <string>
#include <vector>

#include "data/registry.h"
#include "data/vocabulary.h"
#include "data/action.h"
#include "data/plan.h"
#include "algo/constraint_encoder.h"

// Where the initial value of a fluent comes from.
enum ValueSource {EXPLICIT = 0, STATIC = 1, DEFAULT_FALSE = 2};

// One fluent value of a hand-written initial assignment, given by names.
struct FluentValue {
    std::string predicate;
    std::vector<std::string> args;
    bool value = true;
};
typedef std::vector<FluentValue> InitialAssignment;

/*
 * A complete, validated problem instance: registry, vocabulary, 
 * action instances, initial state (with the source of each value) 
 * and goal conjunction. Immutable and self-contained; movable, 
 * but not copyable.
 */
class Problem {

private:
    std::string _name;
    std::unique_ptr<Registry> _registry;
    std::unique_ptr<Vocabulary> _vocab;
    std::unique_ptr<ConstraintEncoder> _encoder;

    std::vector<Action> _actions;
    FlatHashMap<std::string, int> _action_by_key;
    NodeHashMap<std::string, std::vector<int>> _actions_by_name;

    State _initial_state;
    std::vector<ValueSource> _value_sources;
    std::vector<Signature> _goal;

public:
    Problem(const std::string& name, const Registry& registry, const Vocabulary& vocab, 
            const std::vector<Action>& actions, const State& initialState, 
            const std::vector<ValueSource>& valueSources, const std::vector<Signature>& goal);
    Problem(Problem&& other) = default;
    Problem(const Problem& other) = delete;

    const std::string& getName() const {return _name;}
    const Registry& getRegistry() const {return *_registry;}
    const Vocabulary& getVocabulary() const {return *_vocab;}
    const ConstraintEncoder& getEncoder() const {return *_encoder;}
    const std::vector<Action>& getActions() const {return _actions;}
    const Action& getAction(int index) const;
    size_t getNumActions() const {return _actions.size();}
    const State& getInitialState() const {return _initial_state;}
    const std::vector<ValueSource>& getValueSources() const {return _value_sources;}
    size_t getNumValuesFrom(ValueSource source) const;
    const std::vector<Signature>& getGoal() const {return _goal;}

    // Index of the action with the given key (case-insensitive), or -1
    int findAction(const std::string& key) const;
    // Indices of all variants with the given display name (see Action::normalizeName)
    const std::vector<int>& findActionsByName(const std::string& name) const;

    bool holds(const State& state, const Signature& literal) const;
    bool isApplicable(const State& state, int actionIndex) const;
    State apply(const State& state, int actionIndex) const;
    bool satisfiesGoal(const State& state) const;
    std::vector<Signature> getUnsatisfiedGoals(const State& state) const;

    std::string toString(const Signature& literal) const;
    std::string toString(const Plan& plan) const;
    void printStatistics() const;

    Problem& operator=(Problem&& other) = default;
};

#endif
