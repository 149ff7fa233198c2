
#include <cctype>

#include "data/problem.h"
#include "util/log.h"

Problem::Problem(const std::string& name, const Registry& registry, const Vocabulary& vocab, 
            const std::vector<Action>& actions, const State& initialState, 
            const std::vector<ValueSource>& valueSources, const std::vector<Signature>& goal) :
        _name(name), _registry(new Registry(registry)), _vocab(new Vocabulary(vocab)),
        _encoder(new ConstraintEncoder(*_registry, *_vocab)), _actions(actions), 
        _initial_state(initialState), _value_sources(valueSources), _goal(goal) {

    assert(_initial_state.size() == _vocab->size());
    assert(_value_sources.size() == _vocab->size());
    for (size_t i = 0; i < _actions.size(); i++) {
        _action_by_key[_actions[i].getKey()] = i;
        _actions_by_name[Action::normalizeName(_actions[i].getDisplayName(*_registry))].push_back(i);
    }
}

const Action& Problem::getAction(int index) const {
    assert((index >= 0 && index < (int)_actions.size()) || Log::e("No action with index %i\n", index));
    return _actions[index];
}

size_t Problem::getNumValuesFrom(ValueSource source) const {
    size_t num = 0;
    for (ValueSource s : _value_sources) if (s == source) num++;
    return num;
}

int Problem::findAction(const std::string& key) const {
    // Keys are lowercase; planners and hand-written plans may not be
    std::string lowered = key;
    for (char& c : lowered) c = std::tolower((unsigned char)c);
    auto it = _action_by_key.find(lowered);
    return it == _action_by_key.end() ? -1 : it->second;
}

const std::vector<int>& Problem::findActionsByName(const std::string& name) const {
    static const std::vector<int> NONE;
    auto it = _actions_by_name.find(Action::normalizeName(name));
    return it == _actions_by_name.end() ? NONE : it->second;
}

bool Problem::holds(const State& state, const Signature& literal) const {
    int id = _vocab->getFluentId(literal._usig);
    assert(id >= 0 || Log::e("Unknown fluent %s\n", toString(literal).c_str()));
    return state[id] != literal._negated;
}

bool Problem::isApplicable(const State& state, int actionIndex) const {
    for (const Signature& pre : getAction(actionIndex).getPreconditions()) {
        if (!holds(state, pre)) return false;
    }
    return true;
}

State Problem::apply(const State& state, int actionIndex) const {
    State next = state;
    const SigSet& effects = getAction(actionIndex).getEffects();
    // Delete effects first, then add effects
    for (const Signature& eff : effects) {
        if (eff._negated) next[_vocab->getFluentId(eff._usig)] = false;
    }
    for (const Signature& eff : effects) {
        if (!eff._negated) next[_vocab->getFluentId(eff._usig)] = true;
    }
    return next;
}

bool Problem::satisfiesGoal(const State& state) const {
    for (const Signature& lit : _goal) {
        if (!holds(state, lit)) return false;
    }
    return true;
}

std::vector<Signature> Problem::getUnsatisfiedGoals(const State& state) const {
    std::vector<Signature> open;
    for (const Signature& lit : _goal) {
        if (!holds(state, lit)) open.push_back(lit);
    }
    return open;
}

std::string Problem::toString(const Signature& literal) const {
    return _vocab->toString(literal, *_registry);
}

std::string Problem::toString(const Plan& plan) const {
    std::string out;
    for (size_t step = 0; step < plan.size(); step++) {
        out += std::to_string(step) + ": " + getAction(plan[step]).getDisplayName(*_registry) + "\n";
    }
    return out;
}

void Problem::printStatistics() const {
    Log::i("Problem \"%s\":\n", _name.c_str());
    Log::i("  %zu robots, %zu docks, %zu piles, %zu containers%s\n", 
            _registry->getRobots().size(), _registry->getDocks().size(), 
            _registry->getPiles().size(), _registry->getContainers().size(),
            _registry->hasExclusiveDocks() ? " (exclusive docks)" : "");
    Log::i("  %zu predicates, %zu fluents (%zu explicit, %zu static, %zu defaulted to false)\n",
            _vocab->getNumPredicates(), _vocab->size(), getNumValuesFrom(EXPLICIT), 
            getNumValuesFrom(STATIC), getNumValuesFrom(DEFAULT_FALSE));
    Log::i("  %zu actions, %zu goal literals\n", _actions.size(), _goal.size());
    for (const Signature& lit : _goal) Log::v("  goal %s\n", toString(lit).c_str());
}
