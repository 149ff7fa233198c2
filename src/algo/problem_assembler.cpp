
#include "algo/problem_assembler.h"
#include "algo/action_generator.h"
#include "util/errors.h"
#include "util/log.h"

ProblemAssembler::ProblemAssembler(const TopologyDescription& topology, const std::string& name) : 
        _name(name), _registry(topology), _vocab(ConstraintEncoder::buildVocabulary(_registry)), 
        _encoder(_registry, _vocab) {

    _actions = ActionGenerator(_encoder).generate();
}

void ProblemAssembler::setInitialPlacement(const Placement& placement) {
    setInitialState(_encoder.resolvePlacement(placement));
}

void ProblemAssembler::setInitialState(const PhysicalState& state) {
    _initial_physical = state;
    _initial_assignment.clear();
    _init_kind = PHYSICAL;
}

void ProblemAssembler::setInitialAssignment(const InitialAssignment& assignment) {
    _initial_assignment = assignment;
    _initial_physical = PhysicalState();
    _init_kind = ASSIGNMENT;
}

void ProblemAssembler::addGoal(const Signature& literal) {
    _goal.push_back(literal);
}

Signature ProblemAssembler::robotAt(const std::string& robot, const std::string& dock) const {
    return Signature(_encoder.sigRobotAt(_registry.nameIdOfType(robot, ROBOT), _registry.nameIdOfType(dock, DOCK)), false);
}
Signature ProblemAssembler::containerInPile(const std::string& container, const std::string& pile) const {
    return Signature(_encoder.sigInPile(_registry.nameIdOfType(container, CONTAINER), 
            _registry.nameIdOfType(pile, PILE)), false);
}
Signature ProblemAssembler::containerAtDock(const std::string& container, const std::string& dock) const {
    return Signature(_encoder.sigAtDock(_registry.nameIdOfType(container, CONTAINER), 
            _registry.nameIdOfType(dock, DOCK)), false);
}
Signature ProblemAssembler::containerOn(const std::string& upper, const std::string& lower) const {
    return Signature(_encoder.sigOn(_registry.nameIdOfType(upper, CONTAINER), 
            _registry.nameIdOfType(lower, CONTAINER)), false);
}
Signature ProblemAssembler::containerOnTop(const std::string& container, const std::string& pile) const {
    return Signature(_encoder.sigTop(_registry.nameIdOfType(container, CONTAINER), 
            _registry.nameIdOfType(pile, PILE)), false);
}
Signature ProblemAssembler::containerHeldBy(const std::string& container, const std::string& robot) const {
    return Signature(_encoder.sigHeldBy(_registry.nameIdOfType(container, CONTAINER), 
            _registry.nameIdOfType(robot, ROBOT)), false);
}
Signature ProblemAssembler::pileEmpty(const std::string& pile) const {
    return Signature(_encoder.sigEmpty(_registry.nameIdOfType(pile, PILE)), false);
}

Signature ProblemAssembler::literal(const std::string& predicate, const std::vector<std::string>& args, bool positive) const {
    int predId = _vocab.getPredicateId(predicate);
    if (predId < 0) throw ConfigurationError("Unknown predicate \"" + predicate + "\"");
    const PredicateDef& pred = _vocab.getPredicate(predId);
    if (pred.paramTypes.size() != args.size())
        throw ConfigurationError("Predicate " + predicate + " expects " + std::to_string(pred.paramTypes.size()) 
            + " arguments, got " + std::to_string(args.size()));
    std::vector<int> argIds;
    for (size_t i = 0; i < args.size(); i++) {
        argIds.push_back(_registry.nameIdOfType(args[i], pred.paramTypes[i]));
    }
    return Signature(predId, std::move(argIds), !positive);
}

State ProblemAssembler::computeInitialState(std::vector<ValueSource>& sources) const {

    State state;
    sources.assign(_vocab.size(), DEFAULT_FALSE);

    if (_init_kind == NONE) {
        throw ConfigurationError("No initial state given for problem " + _name);

    } else if (_init_kind == PHYSICAL) {
        state = _encoder.encodeState(_initial_physical);
        for (size_t f = 0; f < _vocab.size(); f++) {
            sources[f] = _vocab.isStatic(f) ? STATIC : EXPLICIT;
        }

    } else {
        state.assign(_vocab.size(), false);
        for (size_t f = 0; f < _vocab.size(); f++) {
            if (!_vocab.isStatic(f)) continue;
            state[f] = _encoder.staticValue(_vocab.getFluent(f));
            sources[f] = STATIC;
        }
        for (const FluentValue& fv : _initial_assignment) {
            Signature lit = literal(fv.predicate, fv.args, fv.value);
            int f = _vocab.getFluentId(lit._usig);
            const std::string litName = _vocab.toString(lit, _registry);
            if (f < 0) throw ConfigurationError("Initial assignment refers to unknown fluent " + litName);
            if (_vocab.isStatic(f)) {
                if (state[f] != fv.value)
                    throw ConfigurationError("Initial assignment " + litName + " contradicts the registry");
                continue;
            }
            if (sources[f] == EXPLICIT && state[f] != fv.value)
                throw ConfigurationError("Fluent " + _vocab.toString(lit._usig, _registry) + " is assigned both values");
            state[f] = fv.value;
            sources[f] = EXPLICIT;
        }
        size_t numDefaulted = 0;
        for (ValueSource s : sources) if (s == DEFAULT_FALSE) numDefaulted++;
        Log::v("%zu of %zu fluents not given explicitly: defaulted to false\n", numDefaulted, _vocab.size());
    }

    std::vector<std::string> violations = _encoder.checkInvariants(state);
    if (!violations.empty()) {
        std::string msg = "Initial state of problem " + _name + " violates the physical model: ";
        for (size_t i = 0; i < violations.size(); i++) {
            if (i > 0) msg += "; ";
            msg += violations[i];
        }
        throw ConfigurationError(msg);
    }
    return state;
}

void ProblemAssembler::validate() const {
    std::vector<ValueSource> sources;
    computeInitialState(sources);
    validateGoal();
}

void ProblemAssembler::validateGoal() const {
    if (_goal.empty()) Log::w("Problem %s has an empty goal\n", _name.c_str());
    for (const Signature& lit : _goal) {
        int f = _vocab.getFluentId(lit._usig);
        if (f < 0) 
            throw ConfigurationError("Goal refers to unknown fluent " + _vocab.toString(lit._usig, _registry));
        if (_vocab.isStatic(f) && _encoder.staticValue(lit._usig) == lit._negated)
            throw ConfigurationError("Goal literal " + _vocab.toString(lit, _registry) + " can never hold");
        for (const Signature& other : _goal) {
            if (other == lit.opposite()) 
                throw ConfigurationError("Goal contains both " + _vocab.toString(lit, _registry) + " and its negation");
        }
    }
}

Problem ProblemAssembler::assemble() const {
    std::vector<ValueSource> sources;
    State init = computeInitialState(sources);
    validateGoal();
    Problem problem(_name, _registry, _vocab, _actions, init, sources, _goal);
    Log::i("Assembled problem %s\n", _name.c_str());
    return problem;
}
