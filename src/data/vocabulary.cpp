
#include "data/vocabulary.h"
#include "util/errors.h"
#include "util/log.h"

int Vocabulary::addPredicate(const std::string& name, const std::vector<EntityType>& paramTypes, bool isStatic) {
    if (_predicate_ids.count(name)) 
        throw EncodingError("Predicate " + name + " declared twice");
    int id = _predicates.size();
    _predicates.push_back(PredicateDef{name, paramTypes, isStatic});
    _predicate_ids[name] = id;
    _fluents_by_predicate.emplace_back();
    return id;
}

int Vocabulary::getPredicateId(const std::string& name) const {
    auto it = _predicate_ids.find(name);
    return it == _predicate_ids.end() ? -1 : it->second;
}

bool Vocabulary::hasPredicate(const std::string& name) const {
    return _predicate_ids.count(name);
}

const PredicateDef& Vocabulary::getPredicate(int predId) const {
    assert(predId >= 0 && predId < (int)_predicates.size());
    return _predicates[predId];
}

int Vocabulary::addFluent(const USignature& sig) {
    auto it = _fluent_ids.find(sig);
    if (it != _fluent_ids.end()) return it->second;

    if (sig._name_id < 0 || sig._name_id >= (int)_predicates.size()) 
        throw EncodingError("Fluent refers to unknown predicate ID " + std::to_string(sig._name_id));
    const PredicateDef& pred = _predicates[sig._name_id];
    if (pred.paramTypes.size() != sig._args.size()) 
        throw EncodingError("Predicate " + pred.name + " expects " + std::to_string(pred.paramTypes.size()) 
            + " arguments, got " + std::to_string(sig._args.size()));

    int id = _fluents.size();
    _fluents.push_back(sig);
    _fluent_ids[sig] = id;
    _fluents_by_predicate[sig._name_id].push_back(id);
    return id;
}

bool Vocabulary::hasFluent(const USignature& sig) const {
    return _fluent_ids.count(sig);
}

int Vocabulary::getFluentId(const USignature& sig) const {
    auto it = _fluent_ids.find(sig);
    return it == _fluent_ids.end() ? -1 : it->second;
}

const USignature& Vocabulary::getFluent(int fluentId) const {
    assert(fluentId >= 0 && fluentId < (int)_fluents.size());
    return _fluents[fluentId];
}

const std::vector<int>& Vocabulary::getFluentsOfPredicate(int predId) const {
    assert(predId >= 0 && predId < (int)_fluents_by_predicate.size());
    return _fluents_by_predicate[predId];
}

bool Vocabulary::isStatic(int fluentId) const {
    return _predicates[getFluent(fluentId)._name_id].isStatic;
}

int Vocabulary::getLiteral(const Signature& sig) const {
    int id = getFluentId(sig._usig);
    if (id < 0) return 0;
    return sig._negated ? -(id+1) : id+1;
}

std::string Vocabulary::toString(const USignature& sig, const Registry& registry) const {
    std::string out = "(";
    if (sig._name_id >= 0 && sig._name_id < (int)_predicates.size()) out += _predicates[sig._name_id].name;
    else out += std::to_string(sig._name_id);
    for (int arg : sig._args) {
        out += " " + registry.toString(arg);
    }
    return out + ")";
}

std::string Vocabulary::toString(const Signature& sig, const Registry& registry) const {
    return (sig._negated ? "!" : "") + toString(sig._usig, registry);
}
