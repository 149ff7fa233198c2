#ifndef DOCKPLAN_VOCABULARY_H
#define DOCKPLAN_VOCABULARY_H

#include <string>
#include <vector>

#include "data/signature.h"
#include "data/registry.h"
#include "util/hashmap.h"

// A complete truth assignment, indexed by fluent ID.
typedef std::vector<bool> State;

struct PredicateDef {
    std::string name;
    std::vector<EntityType> paramTypes;
    // Static predicates encode constants: their fluents never change.
    bool isStatic;
};

/*
 * The flat boolean state variable vocabulary of a problem:
 * a table of predicates and a dense table of ground fluents.
 * Fluent IDs are 0-based; as literals (see getLiteral) 
 * fluent i is represented by +(i+1) or -(i+1).
 */
class Vocabulary {

private:
    std::vector<PredicateDef> _predicates;
    FlatHashMap<std::string, int> _predicate_ids;

    std::vector<USignature> _fluents;
    FlatHashMap<USignature, int, USignatureHasher> _fluent_ids;
    std::vector<std::vector<int>> _fluents_by_predicate;

public:
    Vocabulary() = default;

    int addPredicate(const std::string& name, const std::vector<EntityType>& paramTypes, bool isStatic);
    int getPredicateId(const std::string& name) const;
    bool hasPredicate(const std::string& name) const;
    const PredicateDef& getPredicate(int predId) const;
    size_t getNumPredicates() const {return _predicates.size();}

    int addFluent(const USignature& sig);
    bool hasFluent(const USignature& sig) const;
    int getFluentId(const USignature& sig) const;
    const USignature& getFluent(int fluentId) const;
    const std::vector<int>& getFluentsOfPredicate(int predId) const;
    bool isStatic(int fluentId) const;
    size_t size() const {return _fluents.size();}

    int getLiteral(const Signature& sig) const;

    std::string toString(const USignature& sig, const Registry& registry) const;
    std::string toString(const Signature& sig, const Registry& registry) const;
};

#endif
