#ifndef DOCKPLAN_ACTION_H
#define DOCKPLAN_ACTION_H

#include <string>
#include <vector>

#include "data/signature.h"
#include "data/registry.h"

enum ActionType {MOVE = 0, PICKUP = 1, PUTDOWN = 2};

// Distinguishes the instances of one action binding. 
// resting: for a pickup, the container below the picked container; 
// for a putdown, the container which is the pile top before the putdown. 
// 0 means the pile bottom or an empty pile, respectively.
struct ActionVariant {
    int resting = 0;
    int slot = 0;
    int load = 0;
};

/*
 * A ground action instance: a template (move, pickup, putdown) bound to 
 * entities (r, a, b) or (r, c, p, d), plus its variant, with a STRIPS-style
 * precondition and effect set over vocabulary fluents.
 */
class Action {

private:
    ActionType _type;
    std::vector<int> _args;
    ActionVariant _variant;
    std::string _key;

    SigSet _preconditions;
    SigSet _effects;

public:
    Action(ActionType type, const std::vector<int>& args, const ActionVariant& variant = ActionVariant());
    Action(const Action& a) = default;
    Action(Action&& a) = default;

    void addPrecondition(const Signature& sig);
    void addPrecondition(Signature&& sig);
    void addEffect(const Signature& sig);
    void addEffect(Signature&& sig);
    bool hasInconsistentEffects() const;

    void setKey(const std::string& key) {_key = key;}

    ActionType getType() const {return _type;}
    const std::vector<int>& getArguments() const {return _args;}
    const ActionVariant& getVariant() const {return _variant;}
    const std::string& getKey() const {return _key;}
    const SigSet& getPreconditions() const {return _preconditions;}
    const SigSet& getEffects() const {return _effects;}

    // Unique identifier of the instance: lowercase letters, digits and '_' only
    std::string buildKey(const Registry& registry) const;
    // e.g. "(pickup r1 c1 p1 d1)"; shared by all variants of a binding
    std::string getDisplayName(const Registry& registry) const;

    Action& operator=(const Action& a) = default;
    Action& operator=(Action&& a) = default;

    static std::string typeName(ActionType type);
    // Lowercase, with each character other than a letter or digit replaced by '_'
    static std::string sanitizeName(const std::string& name);
    // Canonical form of a hand-written action name: lowercase, 
    // without brackets and commas, single spaces.
    static std::string normalizeName(const std::string& name);
};

#endif
