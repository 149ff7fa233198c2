
#include <cctype>

#include "data/action.h"

Action::Action(ActionType type, const std::vector<int>& args, const ActionVariant& variant) : 
        _type(type), _args(args), _variant(variant) {}

void Action::addPrecondition(const Signature& sig) {
    _preconditions.insert(sig);
}
void Action::addPrecondition(Signature&& sig) {
    _preconditions.insert(std::move(sig));
}
void Action::addEffect(const Signature& sig) {
    _effects.insert(sig);
}
void Action::addEffect(Signature&& sig) {
    _effects.insert(std::move(sig));
}

bool Action::hasInconsistentEffects() const {
    for (const Signature& sig : _effects) {
        if (sig._negated && _effects.count(Signature(sig._usig, false))) return true;
    }
    return false;
}

std::string Action::buildKey(const Registry& registry) const {
    std::string key = typeName(_type);
    for (int arg : _args) key += "_" + sanitizeName(registry.toString(arg));
    if (_type == MOVE) return key;

    if (_type == PICKUP) {
        key += _variant.resting > 0 ? "_on_" + sanitizeName(registry.toString(_variant.resting)) : "_bottom";
    } else {
        key += _variant.resting > 0 ? "_onto_" + sanitizeName(registry.toString(_variant.resting)) : "_empty";
    }
    key += "_s" + std::to_string(_variant.slot) + "_l" + std::to_string(_variant.load);
    return key;
}

std::string Action::getDisplayName(const Registry& registry) const {
    std::string name = "(" + typeName(_type);
    for (int arg : _args) name += " " + registry.toString(arg);
    return name + ")";
}

std::string Action::typeName(ActionType type) {
    switch (type) {
    case MOVE: return "move";
    case PICKUP: return "pickup";
    case PUTDOWN: return "putdown";
    }
    return "?";
}

std::string Action::sanitizeName(const std::string& name) {
    std::string out;
    for (char c : name) {
        if (std::isalnum((unsigned char)c)) out += std::tolower((unsigned char)c);
        else out += '_';
    }
    return out;
}

std::string Action::normalizeName(const std::string& name) {
    std::string out;
    bool space = true;
    for (char c : name) {
        if (c == '(' || c == ')' || c == ',' || std::isspace((unsigned char)c)) {
            if (!space) out += ' ';
            space = true;
        } else {
            out += std::tolower((unsigned char)c);
            space = false;
        }
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}
