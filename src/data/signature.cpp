#include <algorithm>

#include "data/signature.h"

bool USignature::operator<(const USignature& b) const {
    if (_name_id != b._name_id) return _name_id < b._name_id;
    return _args < b._args;
}

Signature Signature::opposite() const {
    return Signature(_usig, !_negated);
}

bool Signature::operator<(const Signature& b) const {
    if (_usig != b._usig) return _usig < b._usig;
    return _negated < b._negated;
}

std::vector<Signature> sortedLiterals(const SigSet& set) {
    std::vector<Signature> out(set.begin(), set.end());
    std::sort(out.begin(), out.end());
    return out;
}
