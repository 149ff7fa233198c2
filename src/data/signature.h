#ifndef DOCKPLAN_SIGNATURE_H
#define DOCKPLAN_SIGNATURE_H

#include <vector>
#include <assert.h>

#include "util/hashmap.h"
#include "util/hash.h"

// A ground atom: a predicate ID applied to entity IDs.
struct USignature {

    int _name_id = -1;
    std::vector<int> _args;

    USignature() = default;
    USignature(int nameId, const std::vector<int>& args) : _name_id(nameId), _args(args) {}
    USignature(int nameId, std::vector<int>&& args) : _name_id(nameId), _args(std::move(args)) {}

    inline bool operator==(const USignature& b) const {
        return _name_id == b._name_id && _args == b._args;
    }
    inline bool operator!=(const USignature& b) const {
        return !(*this == b);
    }
    // Orders by predicate, then lexicographically by arguments
    bool operator<(const USignature& b) const;
};

// A literal: a ground atom which is required (or set) to be true,
// or, if negated, false.
struct Signature {
    
    USignature _usig;
    bool _negated = false;

    Signature() = default;
    Signature(int nameId, const std::vector<int>& args, bool negated = false) : _usig(nameId, args), _negated(negated) {}
    Signature(int nameId, std::vector<int>&& args, bool negated = false) : _usig(nameId, std::move(args)), _negated(negated) {}
    Signature(const USignature& usig, bool negated) : _usig(usig), _negated(negated) {}

    Signature opposite() const;

    inline bool operator==(const Signature& b) const {
        return _negated == b._negated && _usig == b._usig;
    }
    inline bool operator!=(const Signature& b) const {
        return !(*this == b);
    }
    bool operator<(const Signature& b) const;
};

struct USignatureHasher {
    inline std::size_t operator()(const USignature& s) const {
        size_t hash = s._args.size();
        for (const int& arg : s._args) {
            hash_combine(hash, arg);
        }
        hash_combine(hash, s._name_id);
        return hash;
    }
};
struct SignatureHasher {
    USignatureHasher _usig_hasher;
    inline std::size_t operator()(const Signature& s) const {
        size_t hash = _usig_hasher(s._usig);
        hash_combine(hash, s._negated);
        return hash;
    }
};

typedef FlatHashSet<Signature, SignatureHasher> SigSet;

// The literals of a set in a fixed order.
std::vector<Signature> sortedLiterals(const SigSet& set);

#endif
