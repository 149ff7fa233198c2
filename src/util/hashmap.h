#ifndef DOCKPLAN_HASHMAP_H
#define DOCKPLAN_HASHMAP_H

#include <utility>

#include <robin_hood.h>

#include "util/hash.h"

// Flat maps store values inline (references are invalidated on insertion);
// node maps keep each value at a fixed address.
#define FlatHashMap robin_hood::unordered_flat_map
#define NodeHashMap robin_hood::unordered_node_map
#define FlatHashSet robin_hood::unordered_flat_set

// A directed pair of entity IDs, e.g. an adjacency between two docks.
typedef std::pair<int, int> IntPair;
struct IntPairHasher {
    size_t operator()(const IntPair& pair) const {
        size_t h = 17;
        hash_combine(h, pair.first);
        hash_combine(h, pair.second);
        return h;
    }
};

#endif
