#ifndef DOCKPLAN_ARG_ITERATOR_H
#define DOCKPLAN_ARG_ITERATOR_H

#include <vector>

#include "data/signature.h"
#include "data/registry.h"

/*
 * Range over all signatures with a fixed name ID whose i-th argument is 
 * drawn from the i-th list of eligible arguments (cartesian product). 
 * The first position varies fastest.
 */
class ArgIterator {

public:
    class It {
    private:
        const ArgIterator* _range;
        size_t _index;
        std::vector<size_t> _digits;
        USignature _current;
    public:
        It(const ArgIterator* range, size_t index);
        const USignature& operator*() const {return _current;}
        It& operator++();
        bool operator!=(const It& other) const {return _index != other._index;}
        bool operator==(const It& other) const {return _index == other._index;}
    };

private:
    int _name_id;
    std::vector<std::vector<int>> _choices;
    size_t _size;

public:
    ArgIterator(int nameId, std::vector<std::vector<int>>&& eligibleArgs);

    It begin() const {return It(this, 0);}
    It end() const {return It(this, _size);}
    size_t size() const {return _size;}

    // All signatures of the given name whose arguments range over 
    // the entities of the respective types.
    static ArgIterator getFullInstantiation(int nameId, const std::vector<EntityType>& types, const Registry& registry);
};

#endif
