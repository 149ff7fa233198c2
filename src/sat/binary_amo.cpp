#include <assert.h>

#include "sat/binary_amo.h"
#include "util/log.h"

BinaryAtMostOne::BinaryAtMostOne(VariableDomain& vars, const std::vector<int>& states, size_t numStates) : 
        _states(states), _num_states(numStates) {

    assert(_states.size() <= _num_states);
    size_t numCodes = 1;
    while (numCodes < _num_states) {
        _bits.push_back(vars.nextVar());
        numCodes *= 2;
    }
    Log::d("BAMO over %zu vars: %zu states, %zu bits\n", _states.size(), _num_states, _bits.size());
}

int BinaryAtMostOne::bitLiteral(size_t code, size_t bit) const {
    return ((code >> bit) & 1) ? _bits[bit] : -_bits[bit];
}

std::vector<std::vector<int>> BinaryAtMostOne::encode() const {
    std::vector<std::vector<int>> cls;
    if (_bits.empty()) {
        // One single code: the only variable (if any) must hold
        if (_num_states == 1 && _states.size() == 1) cls.push_back({_states[0]});
        return cls;
    }

    for (size_t i = 0; i < _states.size(); i++) {
        // var_i => bits spell i
        for (size_t b = 0; b < _bits.size(); b++) {
            cls.push_back({-_states[i], bitLiteral(i, b)});
        }
        // bits spell i => var_i
        std::vector<int> converse;
        for (size_t b = 0; b < _bits.size(); b++) converse.push_back(-bitLiteral(i, b));
        converse.push_back(_states[i]);
        cls.push_back(std::move(converse));
    }

    // Forbid the codes [numStates, 2^bits) in aligned blocks: a block of 
    // size 2^k starting at c is excluded by one clause over the upper bits.
    size_t numCodes = size_t(1) << _bits.size();
    size_t code = _num_states;
    while (code < numCodes) {
        size_t k = 0;
        while (code % (size_t(2) << k) == 0 && code + (size_t(2) << k) <= numCodes) k++;
        std::vector<int> clause;
        for (size_t b = k; b < _bits.size(); b++) clause.push_back(-bitLiteral(code, b));
        cls.push_back(std::move(clause));
        code += size_t(1) << k;
    }
    return cls;
}
