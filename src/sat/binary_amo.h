#ifndef DOCKPLAN_BINARY_AMO_H
#define DOCKPLAN_BINARY_AMO_H

#include <vector>

#include "sat/variable_domain.h"

/*
 * Binary ("bitwise") encoding over a set of variables: the i-th variable 
 * is equivalent to a set of ceil(log2(numStates)) helper bits spelling i,
 * and all codes >= numStates are forbidden.
 * With numStates == number of variables this is an exactly-one constraint;
 * with numStates > number of variables, the code of index n stands for
 * "no variable set" and the constraint is at-most-one.
 */
class BinaryAtMostOne {

private:
    std::vector<int> _states;
    size_t _num_states;
    std::vector<int> _bits;

public:
    BinaryAtMostOne(VariableDomain& vars, const std::vector<int>& states, size_t numStates);
    std::vector<std::vector<int>> encode() const;

private:
    // Literal which is true iff bit "bit" of the helper bits equals that of "code"
    int bitLiteral(size_t code, size_t bit) const;
};

#endif
