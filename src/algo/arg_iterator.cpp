#include "algo/arg_iterator.h"

ArgIterator::ArgIterator(int nameId, std::vector<std::vector<int>>&& eligibleArgs) : 
        _name_id(nameId), _choices(std::move(eligibleArgs)) {
    // Nothing to enumerate without positions or with an empty position
    _size = _choices.empty() ? 0 : 1;
    for (const auto& args : _choices) _size *= args.size();
}

ArgIterator::It::It(const ArgIterator* range, size_t index) : 
        _range(range), _index(index), _digits(range->_choices.size(), 0), 
        _current(range->_name_id, std::vector<int>(range->_choices.size(), 0)) {
    if (_index >= _range->_size) return;
    for (size_t i = 0; i < _digits.size(); i++) {
        _current._args[i] = _range->_choices[i][0];
    }
}

ArgIterator::It& ArgIterator::It::operator++() {
    _index++;
    if (_index >= _range->_size) return *this;
    // Odometer step: reset exhausted positions, advance the first one that is not
    for (size_t i = 0; i < _digits.size(); i++) {
        const auto& choices = _range->_choices[i];
        if (++_digits[i] < choices.size()) {
            _current._args[i] = choices[_digits[i]];
            break;
        }
        _digits[i] = 0;
        _current._args[i] = choices[0];
    }
    return *this;
}

ArgIterator ArgIterator::getFullInstantiation(int nameId, const std::vector<EntityType>& types, const Registry& registry) {
    std::vector<std::vector<int>> entitiesPerArg;
    for (EntityType type : types) {
        entitiesPerArg.push_back(registry.getEntitiesOfType(type));
    }
    return ArgIterator(nameId, std::move(entitiesPerArg));
}
