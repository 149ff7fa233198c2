#ifndef DOCKPLAN_ERRORS_H
#define DOCKPLAN_ERRORS_H

#include <stdexcept>
#include <string>

// Malformed topology, missing attribute or an initial state / goal
// which violates the physical model. Raised before any planner call.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

// An entity attribute lies outside of the fixed enumeration
// it has to be encoded with.
class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& msg) : std::runtime_error(msg) {}
};

#endif
