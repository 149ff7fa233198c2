#ifndef DOCKPLAN_VARIABLE_DOMAIN_H
#define DOCKPLAN_VARIABLE_DOMAIN_H

#include <string>

/*
 * Hands out SAT variables. Each encoding owns its own domain, 
 * so independent encodings may be built concurrently.
 */
class VariableDomain {

private:
    int _running_var_id = 1;
    bool _print_variables;

public:
    explicit VariableDomain(bool printVariables = false) : _print_variables(printVariables) {}

    int nextVar();
    int getMaxVar() const;

    void printVar(int var, int step, const std::string& name) const;
    static std::string varName(int step, const std::string& name);
};

#endif
