
#include "sat/variable_domain.h"

#include "util/log.h"

int VariableDomain::nextVar() {
    return _running_var_id++;
}
int VariableDomain::getMaxVar() const {
    return _running_var_id-1;
}

void VariableDomain::printVar(int var, int step, const std::string& name) const {
    if (_print_variables) {
        Log::d("VARMAP %i %s\n", var, varName(step, name).c_str());
    }
}
std::string VariableDomain::varName(int step, const std::string& name) {
    return name + "@" + std::to_string(step);
}
