
#include <assert.h>
#include <cstdio>

#include "sat/sat_interface.h"
#include "util/log.h"

extern "C" {
    #include "ipasir.h"
}

SatInterface::SatInterface(EncodingStatistics& stats, const VariableDomain& vars, 
        bool writeFormula, const std::string& formulaFile) : 
        _solver(ipasir_init()), _stats(stats), _vars(vars), 
        _write_formula(writeFormula), _formula_file(formulaFile) {

    if (_write_formula) _body.open(_formula_file + ".body");
}

void SatInterface::appendClause(int lit) {
    assert(lit != 0);
    ipasir_add(_solver, lit);
    if (_write_formula) _body << lit << " ";
    _open_clause_size++;
}

void SatInterface::endClause() {
    assert(_open_clause_size > 0 || Log::e("Empty clause added to the formula\n"));
    ipasir_add(_solver, 0);
    if (_write_formula) _body << "0\n";
    _stats.countClause(_open_clause_size);
    _open_clause_size = 0;
}

void SatInterface::assume(int lit) {
    assert(lit != 0);
    if (_solved_since_assumption) {
        _assumptions.clear();
        _solved_since_assumption = false;
    }
    ipasir_assume(_solver, lit);
    _assumptions.push_back(lit);
}

bool SatInterface::holds(int lit) const {
    return ipasir_val(_solver, lit) > 0;
}

void SatInterface::setTerminateCallback(void* state, int (*terminate)(void* state)) {
    ipasir_set_terminate(_solver, state, terminate);
}

int SatInterface::solve() {
    assert(_open_clause_size == 0);
    int result = ipasir_solve(_solver);
    _solved_since_assumption = true;
    return result;
}

std::string SatInterface::getSolverName() {
    return std::string(ipasir_signature());
}

void SatInterface::finishFormulaFile() {
    _body.close();

    std::string bodyFile = _formula_file + ".body";
    std::ofstream out(_formula_file);
    out << "p cnf " << _vars.getMaxVar() << " " << (_stats.getNumClauses() + _assumptions.size()) << "\n";
    std::ifstream in(bodyFile);
    out << in.rdbuf();
    in.close();
    std::remove(bodyFile.c_str());
    for (int lit : _assumptions) out << lit << " 0\n";
    out.close();

    Log::i("Wrote formula to %s\n", _formula_file.c_str());
}

SatInterface::~SatInterface() {
    if (_write_formula) finishFormulaFile();
    ipasir_release(_solver);
}
