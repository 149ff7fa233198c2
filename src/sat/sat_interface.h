#ifndef DOCKPLAN_SAT_INTERFACE_H
#define DOCKPLAN_SAT_INTERFACE_H

#include <fstream>
#include <string>
#include <vector>

#include "sat/variable_domain.h"
#include "sat/encoding_statistics.h"

/*
 * Owns one incremental IPASIR solver. Every clause is counted in the
 * encoding statistics and, if requested, mirrored into a DIMACS file
 * which is completed (header and last assumptions as units) on destruction.
 */
class SatInterface {

private:
    void* _solver;
    EncodingStatistics& _stats;
    const VariableDomain& _vars;

    const bool _write_formula;
    const std::string _formula_file;
    std::ofstream _body;

    size_t _open_clause_size = 0;
    std::vector<int> _assumptions;
    bool _solved_since_assumption = false;

public:
    SatInterface(EncodingStatistics& stats, const VariableDomain& vars, 
                bool writeFormula = false, const std::string& formulaFile = "f.cnf");
    ~SatInterface();

    void addClause(int lit) {
        appendClause(lit);
        endClause();
    }
    void addClause(int lit1, int lit2) {
        appendClause(lit1);
        appendClause(lit2);
        endClause();
    }
    void addClause(const std::vector<int>& lits) {
        for (int lit : lits) appendClause(lit);
        endClause();
    }
    void appendClause(int lit);
    void endClause();

    // Assumptions are valid for the next solve() call only
    void assume(int lit);
    bool holds(int lit) const;

    void setTerminateCallback(void* state, int (*terminate)(void* state));

    // 10: SAT, 20: UNSAT, 0: interrupted
    int solve();

    static std::string getSolverName();

private:
    void finishFormulaFile();
};

#endif
