
#include <memory>

#include "sat/sat_planner.h"
#include "sat/sat_interface.h"
#include "sat/binary_amo.h"
#include "sat/variable_domain.h"
#include "sat/encoding_statistics.h"
#include "util/log.h"
#include "util/signal_manager.h"

int terminateSatCall(void* data) {
    const Deadline* deadline = (const Deadline*) data;
    return (deadline->expired() || SignalManager::isExitSet()) ? 1 : 0;
}

namespace {

// Fact and action variables of all steps encoded so far.
class StepEncoding {

private:
    const Problem& _problem;
    const Vocabulary& _vocab;
    VariableDomain& _vars;
    SatInterface& _sat;
    EncodingStatistics& _stats;

    // Dynamic fluent IDs; fact variables are indexed by position in this list
    std::vector<int> _dynamic_fluents;
    std::vector<int> _position_of_fluent;
    // Actions whose static preconditions hold
    std::vector<int> _candidate_actions;
    // Per dynamic fluent: candidate actions (positions) which add / delete it
    std::vector<std::vector<int>> _adders;
    std::vector<std::vector<int>> _deleters;

    std::vector<std::vector<int>> _fact_vars;
    std::vector<std::vector<int>> _action_vars;

public:
    StepEncoding(const Problem& problem, VariableDomain& vars, SatInterface& sat, EncodingStatistics& stats) :
            _problem(problem), _vocab(problem.getVocabulary()), _vars(vars), _sat(sat), _stats(stats) {

        _position_of_fluent.assign(_vocab.size(), -1);
        for (size_t f = 0; f < _vocab.size(); f++) {
            if (_vocab.isStatic(f)) continue;
            _position_of_fluent[f] = _dynamic_fluents.size();
            _dynamic_fluents.push_back(f);
        }
        _adders.resize(_dynamic_fluents.size());
        _deleters.resize(_dynamic_fluents.size());

        const State& init = problem.getInitialState();
        for (size_t a = 0; a < problem.getNumActions(); a++) {
            bool possible = true;
            for (const Signature& pre : problem.getAction(a).getPreconditions()) {
                int f = _vocab.getFluentId(pre._usig);
                if (_vocab.isStatic(f) && init[f] == pre._negated) possible = false;
            }
            if (!possible) continue;
            int pos = _candidate_actions.size();
            _candidate_actions.push_back(a);
            for (const Signature& eff : problem.getAction(a).getEffects()) {
                int fPos = _position_of_fluent[_vocab.getFluentId(eff._usig)];
                assert(fPos >= 0 || Log::e("Effect on static fluent %s\n", problem.toString(eff).c_str()));
                (eff._negated ? _deleters : _adders)[fPos].push_back(pos);
            }
        }
        Log::v("SAT encoding: %zu dynamic fluents, %zu of %zu actions possible\n", 
                _dynamic_fluents.size(), _candidate_actions.size(), problem.getNumActions());
    }

    int getNumSteps() const {return (int)_fact_vars.size() - 1;}

    void encodeInitialState() {
        _stats.beginStep();
        _fact_vars.push_back(newFactVars(0));
        _stats.begin(EncodingStatistics::INIT_STATE);
        const State& init = _problem.getInitialState();
        for (size_t i = 0; i < _dynamic_fluents.size(); i++) {
            int var = _fact_vars[0][i];
            _sat.addClause(init[_dynamic_fluents[i]] ? var : -var);
        }
        _stats.end(EncodingStatistics::INIT_STATE);
        _stats.endStep(0);
    }

    // Adds step t+1 and the actions between t and t+1.
    void encodeNextStep() {
        int t = getNumSteps();
        _stats.beginStep();
        _fact_vars.push_back(newFactVars(t+1));
        const auto& before = _fact_vars[t];
        const auto& after = _fact_vars[t+1];

        std::vector<int> actionVars;
        for (int a : _candidate_actions) {
            int var = _vars.nextVar();
            _vars.printVar(var, t, _problem.getAction(a).getKey());
            actionVars.push_back(var);
        }

        _stats.begin(EncodingStatistics::PRECONDITIONS);
        for (size_t pos = 0; pos < _candidate_actions.size(); pos++) {
            for (const Signature& pre : sortedLiterals(_problem.getAction(_candidate_actions[pos]).getPreconditions())) {
                int fPos = _position_of_fluent[_vocab.getFluentId(pre._usig)];
                if (fPos < 0) continue; // static, holds
                _sat.addClause(-actionVars[pos], pre._negated ? -before[fPos] : before[fPos]);
            }
        }
        _stats.end(EncodingStatistics::PRECONDITIONS);

        _stats.begin(EncodingStatistics::EFFECTS);
        for (size_t pos = 0; pos < _candidate_actions.size(); pos++) {
            for (const Signature& eff : sortedLiterals(_problem.getAction(_candidate_actions[pos]).getEffects())) {
                int fPos = _position_of_fluent[_vocab.getFluentId(eff._usig)];
                _sat.addClause(-actionVars[pos], eff._negated ? -after[fPos] : after[fPos]);
            }
        }
        _stats.end(EncodingStatistics::EFFECTS);

        // A fluent only changes its value if an action explains the change
        _stats.begin(EncodingStatistics::FRAME_AXIOMS);
        for (size_t i = 0; i < _dynamic_fluents.size(); i++) {
            _sat.appendClause(-before[i]);
            _sat.appendClause(after[i]);
            for (int pos : _deleters[i]) _sat.appendClause(actionVars[pos]);
            _sat.endClause();
            _sat.appendClause(before[i]);
            _sat.appendClause(-after[i]);
            for (int pos : _adders[i]) _sat.appendClause(actionVars[pos]);
            _sat.endClause();
        }
        _stats.end(EncodingStatistics::FRAME_AXIOMS);

        _stats.begin(EncodingStatistics::ACTION_AT_MOST_ONE);
        if (actionVars.size() > 1) {
            for (const auto& cls : BinaryAtMostOne(_vars, actionVars, actionVars.size()+1).encode()) {
                _sat.addClause(cls);
            }
        }
        _stats.end(EncodingStatistics::ACTION_AT_MOST_ONE);

        _action_vars.push_back(std::move(actionVars));
        _stats.endStep(t+1);
    }

    // Assumes the goal at the last step.
    void assumeGoal() {
        int t = getNumSteps();
        _stats.begin(EncodingStatistics::GOAL_ASSUMPTIONS);
        for (const Signature& lit : _problem.getGoal()) {
            int fPos = _position_of_fluent[_vocab.getFluentId(lit._usig)];
            if (fPos < 0) continue; // static goals are checked at assembly
            int var = _fact_vars[t][fPos];
            _sat.assume(lit._negated ? -var : var);
        }
        _stats.end(EncodingStatistics::GOAL_ASSUMPTIONS);
    }

    Plan decodePlan() {
        Plan plan;
        for (size_t t = 0; t < _action_vars.size(); t++) {
            int chosen = 0;
            for (size_t pos = 0; pos < _action_vars[t].size(); pos++) {
                if (_sat.holds(_action_vars[t][pos])) {
                    plan.push_back(_candidate_actions[pos]);
                    chosen++;
                }
            }
            assert(chosen <= 1 || Log::e("Plan error: %i actions at step %zu!\n", chosen, t));
        }
        return plan;
    }

private:
    std::vector<int> newFactVars(int step) {
        std::vector<int> vars;
        for (int f : _dynamic_fluents) {
            int var = _vars.nextVar();
            _vars.printVar(var, step, _vocab.toString(_vocab.getFluent(f), _problem.getRegistry()));
            vars.push_back(var);
        }
        return vars;
    }
};

}

PlannerResult SatPlanner::findPlan(const Problem& problem, const Deadline& deadline) {

    PlannerResult result;
    Log::v("SAT solver: %s\n", SatInterface::getSolverName().c_str());

    EncodingStatistics stats;
    VariableDomain vars(_config.printVariableNames);
    SatInterface sat(stats, vars, _config.writeFormula, _config.formulaFile);
    sat.setTerminateCallback((void*) &deadline, terminateSatCall);

    StepEncoding enc(problem, vars, sat, stats);
    enc.encodeInitialState();

    for (int horizon = 0; horizon <= _config.maxHorizon; horizon++) {
        if (horizon > 0) enc.encodeNextStep();
        if (deadline.expired() || SignalManager::isExitSet()) {
            result.status = TIMEOUT;
            result.message = "Time budget exhausted before horizon " + std::to_string(horizon);
            break;
        }

        enc.assumeGoal();
        Log::i("Horizon %i: solving (%i vars, %zu cls)\n", horizon, vars.getMaxVar(), stats.getNumClauses());
        int satResult = sat.solve();

        if (satResult == 10) {
            result.status = SOLVED;
            result.plan = enc.decodePlan();
            result.message = "Plan found at horizon " + std::to_string(horizon);
            break;
        } else if (satResult == 20) {
            Log::v("Horizon %i: UNSAT\n", horizon);
            if (horizon == _config.maxHorizon) {
                result.status = UNSATISFIABLE;
                result.message = "No plan within " + std::to_string(_config.maxHorizon) + " steps";
            }
        } else {
            result.status = TIMEOUT;
            result.message = "Solver interrupted at horizon " + std::to_string(horizon);
            break;
        }
    }
    stats.printStages();
    return result;
}
