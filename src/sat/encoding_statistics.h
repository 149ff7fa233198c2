#ifndef DOCKPLAN_ENCODING_STATISTICS_H
#define DOCKPLAN_ENCODING_STATISTICS_H

#include <array>
#include <assert.h>

#include "util/log.h"

class EncodingStatistics {

public:
    enum Stage {
        INIT_STATE, PRECONDITIONS, EFFECTS, FRAME_AXIOMS, ACTION_AT_MOST_ONE, GOAL_ASSUMPTIONS, NUM_STAGES
    };

private:
    size_t _num_cls = 0;
    size_t _num_lits = 0;
    size_t _step_start_cls = 0;
    size_t _step_start_lits = 0;

    std::array<size_t, NUM_STAGES> _cls_per_stage {};
    int _open_stage = -1;
    size_t _stage_start_cls = 0;

public:
    void countClause(size_t numLits) {
        _num_cls++;
        _num_lits += numLits;
    }
    size_t getNumClauses() const {return _num_cls;}
    size_t getNumLiterals() const {return _num_lits;}

    void beginStep() {
        _step_start_cls = _num_cls;
        _step_start_lits = _num_lits;
    }
    void endStep(int step) const {
        assert(_open_stage < 0);
        Log::v("  Step %i: encoded %zu cls, %zu lits\n", step, 
            _num_cls-_step_start_cls, _num_lits-_step_start_lits);
    }

    // Stages do not nest
    void begin(Stage stage) {
        assert(_open_stage < 0);
        _open_stage = stage;
        _stage_start_cls = _num_cls;
    }
    void end(Stage stage) {
        assert(_open_stage == stage);
        _cls_per_stage[stage] += _num_cls - _stage_start_cls;
        _open_stage = -1;
    }

    size_t getNumClausesOfStage(Stage stage) const {
        return _cls_per_stage[stage];
    }

    void printStages() const {
        Log::i("Total amount of clauses encoded: %zu\n", _num_cls);
        for (int stage = 0; stage < NUM_STAGES; stage++) {
            if (_cls_per_stage[stage] == 0) continue;
            Log::i("- %s : %zu cls (%.1f%%)\n", getStageName((Stage) stage), _cls_per_stage[stage], 
                100.0 * _cls_per_stage[stage] / _num_cls);
        }
    }

    static const char* getStageName(Stage stage) {
        switch (stage) {
        case INIT_STATE: return "initstate";
        case PRECONDITIONS: return "preconditions";
        case EFFECTS: return "effects";
        case FRAME_AXIOMS: return "frameaxioms";
        case ACTION_AT_MOST_ONE: return "atmostoneaction";
        case GOAL_ASSUMPTIONS: return "goalassumptions";
        default: return "?";
        }
    }
};

#endif
