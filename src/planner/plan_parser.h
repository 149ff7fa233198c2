#ifndef DOCKPLAN_PLAN_PARSER_H
#define DOCKPLAN_PLAN_PARSER_H

#include <istream>
#include <string>

#include "data/problem.h"
#include "data/plan.h"

/*
 * Reads a plan as emitted by common classical planners, one step per line:
 *   [N:] (name) [[cost]]
 * Lines starting with ';' and blank lines are skipped. A name is either an
 * action key or a display name such as "pickup r1 c1 p1 d1"; the latter
 * is resolved to the variant applicable in the state reached so far.
 * Names are matched case-insensitively.
 */
class PlanParser {

private:
    const Problem& _problem;

public:
    explicit PlanParser(const Problem& problem) : _problem(problem) {}

    // Returns false and sets error if some line cannot be mapped to an action.
    bool parse(std::istream& in, Plan& plan, std::string& error) const;
    bool parseFile(const std::string& path, Plan& plan, std::string& error) const;

    // The bracketed action name of one line, or "" if the line holds no step.
    // Sets malformed if the line holds something else.
    static std::string extractName(const std::string& line, bool& malformed);
};

#endif
