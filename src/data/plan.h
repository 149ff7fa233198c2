#ifndef DOCKPLAN_PLAN_H
#define DOCKPLAN_PLAN_H

#include <vector>

// An ordered sequence of action indices into Problem::getActions().
typedef std::vector<int> Plan;

#endif
