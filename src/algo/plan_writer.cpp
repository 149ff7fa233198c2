#include <fstream>
#include <sstream>

#include "algo/plan_writer.h"
#include "util/log.h"

void PlanWriter::outputPlan(const Plan& plan) const {

    std::stringstream stream;
    stream << "==>\n";
    for (size_t step = 0; step < plan.size(); step++) {
        const Action& a = _problem.getAction(plan[step]);
        stream << step << " " << a.getDisplayName(_problem.getRegistry()) << "\n";
    }
    stream << "<==\n";

    Log::log_notime(Log::V0_ESSENTIAL, "%s", stream.str().c_str());
    Log::i("End of solution plan. (counted length of %zu)\n", plan.size());
}

bool PlanWriter::writePlanFile(const Plan& plan, const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        Log::w("Cannot write plan file %s\n", path.c_str());
        return false;
    }
    for (int actionIndex : plan) {
        out << "(" << _problem.getAction(actionIndex).getKey() << ")\n";
    }
    out << "; cost = " << plan.size() << " (unit cost)\n";
    return out.good();
}
