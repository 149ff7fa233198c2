
#include <cctype>
#include <fstream>

#include "planner/plan_parser.h"
#include "util/log.h"

namespace {
    std::string trim(const std::string& s) {
        size_t begin = 0, end = s.size();
        while (begin < end && std::isspace((unsigned char)s[begin])) begin++;
        while (end > begin && std::isspace((unsigned char)s[end-1])) end--;
        return s.substr(begin, end-begin);
    }
}

std::string PlanParser::extractName(const std::string& rawLine, bool& malformed) {
    malformed = false;
    std::string line = rawLine;
    size_t comment = line.find(';');
    if (comment != std::string::npos) line = line.substr(0, comment);
    line = trim(line);
    if (line.empty()) return "";

    // Step prefix "N:" (time stamps such as "0.000:" as well)
    size_t pos = 0;
    while (pos < line.size() && (std::isdigit((unsigned char)line[pos]) || line[pos] == '.')) pos++;
    if (pos > 0 && pos < line.size() && line[pos] == ':') line = trim(line.substr(pos+1));

    // Cost suffix "[c]"
    if (!line.empty() && line.back() == ']') {
        size_t open = line.rfind('[');
        if (open == std::string::npos) {
            malformed = true;
            return "";
        }
        line = trim(line.substr(0, open));
    }

    if (line.size() < 2 || line.front() != '(' || line.back() != ')') {
        malformed = true;
        return "";
    }
    std::string name = trim(line.substr(1, line.size()-2));
    if (name.empty()) malformed = true;
    return name;
}

bool PlanParser::parse(std::istream& in, Plan& plan, std::string& error) const {
    plan.clear();
    State state = _problem.getInitialState();
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        lineNo++;
        bool malformed;
        std::string name = extractName(line, malformed);
        if (malformed) {
            error = "Line " + std::to_string(lineNo) + " is not a plan step: \"" + line + "\"";
            return false;
        }
        if (name.empty()) continue;

        int actionIndex = _problem.findAction(name);
        if (actionIndex < 0) {
            const std::vector<int>& variants = _problem.findActionsByName(name);
            for (int v : variants) {
                if (_problem.isApplicable(state, v)) {
                    actionIndex = v;
                    break;
                }
            }
            if (actionIndex < 0 && !variants.empty()) actionIndex = variants.front();
        }
        if (actionIndex < 0) {
            error = "Line " + std::to_string(lineNo) + ": unknown action \"" + name + "\"";
            return false;
        }
        if (_problem.isApplicable(state, actionIndex)) state = _problem.apply(state, actionIndex);
        plan.push_back(actionIndex);
        Log::d("Parsed step %zu: %s\n", plan.size()-1, _problem.getAction(actionIndex).getKey().c_str());
    }
    return true;
}

bool PlanParser::parseFile(const std::string& path, Plan& plan, std::string& error) const {
    std::ifstream in(path);
    if (!in.is_open()) {
        error = "Cannot read plan file " + path;
        return false;
    }
    return parse(in, plan, error);
}
