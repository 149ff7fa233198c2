
#include <assert.h>
#include <cstring>
#include <cstdlib>
#include <sstream>

#include "util/params.h"
#include "util/log.h"

/**
 * Adapted from Hordesat:ParameterProcessor.h by Tomas Balyo.
 */
void Parameters::init(int argc, char** argv) {
    setDefaults();
    for (int i = 1; i < argc; i++) {
        char* arg = argv[i];
        if (arg[0] != '-') {
            if (_scenario_name == "") _scenario_name = std::string(arg);
            else {
                Log::w("Unrecognized parameter %s.\n", arg);
                printUsage();
                exit(1);
            }
            continue;
        }
        char* eq = strchr(arg, '=');
        if (eq == NULL) {
            char* left = arg+1;
            auto it = _params.find(left);
            if (it != _params.end() && it->second == "0") it->second = "1";
            else _params[left];
        } else {
            *eq = 0;
            char* left = arg+1;
            char* right = eq+1;
            _params[left] = right;
        }
    }
}

void Parameters::setDefaults() {
    setParam("cmd", ""); // external planner command line
    setParam("co", "1"); // colored output
    setParam("H", "40"); // max. horizon of the SAT backend
    setParam("log", ""); // mirror all output into this file
    setParam("planner", "sat"); // planner backend: sat or process
    setParam("pvn", "0"); // print variable names
    setParam("T", "0"); // max. time (secs) for the planner call, 0: no limit
    setParam("unsat", "11,12"); // exit codes of the external planner meaning "no plan exists"
    setParam("v", "2"); // verbosity
    setParam("vp", "1"); // print the validation trace of the found plan
    setParam("wd", "."); // work directory for PDDL and plan files
    setParam("wf", "0"); // output formula to f.cnf
    setParam("wp", "0"); // write PDDL files and exit
}

void Parameters::printUsage() {

    Log::setForcePrint(true);

    Log::i("Usage: dockplan [scenario] [options]\n");
    Log::i("  [scenario]  Name of a built-in scenario (see -list). Default: line_transfer\n");
    Log::i("\n");
    Log::i("Option syntax: -OPTION or -OPTION=VALUE .\n");
    Log::i("\n");
    Log::i(" -cmd=<string>       Command line of the external planner (for -planner=process).\n");
    Log::i("                     {domain}, {problem} and {plan} are replaced by the respective file paths,\n");
    Log::i("                     e.g. -cmd=\"fast-downward.py --plan-file {plan} {domain} {problem} --search astar(ff())\"\n");
    Log::i(" -co=<0|1>           Colored terminal output\n");
    Log::i(" -H=<horizon>        Maximum number of plan steps the SAT backend tries\n");
    Log::i(" -list               List built-in scenarios and exit\n");
    Log::i(" -log=<file>         Also write all output (without colors) to <file>\n");
    Log::i(" -planner=<sat|process> Planner backend\n");
    Log::i(" -pvn=<0|1>          Print variable names of the SAT encoding\n");
    Log::i(" -T=<0|secs>         Time budget of the planner call (0: no limit)\n");
    Log::i(" -unsat=<c1,c2,..>   Exit codes of the external planner which report \"no plan exists\"\n");
    Log::i(" -v=<verb>           Verbosity: 0=essential 1=warnings 2=information 3=verbose 4=debug\n");
    Log::i(" -vp=<0|1>           Print the step-by-step validation of the found plan\n");
    Log::i(" -wd=<dir>           Work directory for PDDL and plan files\n");
    Log::i(" -wf=<0|1>           Write the SAT formula of the final horizon to \"f.cnf\"\n");
    Log::i(" -wp=<0|1>           Write domain.pddl and problem.pddl to the work directory and exit\n");
    Log::i(" -xd=<0|1>           Override the scenario: exclusive docks (one robot per dock)\n");
    Log::i("\n");
    printParams();
    Log::setForcePrint(false);
}

std::string Parameters::getScenarioName() const {
    return _scenario_name;
}

void Parameters::printParams() {
    std::string out = "";
    for (auto it = _params.begin(); it != _params.end(); ++it) {
        if (it->second.empty()) {
            out += "-" + it->first + " ";
        } else {
            out += "-" + it->first + "=" + it->second + " ";
        }
    }
    Log::i("Called with parameters: %s\n", out.c_str());
}

void Parameters::setParam(const char* name) {
    _params[name];
}

void Parameters::setParam(const char* name, const char* value) {
    _params[name] = value;
}

bool Parameters::isSet(const std::string& name) const {
    return _params.count(name);
}

bool Parameters::isNonzero(const std::string& intParamName) const {
    auto it = _params.find(intParamName);
    return it != _params.end() && atoi(it->second.c_str()) != 0;
}

std::string Parameters::getParam(const std::string& name, const std::string& defaultValue) const {
    auto it = _params.find(name);
    if (it != _params.end()) return it->second;
    return defaultValue;
}

std::string Parameters::getParam(const std::string& name) const {
    return getParam(name, "ndef");
}

int Parameters::getIntParam(const std::string& name, int defaultValue) const {
    auto it = _params.find(name);
    if (it != _params.end()) return atoi(it->second.c_str());
    return defaultValue;
}

int Parameters::getIntParam(const std::string& name) const {
    assert(isSet(name));
    return atoi(_params.at(name).c_str());
}

float Parameters::getFloatParam(const std::string& name, float defaultValue) const {
    auto it = _params.find(name);
    if (it != _params.end()) return atof(it->second.c_str());
    return defaultValue;
}

float Parameters::getFloatParam(const std::string& name) const {
    assert(isSet(name));
    return atof(_params.at(name).c_str());
}

std::vector<int> Parameters::getIntListParam(const std::string& name) const {
    std::vector<int> out;
    std::stringstream stream(getParam(name, ""));
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) out.push_back(atoi(item.c_str()));
    }
    return out;
}
