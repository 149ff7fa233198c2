#ifndef DOCKPLAN_PARAMETERS_H
#define DOCKPLAN_PARAMETERS_H

/*
 * Command line options of the form -key or -key=value,
 * plus one positional argument (the scenario name).
 */

#include <map>
#include <string>
#include <vector>

class Parameters {
private:
	std::map<std::string, std::string> _params;

	// Positional / unqualified parameter
	std::string _scenario_name = "";

public:
	Parameters() = default;
	void init(int argc, char** argv);
	void printUsage();
	void setDefaults();
	std::string getScenarioName() const;
	void printParams();
	void setParam(const char* name);
	void setParam(const char* name, const char* value);
	bool isSet(const std::string& name) const;
	bool isNonzero(const std::string& intParamName) const;
	std::string getParam(const std::string& name, const std::string& defaultValue) const;
	std::string getParam(const std::string& name) const;
	int getIntParam(const std::string& name, int defaultValue) const;
	float getFloatParam(const std::string& name, float defaultValue) const;
	int getIntParam(const std::string& name) const;
	float getFloatParam(const std::string& name) const;
	std::vector<int> getIntListParam(const std::string& name) const;
};

#endif
