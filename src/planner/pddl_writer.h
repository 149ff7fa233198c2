#ifndef DOCKPLAN_PDDL_WRITER_H
#define DOCKPLAN_PDDL_WRITER_H

#include <ostream>
#include <string>
#include <vector>

#include "data/problem.h"

/*
 * Serializes a problem as a grounded STRIPS domain with negative 
 * preconditions: entities become typed constants, each action instance
 * becomes one parameterless action named by its key.
 */
class PddlWriter {

private:
    const Problem& _problem;
    const Registry& _registry;
    const Vocabulary& _vocab;
    std::vector<std::string> _entity_names;

public:
    // Throws an EncodingError if two entity names coincide after sanitizing.
    explicit PddlWriter(const Problem& problem);

    void writeDomain(std::ostream& out) const;
    void writeProblem(std::ostream& out) const;
    // Returns false if a file cannot be written.
    bool writeFiles(const std::string& domainFile, const std::string& problemFile) const;

    std::string toPddl(const Signature& literal) const;
    std::string toPddl(const USignature& atom) const;

    static std::string domainName() {return "dockplan";}
};

#endif
