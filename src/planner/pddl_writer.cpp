
#include <algorithm>
#include <cctype>
#include <fstream>

#include "planner/pddl_writer.h"
#include "util/errors.h"
#include "util/log.h"

PddlWriter::PddlWriter(const Problem& problem) : _problem(problem), 
        _registry(problem.getRegistry()), _vocab(problem.getVocabulary()) {

    FlatHashMap<std::string, int> used;
    _entity_names.resize(_registry.getNumEntities()+1);
    for (size_t id = 1; id <= _registry.getNumEntities(); id++) {
        std::string name = Action::sanitizeName(_registry.toString(id));
        // PDDL names begin with a letter
        if (name.empty() || !std::isalpha((unsigned char)name[0])) name = "e_" + name;
        auto it = used.find(name);
        if (it != used.end()) 
            throw EncodingError("Entities " + _registry.toString(it->second) + " and " 
                + _registry.toString(id) + " share the PDDL name " + name);
        used[name] = id;
        _entity_names[id] = name;
    }
}

std::string PddlWriter::toPddl(const USignature& atom) const {
    std::string out = "(" + _vocab.getPredicate(atom._name_id).name;
    for (int arg : atom._args) out += " " + _entity_names[arg];
    return out + ")";
}

std::string PddlWriter::toPddl(const Signature& literal) const {
    if (literal._negated) return "(not " + toPddl(literal._usig) + ")";
    return toPddl(literal._usig);
}

namespace {
    // Literal sets are unordered; output is sorted for reproducible files.
    std::vector<std::string> sorted(const SigSet& set, const PddlWriter& writer) {
        std::vector<std::string> out;
        for (const Signature& sig : set) out.push_back(writer.toPddl(sig));
        std::sort(out.begin(), out.end());
        return out;
    }
}

void PddlWriter::writeDomain(std::ostream& out) const {
    out << "(define (domain " << domainName() << ")\n";
    out << "  (:requirements :strips :typing :negative-preconditions)\n";
    out << "  (:types robot dock pile container)\n";

    out << "  (:constants\n";
    for (EntityType type : {ROBOT, DOCK, PILE, CONTAINER}) {
        const auto& entities = _registry.getEntitiesOfType(type);
        if (entities.empty()) continue;
        out << "   ";
        for (int e : entities) out << " " << _entity_names[e];
        out << " - " << Registry::typeName(type) << "\n";
    }
    out << "  )\n";

    out << "  (:predicates\n";
    for (size_t p = 0; p < _vocab.getNumPredicates(); p++) {
        const PredicateDef& pred = _vocab.getPredicate(p);
        out << "    (" << pred.name;
        for (size_t i = 0; i < pred.paramTypes.size(); i++) {
            out << " ?x" << i << " - " << Registry::typeName(pred.paramTypes[i]);
        }
        out << ")\n";
    }
    out << "  )\n";

    for (const Action& a : _problem.getActions()) {
        out << "  (:action " << a.getKey() << "\n";
        out << "    :parameters ()\n";
        out << "    :precondition (and";
        for (const std::string& lit : sorted(a.getPreconditions(), *this)) out << " " << lit;
        out << ")\n";
        out << "    :effect (and";
        for (const std::string& lit : sorted(a.getEffects(), *this)) out << " " << lit;
        out << ")\n";
        out << "  )\n";
    }
    out << ")\n";
}

void PddlWriter::writeProblem(std::ostream& out) const {
    out << "(define (problem " << Action::sanitizeName(_problem.getName()) << ")\n";
    out << "  (:domain " << domainName() << ")\n";
    out << "  (:init\n";
    const State& init = _problem.getInitialState();
    for (size_t f = 0; f < init.size(); f++) {
        if (init[f]) out << "    " << toPddl(_vocab.getFluent(f)) << "\n";
    }
    out << "  )\n";
    out << "  (:goal (and";
    for (const Signature& lit : _problem.getGoal()) out << " " << toPddl(lit);
    out << "))\n";
    out << ")\n";
}

bool PddlWriter::writeFiles(const std::string& domainFile, const std::string& problemFile) const {
    std::ofstream domain(domainFile);
    if (!domain.is_open()) {
        Log::w("Cannot open %s for writing\n", domainFile.c_str());
        return false;
    }
    writeDomain(domain);
    std::ofstream problem(problemFile);
    if (!problem.is_open()) {
        Log::w("Cannot open %s for writing\n", problemFile.c_str());
        return false;
    }
    writeProblem(problem);
    domain.flush();
    problem.flush();
    Log::v("Wrote %s and %s\n", domainFile.c_str(), problemFile.c_str());
    return domain.good() && problem.good();
}
