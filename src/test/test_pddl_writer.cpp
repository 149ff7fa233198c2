
#include <assert.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include "util/timer.h"
#include "util/log.h"
#include "util/params.h"
#include "util/errors.h"

#include "algo/problem_assembler.h"
#include "planner/pddl_writer.h"

size_t countOccurrences(const std::string& text, const std::string& pattern) {
    size_t num = 0;
    for (size_t pos = text.find(pattern); pos != std::string::npos; pos = text.find(pattern, pos+1)) num++;
    return num;
}

TopologyDescription smallTopology() {
    TopologyDescription desc;
    desc.docks = {"d1", "d2"};
    desc.adjacencies = {{"d1", "d2"}};
    desc.piles = {{"p1", "d1"}, {"p2", "d2"}};
    desc.robots = {{"r1", 1, 6}};
    desc.containers = {{"c1", 2}};
    return desc;
}

Problem buildProblem(const TopologyDescription& desc) {
    ProblemAssembler assembler(desc, "small test");
    Placement placement;
    placement.robotLocations = {{desc.robots[0].name, "d1"}};
    placement.piles = {{"p1", {desc.containers[0].name}}};
    assembler.setInitialPlacement(placement);
    assembler.addGoal(assembler.containerInPile(desc.containers[0].name, "p2"));
    assembler.addGoal(assembler.literal("robot_at", {desc.robots[0].name, "d2"}, false));
    return assembler.assemble();
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    Problem problem = buildProblem(smallTopology());
    PddlWriter writer(problem);

    std::stringstream domainStream, problemStream;
    writer.writeDomain(domainStream);
    writer.writeProblem(problemStream);
    std::string domain = domainStream.str();
    std::string pddlProblem = problemStream.str();
    Log::d("%s\n%s\n", domain.c_str(), pddlProblem.c_str());

    assert(domain.find("(define (domain dockplan)") == 0);
    assert(domain.find(":negative-preconditions") != std::string::npos);
    assert(domain.find(" r1 - robot") != std::string::npos);
    assert(domain.find(" d1 d2 - dock") != std::string::npos);
    assert(domain.find("(robot_at ?x0 - robot ?x1 - dock)") != std::string::npos);
    // One parameterless action per instance
    assert(countOccurrences(domain, "(:action ") == problem.getNumActions());
    assert(countOccurrences(domain, ":parameters ()") == problem.getNumActions());
    assert(domain.find("(:action move_r1_d1_d2\n") != std::string::npos);
    assert(domain.find("(not (robot_at r1 d1))") != std::string::npos);
    assert(domain.find("(not (slot_used_1 r1))") != std::string::npos);

    assert(pddlProblem.find("(define (problem small_test)") == 0);
    assert(pddlProblem.find("(:domain dockplan)") != std::string::npos);
    assert(pddlProblem.find("(robot_at r1 d1)") != std::string::npos);
    assert(pddlProblem.find("(adjacent d1 d2)") != std::string::npos);
    assert(pddlProblem.find("(weight_2 c1)") != std::string::npos);
    assert(pddlProblem.find("(empty p2)") != std::string::npos);
    assert(pddlProblem.find("(robot_at r1 d2)\n") == std::string::npos);
    assert(pddlProblem.find("(:goal (and (in_pile c1 p2) (not (robot_at r1 d2))))") != std::string::npos);

    // Output is reproducible
    std::stringstream again;
    PddlWriter(problem).writeDomain(again);
    assert(again.str() == domain);

    // Files
    std::string prefix = "test_pddl_writer_" + std::to_string(getpid());
    assert(writer.writeFiles(prefix + "_domain.pddl", prefix + "_problem.pddl"));
    {
        std::ifstream in(prefix + "_domain.pddl");
        std::stringstream content;
        content << in.rdbuf();
        assert(content.str() == domain);
    }
    unlink((prefix + "_domain.pddl").c_str());
    unlink((prefix + "_problem.pddl").c_str());
    assert(!writer.writeFiles("/nonexistent/dir/domain.pddl", "/nonexistent/dir/problem.pddl"));

    // Names which are no valid PDDL names
    {
        TopologyDescription desc = smallTopology();
        desc.robots[0].name = "Robot-1";
        desc.containers[0].name = "7";
        Problem odd = buildProblem(desc);
        std::stringstream out;
        PddlWriter(odd).writeProblem(out);
        assert(out.str().find("(robot_at robot_1 d1)") != std::string::npos);
        assert(out.str().find("(weight_2 e_7)") != std::string::npos);
    }
    {
        TopologyDescription desc = smallTopology();
        desc.containers.push_back({"C1", 4});
        ProblemAssembler assembler(desc);
        Placement placement;
        placement.robotLocations = {{"r1", "d1"}};
        placement.piles = {{"p1", {"c1", "C1"}}};
        assembler.setInitialPlacement(placement);
        Problem clash = assembler.assemble();
        bool thrown = false;
        try {
            PddlWriter clashWriter(clash);
        } catch (const EncodingError& e) {
            thrown = true;
        }
        assert(thrown);
    }

    Log::i("All PDDL writer tests passed.\n");
    return 0;
}
