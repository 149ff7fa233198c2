
#include <assert.h>
#include <set>

#include "util/timer.h"
#include "util/log.h"
#include "util/params.h"

#include "algo/arg_iterator.h"
#include "data/registry.h"

void printSig(const USignature& sig) {
    Log::d("(%i", sig._name_id);
    for (int arg : sig._args) Log::log_notime(Log::V4_DEBUG, " %i", arg);
    Log::log_notime(Log::V4_DEBUG, ")\n"); 
}

size_t countInstantiations(int nameId, std::vector<std::vector<int>> eligibleArgs) {
    std::set<std::vector<int>> seen;
    size_t num = 0;
    for (const auto& sig : ArgIterator(nameId, std::move(eligibleArgs))) {
        assert(sig._name_id == nameId);
        printSig(sig);
        seen.insert(sig._args);
        num++;
    }
    // Each combination exactly once
    assert(seen.size() == num);
    return num;
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    int nameId = 42;

    assert(countInstantiations(nameId, {{1, 2, 3, 4}, {5}, {6, 7}}) == 8);
    assert(countInstantiations(nameId, {{1, 2}}) == 2);
    assert(countInstantiations(nameId, {{1}, {2}, {3}}) == 1);
    assert(countInstantiations(nameId, {}) == 0);
    // No instantiation if one position has no candidates
    assert(countInstantiations(nameId, {{1, 2}, {}, {3}}) == 0);
    assert(countInstantiations(nameId, {{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}, {1, 2, 3, 4, 5, 6, 7, 8}, 
            {1, 2, 3, 4, 5, 6, 7, 8, 9, 10}, {1, 2, 3, 4, 5, 6, 7, 8, 9}}) == 10*8*10*9);

    // Instantiation over entity types
    {
        TopologyDescription desc;
        desc.docks = {"d1", "d2", "d3"};
        desc.piles = {{"p1", "d1"}, {"p2", "d3"}};
        desc.robots = {{"r1", 1, 6}};
        desc.containers = {{"c1", 2}, {"c2", 4}};
        Registry registry(desc);

        ArgIterator it = ArgIterator::getFullInstantiation(nameId, {CONTAINER, PILE}, registry);
        assert(it.size() == 4);
        size_t num = 0;
        for (const auto& sig : it) {
            assert(registry.isOfType(sig._args[0], CONTAINER));
            assert(registry.isOfType(sig._args[1], PILE));
            num++;
        }
        assert(num == 4);

        ArgIterator pairs = ArgIterator::getFullInstantiation(nameId, {DOCK, DOCK}, registry);
        assert(pairs.size() == 9);

        // Predicates without parameters have no instantiation through an iterator
        assert(ArgIterator::getFullInstantiation(nameId, {}, registry).size() == 0);
    }

    Log::i("All argument iterator tests passed.\n");
    return 0;
}
