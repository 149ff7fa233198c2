
#include <assert.h>
#include <functional>

#include "util/timer.h"
#include "util/log.h"
#include "util/params.h"
#include "util/errors.h"

#include "algo/constraint_encoder.h"

TopologyDescription lineTopology(bool exclusiveDocks) {
    TopologyDescription desc;
    desc.docks = {"d1", "d2", "d3"};
    desc.adjacencies = {{"d1", "d2"}, {"d2", "d3"}};
    desc.exclusiveDocks = exclusiveDocks;
    desc.piles = {{"p1", "d1"}, {"p2", "d2"}, {"p3", "d3"}};
    desc.robots = {{"r1", 2, 6}, {"r2", 0, 5}};
    desc.containers = {{"c1", 2}, {"c2", 4}, {"c3", 2}};
    return desc;
}

Placement linePlacement() {
    Placement placement;
    placement.robotLocations = {{"r1", "d1"}, {"r2", "d2"}};
    placement.piles = {{"p1", {"c1", "c2"}}, {"p2", {}}, {"p3", {}}};
    placement.cargo = {{"r1", {"c3"}}};
    return placement;
}

bool throwsConfigurationError(const std::function<void()>& f) {
    try {
        f();
    } catch (const ConfigurationError& e) {
        Log::d("Caught: %s\n", e.what());
        return true;
    }
    return false;
}

void printViolations(const std::vector<std::string>& violations) {
    for (const auto& v : violations) Log::d("  violation: %s\n", v.c_str());
}

void testLoadLevels() {
    auto levels = ConstraintEncoder::computeLoadLevels(1, 6, {2, 4, 6});
    assert(levels.size() == 2);
    assert((levels[0] == std::vector<int>{0}));
    assert((levels[1] == std::vector<int>{2, 4, 6}));

    levels = ConstraintEncoder::computeLoadLevels(2, 6, {2, 4, 6});
    assert((levels[2] == std::vector<int>{4, 6}));

    // Two 4t containers never fit below a threshold of 5t
    levels = ConstraintEncoder::computeLoadLevels(2, 5, {4});
    assert((levels[1] == std::vector<int>{4}));
    assert(levels[2].empty());

    levels = ConstraintEncoder::computeLoadLevels(0, 10, {2, 4, 6});
    assert(levels.size() == 1);
    assert((levels[0] == std::vector<int>{0}));
}

void testVocabulary() {
    Registry registry(lineTopology(false));
    Vocabulary vocab = ConstraintEncoder::buildVocabulary(registry);
    ConstraintEncoder enc(registry, vocab);

    int r1 = registry.nameId("r1"), r2 = registry.nameId("r2");
    int c1 = registry.nameId("c1"), c2 = registry.nameId("c2");
    int d1 = registry.nameId("d1"), d3 = registry.nameId("d3");
    int p1 = registry.nameId("p1");

    assert(!vocab.hasPredicate(Predicates::OCCUPIED));
    assert(vocab.hasFluent(enc.sigAdjacent(d1, d3)));
    assert(!vocab.hasFluent(enc.sigAdjacent(d1, d1)));
    assert(!vocab.hasFluent(enc.sigOn(c1, c1)));
    assert(vocab.hasFluent(enc.sigOn(c1, c2)));

    // Slot fluents only up to the capacity of a robot
    assert(vocab.hasFluent(enc.sigSlotUsed(r1, 2)));
    assert(!vocab.hasFluent(enc.sigSlotUsed(r2, 1)));
    assert(vocab.hasFluent(enc.sigInSlot(r1, 2, c2)));

    // A robot without slots only has the empty load
    assert((enc.getAllLoadLevels(r2) == std::vector<int>{0}));
    assert(enc.getPickupTransitions(r2).empty());
    assert(enc.getPutdownTransitions(r2).empty());
    assert((enc.getAllLoadLevels(r1) == std::vector<int>{0, 2, 4, 6}));
    assert((enc.getLoadLevels(r1, 2) == std::vector<int>{4, 6}));
    assert(enc.getLoadLevels(r1, 3).empty());

    // Static fluents mirror the registry
    assert(enc.staticValue(enc.sigAdjacent(d1, registry.nameId("d2"))));
    assert(!enc.staticValue(enc.sigAdjacent(d1, d3)));
    assert(enc.staticValue(enc.sigPileAt(p1, d1)));
    assert(!enc.staticValue(enc.sigPileAt(p1, d3)));
    assert(enc.staticValue(enc.sigWeight(c2, 4)));
    assert(!enc.staticValue(enc.sigWeight(c2, 2)));
    assert(enc.staticValue(enc.sigMaxWeight(r2, 5)));
    assert(enc.staticValue(enc.sigSlots(r1, 2)));
    assert(!enc.staticValue(enc.sigSlots(r1, 1)));

    for (int r : registry.getRobots()) {
        for (const LoadTransition& t : enc.getPickupTransitions(r)) {
            assert(t.load + t.weight <= registry.getMaxWeight(r));
            assert(t.slot >= 1 && t.slot <= registry.getSlotCapacity(r));
        }
        for (const LoadTransition& t : enc.getPutdownTransitions(r)) {
            assert(t.load - t.weight >= 0);
        }
    }
}

void testEncodeDecode(bool exclusiveDocks) {
    Registry registry(lineTopology(exclusiveDocks));
    Vocabulary vocab = ConstraintEncoder::buildVocabulary(registry);
    ConstraintEncoder enc(registry, vocab);

    PhysicalState physical = enc.resolvePlacement(linePlacement());
    State state = enc.encodeState(physical);
    assert(state.size() == vocab.size());

    PhysicalState decoded;
    std::vector<std::string> violations;
    assert(enc.decodeState(state, decoded, violations));
    assert(violations.empty());
    assert(decoded == physical);
    Log::d("%s\n", enc.toString(decoded).c_str());
    assert(enc.toString(decoded) == "r1@d1[c3] r2@d2[] p1:(c1 c2) p2:() p3:()");

    int r1 = registry.nameId("r1"), r2 = registry.nameId("r2");
    int c1 = registry.nameId("c1"), c2 = registry.nameId("c2"), c3 = registry.nameId("c3");
    int d1 = registry.nameId("d1"), d3 = registry.nameId("d3");
    int p1 = registry.nameId("p1"), p2 = registry.nameId("p2");
    auto corrupted = [&](const std::function<void(State&)>& edit) {
        State s = state;
        edit(s);
        auto violations = enc.checkInvariants(s);
        printViolations(violations);
        return !violations.empty();
    };
    auto set = [&](State& s, const USignature& sig, bool value) {
        int id = vocab.getFluentId(sig);
        assert(id >= 0);
        s[id] = value;
    };

    // Robot at two docks
    assert(corrupted([&](State& s) {set(s, enc.sigRobotAt(r1, d3), true);}));
    // Robot nowhere
    assert(corrupted([&](State& s) {set(s, enc.sigRobotAt(r2, registry.nameId("d2")), false);}));
    // Pile without a top
    assert(corrupted([&](State& s) {set(s, enc.sigTop(c2, p1), false);}));
    // Container held and in a pile
    assert(corrupted([&](State& s) {set(s, enc.sigInPile(c3, p2), true);}));
    // Container in no place at all
    assert(corrupted([&](State& s) {
        set(s, enc.sigHeldBy(c3, r1), false); 
        set(s, enc.sigInSlot(r1, 1, c3), false);
        set(s, enc.sigSlotUsed(r1, 1), false);
    }));
    // Cycle in the on relation
    assert(corrupted([&](State& s) {set(s, enc.sigOn(c1, c2), true);}));
    // Empty flag of a non-empty pile
    assert(corrupted([&](State& s) {set(s, enc.sigEmpty(p1), true);}));
    // at_dock out of sync
    assert(corrupted([&](State& s) {set(s, enc.sigAtDock(c1, d3), true);}));
    // Wrong load level
    assert(corrupted([&](State& s) {set(s, enc.sigLoad(r1, 2), false); set(s, enc.sigLoad(r1, 4), true);}));
    // Gap in the slots
    assert(corrupted([&](State& s) {
        set(s, enc.sigSlotUsed(r1, 1), false); 
        set(s, enc.sigInSlot(r1, 1, c3), false);
        set(s, enc.sigSlotUsed(r1, 2), true); 
        set(s, enc.sigInSlot(r1, 2, c3), true);
    }));
    // Static attribute changed
    assert(corrupted([&](State& s) {set(s, enc.sigWeight(c1, 6), true);}));
    if (exclusiveDocks) {
        assert(corrupted([&](State& s) {set(s, enc.sigOccupied(d1), false);}));
        assert(corrupted([&](State& s) {set(s, enc.sigOccupied(d3), true);}));
    }
    // The unchanged state is still fine
    assert(!corrupted([&](State& s) {}));

    // Wrong number of values
    {
        State s(vocab.size()+1, false);
        assert(!enc.decodeState(s, decoded, violations));
    }
}

void testIllegalPlacements() {
    Registry registry(lineTopology(true));
    Vocabulary vocab = ConstraintEncoder::buildVocabulary(registry);
    ConstraintEncoder enc(registry, vocab);

    auto withEdit = [&](const std::function<void(Placement&)>& edit) {
        return [&enc, edit]() {
            Placement placement = linePlacement();
            edit(placement);
            enc.resolvePlacement(placement);
        };
    };
    assert(!throwsConfigurationError(withEdit([](Placement& p) {})));
    // Two robots at an exclusive dock
    assert(throwsConfigurationError(withEdit([](Placement& p) {p.robotLocations[1].second = "d1";})));
    // Robot without location
    assert(throwsConfigurationError(withEdit([](Placement& p) {p.robotLocations.pop_back();})));
    // Container placed twice
    assert(throwsConfigurationError(withEdit([](Placement& p) {p.piles[1].second.push_back("c1");})));
    // Container missing
    assert(throwsConfigurationError(withEdit([](Placement& p) {p.cargo.clear();})));
    // More containers than slots
    assert(throwsConfigurationError(withEdit([](Placement& p) {
        p.piles[0].second = {}; 
        p.cargo[0].second = {"c1", "c3", "c2"};
    })));
    // Robot without slots holding a container
    assert(throwsConfigurationError(withEdit([](Placement& p) {p.cargo = {{"r2", {"c3"}}};})));
    // Unknown and mistyped names
    assert(throwsConfigurationError(withEdit([](Placement& p) {p.piles[0].second.push_back("c9");})));
    assert(throwsConfigurationError(withEdit([](Placement& p) {p.robotLocations[0].second = "p1";})));

    // Overweight cargo: 2t + 4t fits 6t, 4t + 4t would not
    {
        TopologyDescription desc = lineTopology(false);
        desc.containers = {{"c1", 4}, {"c2", 4}, {"c3", 2}};
        Registry heavyRegistry(desc);
        Vocabulary heavyVocab = ConstraintEncoder::buildVocabulary(heavyRegistry);
        ConstraintEncoder heavyEnc(heavyRegistry, heavyVocab);
        Placement placement = linePlacement();
        placement.piles[0].second = {"c3"};
        placement.cargo[0].second = {"c1", "c2"};
        assert(throwsConfigurationError([&]() {heavyEnc.resolvePlacement(placement);}));
        placement.piles[0].second = {"c2"};
        placement.cargo[0].second = {"c1", "c3"};
        assert(!throwsConfigurationError([&]() {heavyEnc.resolvePlacement(placement);}));
    }
}

int main(int argc, char** argv) {

    Timer::init();

    Parameters params;
    params.init(argc, argv);

    int verbosity = params.getIntParam("v");
    Log::init(verbosity, /*coloredOutput=*/params.isNonzero("co"));

    testLoadLevels();
    testVocabulary();
    testEncodeDecode(/*exclusiveDocks=*/false);
    testEncodeDecode(/*exclusiveDocks=*/true);
    testIllegalPlacements();

    Log::i("All constraint encoder tests passed.\n");
    return 0;
}
