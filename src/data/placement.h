#ifndef DOCKPLAN_PLACEMENT_H
#define DOCKPLAN_PLACEMENT_H

#include <map>
#include <string>
#include <vector>

// Where all robots and containers are, given by entity names.
// Stacks are listed bottom first; a robot's first container is in slot 1.
struct Placement {
    std::vector<std::pair<std::string, std::string>> robotLocations;
    std::vector<std::pair<std::string, std::vector<std::string>>> piles;
    std::vector<std::pair<std::string, std::vector<std::string>>> cargo;
};

// The same information as Placement in terms of entity IDs.
// Piles and robots without an entry are empty.
struct PhysicalState {
    std::map<int, int> robotLocation;
    std::map<int, std::vector<int>> robotCargo;
    std::map<int, std::vector<int>> pileStack;

    const std::vector<int>& cargoOf(int robot) const {
        static const std::vector<int> NONE;
        auto it = robotCargo.find(robot);
        return it == robotCargo.end() ? NONE : it->second;
    }
    const std::vector<int>& stackOf(int pile) const {
        static const std::vector<int> NONE;
        auto it = pileStack.find(pile);
        return it == pileStack.end() ? NONE : it->second;
    }

    bool operator==(const PhysicalState& other) const {
        // Empty stacks are equivalent to missing entries
        auto sameStacks = [](const std::map<int, std::vector<int>>& a, const std::map<int, std::vector<int>>& b) {
            for (const auto& [key, stack] : a) {
                auto it = b.find(key);
                if (stack.empty() ? (it != b.end() && !it->second.empty()) : (it == b.end() || it->second != stack)) 
                    return false;
            }
            for (const auto& [key, stack] : b) {
                if (!stack.empty() && !a.count(key)) return false;
            }
            return true;
        };
        return robotLocation == other.robotLocation 
            && sameStacks(robotCargo, other.robotCargo) 
            && sameStacks(pileStack, other.pileStack);
    }
    bool operator!=(const PhysicalState& other) const {
        return !(*this == other);
    }
};

#endif
