// Approximate human bone breaking forces for educational comparison.
#pragma once

#include <string>
#include <vector>

struct BoneThreshold {
    std::string boneName;
    double forceThreshold;  // lbf, healthy adult average
};

// Ordered by ascending threshold. Never modified at runtime.
const std::vector<BoneThreshold>& boneTable();

// Every bone whose threshold is <= force, weakest first.
std::vector<std::string> bonesBreakableAt(double force);

// "Clavicle, Ulna" or the "None (...)" placeholder when empty.
std::string formatBoneList(const std::vector<std::string>& bones);
