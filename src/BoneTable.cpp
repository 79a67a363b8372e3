// Bone threshold table and lookup.
#include "BoneTable.hpp"

#include <algorithm>

namespace {
std::vector<BoneThreshold> buildTable() {
    std::vector<BoneThreshold> table = {
        {"Clavicle", 147.0},
        {"Skull (fracture)", 196.0},
        {"Ulna", 337.0},
        {"Skull (crush)", 517.0},
        {"Ribs", 742.0},
        {"Humerus", 787.0},
        {"Femur", 899.0},
        {"Tibia", 900.0}
    };
    std::stable_sort(table.begin(), table.end(), [](const BoneThreshold& a, const BoneThreshold& b) {
        return a.forceThreshold < b.forceThreshold;
    });
    return table;
}
}  // namespace

const std::vector<BoneThreshold>& boneTable() {
    static const std::vector<BoneThreshold> kTable = buildTable();
    return kTable;
}

std::vector<std::string> bonesBreakableAt(double force) {
    std::vector<std::string> bones;
    for (const auto& bone : boneTable()) {
        if (bone.forceThreshold > force) {
            break;
        }
        bones.push_back(bone.boneName);
    }
    return bones;
}

std::string formatBoneList(const std::vector<std::string>& bones) {
    if (bones.empty()) {
        return "None (below typical bone breaking thresholds)";
    }
    std::string joined;
    for (const auto& bone : bones) {
        if (!joined.empty()) joined += ", ";
        joined += bone;
    }
    return joined;
}
