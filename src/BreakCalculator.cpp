// BreakCalculator implementation.
#include "BreakCalculator.hpp"

#include <utility>

#include "BoneTable.hpp"
#include "BreakError.hpp"
#include "Pressure.hpp"

BreakCalculator::BreakCalculator(MaterialCatalog catalog) : catalog_(std::move(catalog)) {}

BreakResult BreakCalculator::evaluate(const std::string& materialName, int layers,
                                      const StackConfiguration& configuration,
                                      const PhysicalConstants& constants) const {
    const Material& material = catalog_.resolve(materialName);

    BreakResult result;
    result.layers = layers;
    result.force = computeForce(material, layers, configuration, constants);
    result.pressure = computePressure(result.force, constants.contactArea);
    result.bones = bonesBreakableAt(result.force);
    result.advisory = accuracyAdvisory(layers);
    return result;
}

std::vector<BreakResult> BreakCalculator::evaluateMatrix(const std::string& materialName, int firstLayer,
                                                         int lastLayer,
                                                         const StackConfiguration& configuration,
                                                         const PhysicalConstants& constants) const {
    if (firstLayer < 1 || lastLayer < firstLayer || lastLayer > config::kMaxLayers) {
        throw BreakError(BreakErrorKind::InvalidLayerCount,
                         "Layer range " + std::to_string(firstLayer) + ".." + std::to_string(lastLayer) +
                             " must lie within 1.." + std::to_string(config::kMaxLayers) +
                             " and not run backwards");
    }

    std::vector<BreakResult> results;
    results.reserve(static_cast<size_t>(lastLayer - firstLayer + 1));
    for (int n = firstLayer; n <= lastLayer; ++n) {
        results.push_back(evaluate(materialName, n, configuration, constants));
    }
    return results;
}
