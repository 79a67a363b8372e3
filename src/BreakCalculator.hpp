// Entry point combining force, pressure and bone correlation per layer count.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ForceModel.hpp"
#include "Material.hpp"

struct BreakResult {
    int layers{1};
    double force{0.0};     // lbf
    double pressure{0.0};  // psi
    std::vector<std::string> bones;
    std::optional<AccuracyAdvisory> advisory;
};

class BreakCalculator {
public:
    explicit BreakCalculator(MaterialCatalog catalog = MaterialCatalog());

    // Throws BreakError; no partial result is produced.
    BreakResult evaluate(const std::string& materialName, int layers,
                         const StackConfiguration& configuration,
                         const PhysicalConstants& constants = PhysicalConstants()) const;

    // One result per layer count in [firstLayer, lastLayer].
    std::vector<BreakResult> evaluateMatrix(const std::string& materialName, int firstLayer, int lastLayer,
                                            const StackConfiguration& configuration,
                                            const PhysicalConstants& constants = PhysicalConstants()) const;

    const MaterialCatalog& catalog() const { return catalog_; }

private:
    const MaterialCatalog catalog_;
};
