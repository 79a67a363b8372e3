// Breaking-force model for stacked layers, pegged or unpegged.
#pragma once

#include <optional>
#include <string>
#include <variant>

#include "Config.hpp"
#include "Material.hpp"

// Layers stacked directly on each other.
struct Unpegged {};

// Layers separated by spacers; falling fragments help break the next layer.
struct Pegged {
    double spacingMm{config::spacing_preset::kPennyMm};
};

using StackConfiguration = std::variant<Unpegged, Pegged>;

bool isPegged(const StackConfiguration& configuration);
// "unpegged" or "pegged"
std::string configurationName(const StackConfiguration& configuration);
// "penny" / "pencil" -> mm
std::optional<double> spacingPreset(const std::string& name);

struct PhysicalConstants {
    double impactTime{config::kDefaultImpactTime};                    // s
    double contactArea{config::kDefaultContactArea};                  // in²
    double scalingExponent{config::kDefaultScalingExponent};          // >= 1
    double peggedFloorFraction{config::kDefaultPeggedFloorFraction};  // (0, 1]
};

// Throws BreakError(InvalidConstant) for a non-positive impact time, exponent < 1,
// or a floor fraction outside (0, 1]. Contact area is checked by computePressure.
void validateConstants(const PhysicalConstants& constants);

// Attached to a result when the layer count is past the calibrated range.
struct AccuracyAdvisory {
    int layers{0};
    int accurateLimit{config::kMaxAccurateLayers};

    std::string message() const;
};

std::optional<AccuracyAdvisory> accuracyAdvisory(int layers);

// Momentum a fragment gains falling through one gap, expressed as lbf over the impact time.
double fragmentAssistForce(double massKg, double spacingMm, double impactTime);

// Total force (lbf) to break `layers` layers of `material`.
// Throws BreakError for layers outside 1..kMaxLayers, invalid constants, negative
// spacing, or a result that overflows to infinity.
double computeForce(const Material& material, int layers,
                    const StackConfiguration& configuration,
                    const PhysicalConstants& constants);
