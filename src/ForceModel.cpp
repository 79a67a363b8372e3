// Force scaling: superlinear flexible, linear brittle, momentum-assisted pegged.
#include "ForceModel.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "BreakError.hpp"

namespace {
double unpeggedForce(const Material& material, int layers, const PhysicalConstants& constants) {
    double n = static_cast<double>(layers);
    if (material.mechanicalClass == MechanicalClass::Flexible) {
        return material.singleLayerForce * std::pow(n, constants.scalingExponent);
    }
    return material.singleLayerForce * n;
}

double peggedForce(const Material& material, int layers, double spacingMm,
                   const PhysicalConstants& constants) {
    double base = material.singleLayerForce * static_cast<double>(layers);
    if (layers == 1 || spacingMm == 0.0) {
        return base;
    }

    double factor = material.mechanicalClass == MechanicalClass::Flexible
                        ? config::pegged_assist::kFlexible
                        : config::pegged_assist::kBrittle;
    double assist = fragmentAssistForce(material.mass, spacingMm, constants.impactTime);
    double reduction = static_cast<double>(layers - 1) * assist * factor;

    // Never easier than a single layer, never below the floor share of the base.
    double floor = std::max(material.singleLayerForce, constants.peggedFloorFraction * base);
    return std::max(base - reduction, floor);
}
}  // namespace

bool isPegged(const StackConfiguration& configuration) {
    return std::holds_alternative<Pegged>(configuration);
}

std::string configurationName(const StackConfiguration& configuration) {
    return isPegged(configuration) ? "pegged" : "unpegged";
}

std::optional<double> spacingPreset(const std::string& name) {
    if (name == "penny") return config::spacing_preset::kPennyMm;
    if (name == "pencil") return config::spacing_preset::kPencilMm;
    return std::nullopt;
}

void validateConstants(const PhysicalConstants& constants) {
    if (!std::isfinite(constants.impactTime) || constants.impactTime <= 0.0) {
        throw BreakError(BreakErrorKind::InvalidConstant, "Impact time must be positive");
    }
    if (!std::isfinite(constants.scalingExponent) || constants.scalingExponent < 1.0) {
        throw BreakError(BreakErrorKind::InvalidConstant, "Scaling exponent must be at least 1");
    }
    if (!std::isfinite(constants.peggedFloorFraction) || constants.peggedFloorFraction <= 0.0 ||
        constants.peggedFloorFraction > 1.0) {
        throw BreakError(BreakErrorKind::InvalidConstant, "Pegged floor fraction must be in (0, 1]");
    }
}

std::string AccuracyAdvisory::message() const {
    std::ostringstream oss;
    oss << layers << " layers exceeds the " << accurateLimit
        << "-layer range the model is calibrated for; treat the result as a rough extrapolation";
    return oss.str();
}

std::optional<AccuracyAdvisory> accuracyAdvisory(int layers) {
    if (layers > config::kMaxAccurateLayers) {
        return AccuracyAdvisory{layers, config::kMaxAccurateLayers};
    }
    return std::nullopt;
}

double fragmentAssistForce(double massKg, double spacingMm, double impactTime) {
    double h = spacingMm / config::kMillimetersPerMeter;
    double v = std::sqrt(2.0 * config::kStandardGravity * h);  // v = sqrt(2gh)
    double forceN = massKg * v / impactTime;                    // F = p / dt
    return forceN / config::kNewtonsPerPoundForce;
}

double computeForce(const Material& material, int layers,
                    const StackConfiguration& configuration,
                    const PhysicalConstants& constants) {
    if (layers < 1 || layers > config::kMaxLayers) {
        throw BreakError(BreakErrorKind::InvalidLayerCount,
                         "Layer count must be between 1 and " + std::to_string(config::kMaxLayers) +
                             ", got " + std::to_string(layers));
    }
    validateConstants(constants);

    double force = 0.0;
    if (const auto* pegged = std::get_if<Pegged>(&configuration)) {
        if (!std::isfinite(pegged->spacingMm) || pegged->spacingMm < 0.0) {
            throw BreakError(BreakErrorKind::InvalidSpacing, "Pegged spacing must be non-negative");
        }
        force = peggedForce(material, layers, pegged->spacingMm, constants);
    } else {
        force = unpeggedForce(material, layers, constants);
    }

    if (!std::isfinite(force)) {
        std::ostringstream oss;
        oss << "Force for " << layers << " layers of " << material.name
            << " overflows; reduce the scaling exponent or the material's F1";
        throw BreakError(BreakErrorKind::InvalidConstant, oss.str());
    }
    return force;
}
