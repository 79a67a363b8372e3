// Global configuration constants for the breaking calculator.
#pragma once

namespace config {

// ======= Physical constants =======
// Standard gravity (m/s²).
constexpr double kStandardGravity = 9.80665;
// 1 lbf expressed in newtons.
constexpr double kNewtonsPerPoundForce = 4.4482216152605;
// Spacing is entered in millimetres, free-fall uses metres.
constexpr double kMillimetersPerMeter = 1000.0;

// ======= Default model constants (overridable from the command line) =======
// Duration of the strike impulse (s).
constexpr double kDefaultImpactTime = 0.005;
// Striking surface contact area (in²), from biomechanical strike data.
constexpr double kDefaultContactArea = 2.5;
// Multi-layer exponent for flexible stacks: F = F1 * n^k.
constexpr double kDefaultScalingExponent = 1.5;
// Pegged force never drops below this fraction of the unassisted F1 * n.
constexpr double kDefaultPeggedFloorFraction = 0.5;

// Share of the fragment momentum that actually helps the next layer break.
// Wood fragments bend away and help less than concrete shards.
namespace pegged_assist {
    constexpr double kFlexible = 0.5;
    constexpr double kBrittle = 1.0;
}

// ======= Spacing presets for pegged stacks (mm) =======
namespace spacing_preset {
    constexpr double kPennyMm = 1.52;   // US penny, the default spacer
    constexpr double kPencilMm = 6.35;  // carpenter pencil
}

// ======= Layer range =======
// Beyond this count the scaling models are extrapolating.
constexpr int kMaxAccurateLayers = 10;
// Hard ceiling on any requested stack or matrix range.
constexpr int kMaxLayers = 1000;
constexpr int kMatrixFirstLayer = 1;
constexpr int kMatrixLastLayer = 10;

// ======= Files =======
constexpr const char* kDefaultCsvPath = "breaking_matrix.csv";
constexpr const char* kDefaultMaterialsPath = "materials.json";

// ======= Plot =======
constexpr unsigned int kPlotWidth = 960;
constexpr unsigned int kPlotHeight = 600;
constexpr float kPlotMargin = 70.0f;
constexpr unsigned int kPlotFontSize = 16;
// Font search order for plot labels.
constexpr const char* kFontPathPrimary = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
constexpr const char* kFontPathSecondary = "/usr/share/fonts/TTF/DejaVuSans.ttf";
constexpr const char* kFontPathFallback = "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf";

}  // namespace config
