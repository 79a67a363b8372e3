#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include "ForceModel.hpp"
#include "TestHelpers.hpp"

namespace {
const Material kPine{"pine", 200.0, 0.8, MechanicalClass::Flexible};
const Material kConcrete{"concrete", 500.0, 5.5, MechanicalClass::Brittle};
// Heavy enough that fragment assist always hits the floor.
const Material kAnvil{"anvil", 100.0, 1000.0, MechanicalClass::Brittle};
}  // namespace

// ============================================================================
// Unpegged
// ============================================================================

TEST(ForceModelTest, SingleLayerIsBaseForce) {
    for (const auto& [name, material] : materialLibrary()) {
        EXPECT_DOUBLE_EQ(computeForce(material, 1, Unpegged{}, PhysicalConstants{}), material.singleLayerForce)
            << name;
    }
}

TEST(ForceModelTest, FlexibleScalesWithExponent) {
    PhysicalConstants constants;
    for (int n = 1; n <= 10; ++n) {
        EXPECT_DOUBLE_EQ(computeForce(kPine, n, Unpegged{}, constants), 200.0 * std::pow(n, 1.5));
    }
}

TEST(ForceModelTest, PineTwoLayersUnpegged) {
    EXPECT_NEAR(computeForce(kPine, 2, Unpegged{}, PhysicalConstants{}), 565.685, 1e-3);
}

TEST(ForceModelTest, CustomExponentSquaresLayers) {
    PhysicalConstants constants;
    constants.scalingExponent = 2.0;
    EXPECT_DOUBLE_EQ(computeForce(kPine, 3, Unpegged{}, constants), 1800.0);
}

TEST(ForceModelTest, BrittleIsLinear) {
    EXPECT_DOUBLE_EQ(computeForce(kConcrete, 3, Unpegged{}, PhysicalConstants{}), 1500.0);
    EXPECT_DOUBLE_EQ(computeForce(kConcrete, 7, Unpegged{}, PhysicalConstants{}), 3500.0);
}

// ============================================================================
// Pegged
// ============================================================================

TEST(ForceModelTest, FragmentAssistFromFreeFall) {
    double expected = std::sqrt(2.0 * config::kStandardGravity) / config::kNewtonsPerPoundForce;
    EXPECT_NEAR(fragmentAssistForce(1.0, 1000.0, 1.0), expected, 1e-12);
    EXPECT_DOUBLE_EQ(fragmentAssistForce(5.5, 0.0, 0.005), 0.0);
}

TEST(ForceModelTest, ZeroSpacingIsUnassistedBase) {
    for (const auto& [name, material] : materialLibrary()) {
        for (int n = 1; n <= 10; ++n) {
            EXPECT_DOUBLE_EQ(computeForce(material, n, Pegged{0.0}, PhysicalConstants{}),
                             material.singleLayerForce * n)
                << name << " x" << n;
        }
    }
}

TEST(ForceModelTest, PeggedPennyPineSubtractsHalfAssistPerGap) {
    double assist = fragmentAssistForce(0.8, config::spacing_preset::kPennyMm, config::kDefaultImpactTime);
    EXPECT_NEAR(computeForce(kPine, 2, Pegged{}, PhysicalConstants{}), 400.0 - 0.5 * assist, 1e-9);
    EXPECT_NEAR(computeForce(kPine, 5, Pegged{}, PhysicalConstants{}), 1000.0 - 4 * 0.5 * assist, 1e-9);
}

TEST(ForceModelTest, PeggedConcreteUsesFullAssist) {
    double assist = fragmentAssistForce(5.5, config::spacing_preset::kPencilMm, config::kDefaultImpactTime);
    double force = computeForce(kConcrete, 3, Pegged{config::spacing_preset::kPencilMm}, PhysicalConstants{});
    EXPECT_NEAR(force, 1500.0 - 2 * assist, 1e-9);
    EXPECT_LT(force, 1500.0);
}

TEST(ForceModelTest, PeggedSingleLayerIgnoresSpacing) {
    EXPECT_DOUBLE_EQ(computeForce(kConcrete, 1, Pegged{config::spacing_preset::kPencilMm}, PhysicalConstants{}),
                     500.0);
}

TEST(ForceModelTest, PeggedClampsAtFloor) {
    PhysicalConstants constants;
    StackConfiguration pencil = Pegged{config::spacing_preset::kPencilMm};
    EXPECT_DOUBLE_EQ(computeForce(kAnvil, 2, pencil, constants), 100.0);
    EXPECT_DOUBLE_EQ(computeForce(kAnvil, 4, pencil, constants), 200.0);
    EXPECT_DOUBLE_EQ(computeForce(kAnvil, 10, pencil, constants), 500.0);

    // With a small fraction the single-layer force is the binding floor.
    constants.peggedFloorFraction = 0.1;
    EXPECT_DOUBLE_EQ(computeForce(kAnvil, 4, pencil, constants), 100.0);
    EXPECT_DOUBLE_EQ(computeForce(kAnvil, 20, pencil, constants), 200.0);
}

TEST(ForceModelTest, PeggedBetweenFloorAndBase) {
    const Material materials[] = {kPine, kConcrete, kAnvil};
    for (double spacing : {0.0, 1.52, 6.35, 50.0}) {
        for (const auto& material : materials) {
            for (int n = 1; n <= 12; ++n) {
                PhysicalConstants constants;
                double base = material.singleLayerForce * n;
                double force = computeForce(material, n, Pegged{spacing}, constants);
                EXPECT_LE(force, base);
                EXPECT_GE(force, constants.peggedFloorFraction * base);
                EXPECT_GT(force, 0.0);
            }
        }
    }
}

TEST(ForceModelTest, ForceNeverDecreasesWithLayers) {
    const Material materials[] = {kPine, kConcrete, kAnvil};
    const StackConfiguration configurations[] = {Unpegged{}, Pegged{}, Pegged{6.35}, Pegged{40.0}};
    for (const auto& material : materials) {
        for (const auto& configuration : configurations) {
            double previous = 0.0;
            for (int n = 1; n <= 15; ++n) {
                double force = computeForce(material, n, configuration, PhysicalConstants{});
                EXPECT_GE(force, previous) << material.name << " " << configurationName(configuration) << " x" << n;
                previous = force;
            }
        }
    }
}

// ============================================================================
// Validation and advisories
// ============================================================================

TEST(ForceModelTest, RejectsLayerCountBelowOne) {
    expectBreakError([] { computeForce(kPine, 0, Unpegged{}, PhysicalConstants{}); },
                     BreakErrorKind::InvalidLayerCount);
    expectBreakError([] { computeForce(kPine, -3, Pegged{}, PhysicalConstants{}); },
                     BreakErrorKind::InvalidLayerCount);
}

TEST(ForceModelTest, RejectsLayerCountAboveCap) {
    EXPECT_NO_THROW(computeForce(kConcrete, config::kMaxLayers, Unpegged{}, PhysicalConstants{}));
    expectBreakError([] { computeForce(kPine, config::kMaxLayers + 1, Unpegged{}, PhysicalConstants{}); },
                     BreakErrorKind::InvalidLayerCount);
    expectBreakError([] { computeForce(kPine, std::numeric_limits<int>::max(), Pegged{}, PhysicalConstants{}); },
                     BreakErrorKind::InvalidLayerCount);
}

TEST(ForceModelTest, OverflowingForceRejected) {
    PhysicalConstants steep;
    steep.scalingExponent = 400.0;
    expectBreakError([&] { computeForce(kPine, 10, Unpegged{}, steep); }, BreakErrorKind::InvalidConstant);
    EXPECT_TRUE(std::isfinite(computeForce(kPine, 1, Unpegged{}, steep)));

    const Material huge{"huge", 1e308, 1.0, MechanicalClass::Brittle};
    expectBreakError([&] { computeForce(huge, 2, Unpegged{}, PhysicalConstants{}); },
                     BreakErrorKind::InvalidConstant);
    expectBreakError([&] { computeForce(huge, 2, Pegged{0.0}, PhysicalConstants{}); },
                     BreakErrorKind::InvalidConstant);
}

TEST(ForceModelTest, RejectsInvalidConstants) {
    PhysicalConstants zeroTime;
    zeroTime.impactTime = 0.0;
    expectBreakError([&] { computeForce(kPine, 2, Pegged{}, zeroTime); }, BreakErrorKind::InvalidConstant);

    PhysicalConstants shallow;
    shallow.scalingExponent = 0.9;
    expectBreakError([&] { computeForce(kPine, 2, Unpegged{}, shallow); }, BreakErrorKind::InvalidConstant);

    PhysicalConstants noFloor;
    noFloor.peggedFloorFraction = 0.0;
    expectBreakError([&] { computeForce(kPine, 2, Pegged{}, noFloor); }, BreakErrorKind::InvalidConstant);

    PhysicalConstants overFloor;
    overFloor.peggedFloorFraction = 1.5;
    expectBreakError([&] { computeForce(kPine, 2, Pegged{}, overFloor); }, BreakErrorKind::InvalidConstant);
}

TEST(ForceModelTest, ExponentOfOneIsAllowed) {
    PhysicalConstants constants;
    constants.scalingExponent = 1.0;
    EXPECT_DOUBLE_EQ(computeForce(kPine, 4, Unpegged{}, constants), 800.0);
}

TEST(ForceModelTest, RejectsNegativeSpacing) {
    expectBreakError([] { computeForce(kConcrete, 3, Pegged{-1.0}, PhysicalConstants{}); },
                     BreakErrorKind::InvalidSpacing);
}

TEST(ForceModelTest, AdvisoryOnlyPastTenLayers) {
    EXPECT_FALSE(accuracyAdvisory(1).has_value());
    EXPECT_FALSE(accuracyAdvisory(10).has_value());
    auto advisory = accuracyAdvisory(11);
    ASSERT_TRUE(advisory.has_value());
    EXPECT_EQ(advisory->layers, 11);
    EXPECT_EQ(advisory->accurateLimit, 10);
    EXPECT_NE(advisory->message().find("11 layers"), std::string::npos);
}

TEST(ForceModelTest, SpacingPresets) {
    EXPECT_DOUBLE_EQ(*spacingPreset("penny"), 1.52);
    EXPECT_DOUBLE_EQ(*spacingPreset("pencil"), 6.35);
    EXPECT_FALSE(spacingPreset("brick").has_value());
    EXPECT_DOUBLE_EQ(Pegged{}.spacingMm, 1.52);
}
