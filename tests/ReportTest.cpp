#include <gtest/gtest.h>
#include <sstream>

#include "Report.hpp"

TEST(ReportTest, FormatsOneDecimal) {
    EXPECT_EQ(formatOneDecimal(565.685), "565.7");
    EXPECT_EQ(formatOneDecimal(200.0), "200.0");
    EXPECT_EQ(formatOneDecimal(0.04), "0.0");
}

TEST(ReportTest, SingleResult) {
    BreakCalculator calculator;
    std::ostringstream out;
    printResult(out, calculator.evaluate("pine", 2, Unpegged{}));

    EXPECT_EQ(out.str(),
              "Layers: 2, Force: 565.7 lbf, PSI: 226.3\n"
              "Correlated Bones (could potentially break): Clavicle, Skull (fracture), Ulna, Skull (crush)\n"
              "(Note: Bone data approximations for healthy adults; not medical advice.)\n");
}

TEST(ReportTest, SingleResultWithAdvisory) {
    BreakCalculator calculator;
    std::ostringstream out;
    printResult(out, calculator.evaluate("paulownia", 11, Unpegged{}));
    EXPECT_NE(out.str().find("Warning: 11 layers exceeds the 10-layer range"), std::string::npos);
}

TEST(ReportTest, MatrixTable) {
    BreakCalculator calculator;
    StackConfiguration configuration = Pegged{};
    std::ostringstream out;
    printMatrix(out, calculator.evaluateMatrix("concrete", 1, 2, configuration), configuration);

    std::string text = out.str();
    EXPECT_EQ(text.rfind("Matrix for pegged (spacing 1.52 mm):\n"
                         "| Layers | Force (lbf) | PSI | Correlated Bones |\n"
                         "|---|---|---|---|\n"
                         "| 1 | 500.0 | 200.0 | Clavicle, Skull (fracture), Ulna |\n",
                         0),
              0u);
    EXPECT_EQ(text.find("Warning"), std::string::npos);
}

TEST(ReportTest, UnpeggedMatrixHeading) {
    BreakCalculator calculator;
    std::ostringstream out;
    printMatrix(out, calculator.evaluateMatrix("pine", 1, 1, Unpegged{}), Unpegged{});
    EXPECT_EQ(out.str().rfind("Matrix for unpegged:\n", 0), 0u);
}
