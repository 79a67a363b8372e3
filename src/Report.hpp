// Text reports for single results and layer matrices.
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "BreakCalculator.hpp"

// Fixed-point with one decimal, as every report and the CSV prints values.
std::string formatOneDecimal(double value);

void printResult(std::ostream& out, const BreakResult& result);

// Markdown table: | Layers | Force (lbf) | PSI | Correlated Bones |
void printMatrix(std::ostream& out, const std::vector<BreakResult>& results,
                 const StackConfiguration& configuration);
