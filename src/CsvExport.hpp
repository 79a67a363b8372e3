// CSV export of the breaking matrix for every catalog material.
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "BreakCalculator.hpp"

// Joins fields with commas, quoting any field that holds a comma, quote or newline.
std::string formatCsvRow(const std::vector<std::string>& fields);

// Header plus, for each material, pegged (penny spacing) then unpegged rows for layers 1..10.
void writeBreakingMatrixCsv(std::ostream& out, const BreakCalculator& calculator,
                            const PhysicalConstants& constants = PhysicalConstants());

// Throws std::runtime_error if the file cannot be opened.
void writeBreakingMatrixCsv(const std::string& path, const BreakCalculator& calculator,
                            const PhysicalConstants& constants = PhysicalConstants());
