// CSV export implementation.
#include "CsvExport.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "BoneTable.hpp"
#include "Config.hpp"
#include "Logger.hpp"
#include "Report.hpp"

namespace {
std::string escapeField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string spacingField(const StackConfiguration& configuration) {
    if (const auto* pegged = std::get_if<Pegged>(&configuration)) {
        std::ostringstream oss;
        oss << pegged->spacingMm;
        return oss.str();
    }
    return "N/A";
}
}  // namespace

std::string formatCsvRow(const std::vector<std::string>& fields) {
    std::string row;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) row += ',';
        row += escapeField(fields[i]);
    }
    return row;
}

void writeBreakingMatrixCsv(std::ostream& out, const BreakCalculator& calculator,
                            const PhysicalConstants& constants) {
    out << formatCsvRow({"Material", "Config", "Spacing_mm", "Layers", "Force_lbf", "PSI",
                         "Correlated_Bones"})
        << "\n";

    const StackConfiguration configurations[] = {Pegged{config::spacing_preset::kPennyMm}, Unpegged{}};
    for (const auto& name : calculator.catalog().names()) {
        for (const auto& configuration : configurations) {
            auto results = calculator.evaluateMatrix(name, config::kMatrixFirstLayer,
                                                     config::kMatrixLastLayer, configuration, constants);
            for (const auto& result : results) {
                out << formatCsvRow({name, configurationName(configuration), spacingField(configuration),
                                     std::to_string(result.layers), formatOneDecimal(result.force),
                                     formatOneDecimal(result.pressure), formatBoneList(result.bones)})
                    << "\n";
            }
        }
    }
}

void writeBreakingMatrixCsv(const std::string& path, const BreakCalculator& calculator,
                            const PhysicalConstants& constants) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open CSV file for writing: " + path);
    }
    writeBreakingMatrixCsv(file, calculator, constants);
    if (!file) {
        throw std::runtime_error("Failed while writing CSV file: " + path);
    }
    Logger::getInstance().info("CSV matrix for " + std::to_string(calculator.catalog().materials().size()) +
                               " material(s) written to " + path);
}
