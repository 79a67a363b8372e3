// Report formatting.
#include "Report.hpp"

#include <iomanip>
#include <sstream>

#include "BoneTable.hpp"

namespace {
constexpr const char* kDisclaimer =
    "(Note: Bone data approximations for healthy adults; not medical advice.)";

std::string matrixHeading(const StackConfiguration& configuration) {
    std::ostringstream oss;
    oss << "Matrix for " << configurationName(configuration);
    if (const auto* pegged = std::get_if<Pegged>(&configuration)) {
        oss << " (spacing " << pegged->spacingMm << " mm)";
    }
    oss << ":";
    return oss.str();
}
}  // namespace

std::string formatOneDecimal(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value;
    return oss.str();
}

void printResult(std::ostream& out, const BreakResult& result) {
    out << "Layers: " << result.layers << ", Force: " << formatOneDecimal(result.force)
        << " lbf, PSI: " << formatOneDecimal(result.pressure) << "\n";
    out << "Correlated Bones (could potentially break): " << formatBoneList(result.bones) << "\n";
    if (result.advisory) {
        out << "Warning: " << result.advisory->message() << "\n";
    }
    out << kDisclaimer << "\n";
}

void printMatrix(std::ostream& out, const std::vector<BreakResult>& results,
                 const StackConfiguration& configuration) {
    out << matrixHeading(configuration) << "\n";
    out << "| Layers | Force (lbf) | PSI | Correlated Bones |\n";
    out << "|---|---|---|---|\n";
    bool extrapolated = false;
    for (const auto& result : results) {
        out << "| " << result.layers << " | " << formatOneDecimal(result.force) << " | "
            << formatOneDecimal(result.pressure) << " | " << formatBoneList(result.bones) << " |\n";
        extrapolated = extrapolated || result.advisory.has_value();
    }
    if (extrapolated) {
        out << "Warning: rows past " << config::kMaxAccurateLayers
            << " layers are extrapolated and less accurate.\n";
    }
}
