// Force to pressure conversion.
#include "Pressure.hpp"

#include <cmath>

#include "BreakError.hpp"

double computePressure(double force, double contactArea) {
    if (!std::isfinite(contactArea) || contactArea <= 0.0) {
        throw BreakError(BreakErrorKind::InvalidContactArea, "Contact area must be positive");
    }
    return force / contactArea;
}
