// Force to pressure conversion.
#pragma once

// psi = lbf / in². Throws BreakError(InvalidContactArea) if contactArea <= 0.
double computePressure(double force, double contactArea);
