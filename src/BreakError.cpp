// BreakError implementation.
#include "BreakError.hpp"

const char* toString(BreakErrorKind kind) {
    switch (kind) {
        case BreakErrorKind::UnknownMaterial: return "UnknownMaterial";
        case BreakErrorKind::InvalidMaterialDefinition: return "InvalidMaterialDefinition";
        case BreakErrorKind::InvalidLayerCount: return "InvalidLayerCount";
        case BreakErrorKind::InvalidContactArea: return "InvalidContactArea";
        case BreakErrorKind::InvalidConstant: return "InvalidConstant";
        case BreakErrorKind::InvalidSpacing: return "InvalidSpacing";
    }
    return "Unknown";
}

BreakError::BreakError(BreakErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}
