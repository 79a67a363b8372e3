// Error type raised by the calculation core.
#pragma once

#include <stdexcept>
#include <string>

enum class BreakErrorKind {
    UnknownMaterial,
    InvalidMaterialDefinition,
    InvalidLayerCount,
    InvalidContactArea,
    InvalidConstant,
    InvalidSpacing
};

const char* toString(BreakErrorKind kind);

// Every core failure is an input-validation failure; the caller decides how to report it.
class BreakError : public std::runtime_error {
public:
    BreakError(BreakErrorKind kind, const std::string& message);

    BreakErrorKind kind() const { return kind_; }

private:
    BreakErrorKind kind_;
};
