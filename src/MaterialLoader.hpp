// Reads material override files (JSON).
#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "Material.hpp"

class MaterialFileLoader {
public:
    // Throws std::runtime_error if the file cannot be opened and
    // BreakError(InvalidMaterialDefinition) if it is not valid JSON.
    nlohmann::json load(const std::string& path);

    // load() + MaterialCatalog::loadOverrides().
    void applyTo(MaterialCatalog& catalog, const std::string& path);
};
