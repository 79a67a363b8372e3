// Parse material override JSON files.
#include "MaterialLoader.hpp"

#include <fstream>
#include <stdexcept>

#include "BreakError.hpp"
#include "Logger.hpp"

nlohmann::json MaterialFileLoader::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open material file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw BreakError(BreakErrorKind::InvalidMaterialDefinition,
                         "Malformed material file " + path + ": " + e.what());
    }
    return j;
}

void MaterialFileLoader::applyTo(MaterialCatalog& catalog, const std::string& path) {
    nlohmann::json j = load(path);
    catalog.loadOverrides(j);
    Logger::getInstance().info("Loaded " + std::to_string(j.size()) + " material definition(s) from " + path);
}
