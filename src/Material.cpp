// Material catalog lookup and override validation.
#include "Material.hpp"

#include <cmath>

#include "BreakError.hpp"

namespace {
double positiveField(const std::string& name, const nlohmann::json& definition, const char* field) {
    if (!definition.contains(field)) {
        throw BreakError(BreakErrorKind::InvalidMaterialDefinition,
                         "Material '" + name + "' is missing '" + field + "'");
    }
    const nlohmann::json& value = definition.at(field);
    if (!value.is_number()) {
        throw BreakError(BreakErrorKind::InvalidMaterialDefinition,
                         "Material '" + name + "': '" + field + "' must be a number");
    }
    double v = value.get<double>();
    if (!std::isfinite(v) || v <= 0.0) {
        throw BreakError(BreakErrorKind::InvalidMaterialDefinition,
                         "Material '" + name + "': '" + field + "' must be positive");
    }
    return v;
}

const char* const kBuiltinMenuOrder[] = {"pine", "paulownia", "concrete"};
}  // namespace

const char* toString(MechanicalClass mechanicalClass) {
    return mechanicalClass == MechanicalClass::Flexible ? "flexible" : "brittle";
}

std::optional<MechanicalClass> mechanicalClassFromString(const std::string& s) {
    if (s == "flexible") return MechanicalClass::Flexible;
    if (s == "brittle") return MechanicalClass::Brittle;
    return std::nullopt;
}

MaterialCatalog::MaterialCatalog() : materials_(materialLibrary()) {
    for (const char* name : kBuiltinMenuOrder) {
        menuOrder_.emplace_back(name);
    }
}

const Material& MaterialCatalog::resolve(const std::string& name) const {
    auto it = materials_.find(name);
    if (it == materials_.end()) {
        throw BreakError(BreakErrorKind::UnknownMaterial, "Unknown material: " + name);
    }
    return it->second;
}

bool MaterialCatalog::contains(const std::string& name) const {
    return materials_.count(name) > 0;
}

std::vector<std::string> MaterialCatalog::names() const {
    std::vector<std::string> result;
    result.reserve(materials_.size());
    for (const auto& [name, material] : materials_) {
        result.push_back(name);
    }
    return result;
}

Material MaterialCatalog::parseDefinition(const std::string& name, const nlohmann::json& definition) {
    if (name.empty()) {
        throw BreakError(BreakErrorKind::InvalidMaterialDefinition, "Material name must not be empty");
    }
    if (!definition.is_object()) {
        throw BreakError(BreakErrorKind::InvalidMaterialDefinition,
                         "Material '" + name + "' must be an object with F1, m and type");
    }

    Material material;
    material.name = name;
    material.singleLayerForce = positiveField(name, definition, "F1");
    material.mass = positiveField(name, definition, "m");

    if (!definition.contains("type") || !definition.at("type").is_string()) {
        throw BreakError(BreakErrorKind::InvalidMaterialDefinition,
                         "Material '" + name + "' needs a 'type' of flexible or brittle");
    }
    auto mechanicalClass = mechanicalClassFromString(definition.at("type").get<std::string>());
    if (!mechanicalClass) {
        throw BreakError(BreakErrorKind::InvalidMaterialDefinition,
                         "Material '" + name + "': unknown type '" +
                             definition.at("type").get<std::string>() + "'");
    }
    material.mechanicalClass = *mechanicalClass;
    return material;
}

void MaterialCatalog::loadOverrides(const nlohmann::json& source) {
    if (!source.is_object()) {
        throw BreakError(BreakErrorKind::InvalidMaterialDefinition,
                         "Material overrides must be an object keyed by material name");
    }

    std::vector<Material> parsed;
    for (auto it = source.begin(); it != source.end(); ++it) {
        parsed.push_back(parseDefinition(it.key(), it.value()));
    }

    for (auto& material : parsed) {
        if (materials_.count(material.name) == 0) {
            menuOrder_.push_back(material.name);
        }
        materials_[material.name] = std::move(material);
    }
}
