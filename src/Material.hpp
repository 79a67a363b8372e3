// Breakable material definitions and the name -> material catalog.
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

enum class MechanicalClass {
    Flexible,  // wood: bends before failure, layers reinforce each other
    Brittle    // concrete: each layer fails on its own
};

const char* toString(MechanicalClass mechanicalClass);
std::optional<MechanicalClass> mechanicalClassFromString(const std::string& s);

struct Material {
    std::string name;
    double singleLayerForce{0.0};  // F1, lbf to break one layer
    double mass{0.0};              // kg, one layer
    MechanicalClass mechanicalClass{MechanicalClass::Flexible};
};

// Built-in empirical values for single-layer breaks.
inline const std::map<std::string, Material>& materialLibrary() {
    static const std::map<std::string, Material> kMaterials = {
        {"pine", {"pine", 200.0, 0.8, MechanicalClass::Flexible}},
        {"paulownia", {"paulownia", 100.0, 0.5, MechanicalClass::Flexible}},
        {"concrete", {"concrete", 500.0, 5.5, MechanicalClass::Brittle}}
    };
    return kMaterials;
}

class MaterialCatalog {
public:
    // Starts from materialLibrary().
    MaterialCatalog();

    const Material& resolve(const std::string& name) const;
    bool contains(const std::string& name) const;
    // Sorted by name.
    std::vector<std::string> names() const;
    // Built-ins as listed (pine, paulownia, concrete), then overrides in load order.
    const std::vector<std::string>& menuOrder() const { return menuOrder_; }
    const std::map<std::string, Material>& materials() const { return materials_; }

    // Upserts {"name": {"F1": .., "m": .., "type": "flexible"|"brittle"}} entries.
    // The whole source is validated before anything is replaced.
    void loadOverrides(const nlohmann::json& source);

    static Material parseDefinition(const std::string& name, const nlohmann::json& definition);

private:
    std::map<std::string, Material> materials_;
    std::vector<std::string> menuOrder_;
};
