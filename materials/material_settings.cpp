#include "material_settings.hpp"
#include <algorithm>
#include <initializer_list>
#include <set>

namespace branchmesh {

const char* texture_type_name(TextureType type) {
    switch (type) {
        case TextureType::None: return "None";
        case TextureType::Grid: return "Grid";
        case TextureType::Noise: return "Noise";
        case TextureType::Checker: return "Checker";
    }
    return "None";
}

std::optional<TextureType> texture_type_from_name(const std::string& name) {
    for (TextureType type : {TextureType::None, TextureType::Grid,
                             TextureType::Noise, TextureType::Checker}) {
        if (name == texture_type_name(type)) {
            return type;
        }
    }
    return std::nullopt;
}

MaterialSettingsMap default_material_palette() {
    MaterialSettingsMap palette;

    palette[0] = MaterialSettings{
        .base_color = {0.2f, 0.8f, 0.2f},
        .emission_color = {0.5f, 1.0f, 0.5f},
        .emission_strength = 0.0f,
        .roughness = 0.2f,
        .metallic = 0.8f
    };

    palette[1] = MaterialSettings{
        .base_color = {1.0f, 1.0f, 1.0f},
        .emission_color = {0.0f, 1.0f, 1.0f},
        .emission_strength = 2.0f,
        .roughness = 0.1f,
        .metallic = 0.0f
    };

    palette[2] = MaterialSettings{
        .base_color = {0.5f, 0.5f, 0.5f},
        .emission_color = {0.0f, 0.0f, 0.0f},
        .emission_strength = 0.0f,
        .roughness = 0.9f,
        .metallic = 0.0f
    };

    return palette;
}

const MaterialSettings& settings_for(const MaterialSettingsMap& settings, MaterialId id) {
    static const MaterialSettings defaults;
    auto it = settings.find(id);
    if (it != settings.end()) {
        return it->second;
    }
    return defaults;
}

Vec3 emissive_factor(const MaterialSettings& settings) {
    Vec3 emissive = settings.emission_color * settings.emission_strength;
    return {
        std::clamp(emissive.x, 0.0f, 1.0f),
        std::clamp(emissive.y, 0.0f, 1.0f),
        std::clamp(emissive.z, 0.0f, 1.0f)
    };
}

std::vector<MaterialId> changed_material_ids(const MaterialSettingsMap& before,
                                             const MaterialSettingsMap& after) {
    std::set<MaterialId> changed;

    for (const auto& [id, settings] : after) {
        auto it = before.find(id);
        if (it == before.end() || !(it->second == settings)) {
            changed.insert(id);
        }
    }
    for (const auto& [id, _] : before) {
        if (after.find(id) == after.end()) {
            changed.insert(id);
        }
    }

    return {changed.begin(), changed.end()};
}

}  // namespace branchmesh
