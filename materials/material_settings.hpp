#ifndef BRANCHMESH_MATERIALS_MATERIAL_SETTINGS_HPP
#define BRANCHMESH_MATERIALS_MATERIAL_SETTINGS_HPP

#include "skeleton.hpp"
#include "vec3.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace branchmesh {

// Procedural texture selector. Generating the textures is left to the host.
enum class TextureType {
    None,
    Grid,
    Noise,
    Checker
};

const char* texture_type_name(TextureType type);
std::optional<TextureType> texture_type_from_name(const std::string& name);

// Per-material PBR parameters, colors are RGB in [0, 1]
struct MaterialSettings {
    Vec3 base_color{1.0f, 1.0f, 1.0f};
    Vec3 emission_color{0.0f, 0.0f, 0.0f};
    float emission_strength = 0.0f;
    float roughness = 0.5f;
    float metallic = 0.0f;
    TextureType texture = TextureType::None;
    float uv_scale = 1.0f;

    bool operator==(const MaterialSettings& other) const = default;
};

using MaterialSettingsMap = std::map<MaterialId, MaterialSettings>;

// Starter palette: 0 = green metallic, 1 = cyan emissive, 2 = grey rough
MaterialSettingsMap default_material_palette();

// Settings for `id`, or default-constructed settings when absent
const MaterialSettings& settings_for(const MaterialSettingsMap& settings, MaterialId id);

// Emission color scaled by strength, clamped per channel to [0, 1]
Vec3 emissive_factor(const MaterialSettings& settings);

// Ids added, removed or modified between two snapshots, ascending.
// Hosts call this before re-syncing render materials.
std::vector<MaterialId> changed_material_ids(const MaterialSettingsMap& before,
                                             const MaterialSettingsMap& after);

}  // namespace branchmesh

#endif // BRANCHMESH_MATERIALS_MATERIAL_SETTINGS_HPP
