#ifndef BRANCHMESH_SERIALIZATION_CONFIG_JSON_HPP
#define BRANCHMESH_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec3.hpp>
#include <math/vec4.hpp>
#include <math/quat.hpp>
#include <materials/material_settings.hpp>
#include <common/run_config.hpp>
#include <stdexcept>
#include <string>

namespace branchmesh {

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    if (!j.is_array() || j.size() != 3) {
        throw std::runtime_error("Vec3 must be an array of 3 numbers");
    }
    v.x = j[0].get<float>();
    v.y = j[1].get<float>();
    v.z = j[2].get<float>();
}

// Vec4 (RGBA) serialization
inline void to_json(nlohmann::json& j, const Vec4& v) {
    j = nlohmann::json::array({v.x, v.y, v.z, v.w});
}

inline void from_json(const nlohmann::json& j, Vec4& v) {
    if (!j.is_array() || j.size() != 4) {
        throw std::runtime_error("Vec4 must be an array of 4 numbers");
    }
    v.x = j[0].get<float>();
    v.y = j[1].get<float>();
    v.z = j[2].get<float>();
    v.w = j[3].get<float>();
}

// Quat serialization, stored as [w, x, y, z]
inline void to_json(nlohmann::json& j, const Quat& q) {
    j = nlohmann::json::array({q.w, q.x, q.y, q.z});
}

inline void from_json(const nlohmann::json& j, Quat& q) {
    if (!j.is_array() || j.size() != 4) {
        throw std::runtime_error("Quat must be an array [w, x, y, z]");
    }
    q.w = j[0].get<float>();
    q.x = j[1].get<float>();
    q.y = j[2].get<float>();
    q.z = j[3].get<float>();
}

// TextureType serialization (by name)
inline void to_json(nlohmann::json& j, const TextureType& type) {
    j = texture_type_name(type);
}

inline void from_json(const nlohmann::json& j, TextureType& type) {
    std::string name = j.get<std::string>();
    auto parsed = texture_type_from_name(name);
    if (!parsed) {
        throw std::runtime_error("Unknown texture type: " + name);
    }
    type = *parsed;
}

// MaterialSettings serialization
inline void to_json(nlohmann::json& j, const MaterialSettings& s) {
    j = {
        {"base_color", s.base_color},
        {"emission_color", s.emission_color},
        {"emission_strength", s.emission_strength},
        {"roughness", s.roughness},
        {"metallic", s.metallic},
        {"texture", s.texture},
        {"uv_scale", s.uv_scale}
    };
}

inline void from_json(const nlohmann::json& j, MaterialSettings& s) {
    MaterialSettings defaults;
    s.base_color = j.value("base_color", defaults.base_color);
    s.emission_color = j.value("emission_color", defaults.emission_color);
    s.emission_strength = j.value("emission_strength", defaults.emission_strength);
    s.roughness = j.value("roughness", defaults.roughness);
    s.metallic = j.value("metallic", defaults.metallic);
    s.texture = j.value("texture", defaults.texture);
    s.uv_scale = j.value("uv_scale", defaults.uv_scale);
}

// MaterialSettingsMap serialization, keyed by the decimal material id
inline nlohmann::json material_settings_to_json(const MaterialSettingsMap& settings) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [id, s] : settings) {
        j[std::to_string(id)] = s;
    }
    return j;
}

inline MaterialSettingsMap material_settings_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("materials must be an object keyed by material id");
    }
    MaterialSettingsMap settings;
    for (const auto& [key, value] : j.items()) {
        int id = -1;
        size_t consumed = 0;
        try {
            id = std::stoi(key, &consumed);
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid material id: " + key);
        }
        if (consumed != key.size()) {
            id = -1;
        }
        if (id < 0 || id > 255) {
            throw std::runtime_error("Invalid material id: " + key);
        }
        settings[static_cast<MaterialId>(id)] = value.get<MaterialSettings>();
    }
    return settings;
}

// ColliderConfig serialization
inline void to_json(nlohmann::json& j, const ColliderConfig& config) {
    j = {
        {"min_radius", config.min_radius}
    };
}

inline void from_json(const nlohmann::json& j, ColliderConfig& config) {
    config.min_radius = j.value("min_radius", 0.0f);
}

// RunConfig serialization (flat keys)
inline void to_json(nlohmann::json& j, const RunConfig& config) {
    j = {
        {"resolution", config.tube.resolution},
        {"min_collider_radius", config.collider.min_radius},
        {"base_name", config.base_name},
        {"materials", material_settings_to_json(config.materials)}
    };
}

inline void from_json(const nlohmann::json& j, RunConfig& config) {
    RunConfig defaults;
    config.tube.resolution = j.value("resolution", defaults.tube.resolution);
    config.collider.min_radius = j.value("min_collider_radius", defaults.collider.min_radius);
    config.base_name = j.value("base_name", defaults.base_name);
    if (j.contains("materials")) {
        config.materials = material_settings_from_json(j["materials"]);
    } else {
        config.materials = defaults.materials;
    }
}

}  // namespace branchmesh

#endif // BRANCHMESH_SERIALIZATION_CONFIG_JSON_HPP
