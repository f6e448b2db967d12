#ifndef BRANCHMESH_SERIALIZATION_SKELETON_JSON_HPP
#define BRANCHMESH_SERIALIZATION_SKELETON_JSON_HPP

#include <nlohmann/json.hpp>
#include <skeleton/skeleton.hpp>
#include "config_json.hpp"
#include "json_serialization.hpp"
#include <stdexcept>

namespace branchmesh {

// SkeletonPoint serialization; absent fields take the SkeletonPoint defaults
inline void to_json(nlohmann::json& j, const SkeletonPoint& point) {
    j = {
        {"position", point.position},
        {"orientation", point.orientation},
        {"radius", point.radius},
        {"color", point.color},
        {"material_id", point.material_id},
        {"uv_scale", point.uv_scale}
    };
}

inline void from_json(const nlohmann::json& j, SkeletonPoint& point) {
    SkeletonPoint defaults;
    point.position = j.value("position", defaults.position);
    point.orientation = j.value("orientation", defaults.orientation);
    point.radius = j.value("radius", defaults.radius);
    point.color = j.value("color", defaults.color);

    int material = j.value("material_id", static_cast<int>(defaults.material_id));
    if (material < 0 || material > 255) {
        throw std::runtime_error("material_id out of range: " + std::to_string(material));
    }
    point.material_id = static_cast<MaterialId>(material);

    point.uv_scale = j.value("uv_scale", defaults.uv_scale);
    if (point.radius < 0.0f) {
        throw std::runtime_error("radius must be non-negative");
    }
    if (point.uv_scale <= 0.0f) {
        throw std::runtime_error("uv_scale must be positive");
    }
}

// Skeleton serialization
inline nlohmann::json skeleton_to_json(const Skeleton& skeleton) {
    nlohmann::json j;
    j["strands"] = skeleton.strands;
    return j;
}

// Accepts a bare {"strands": [...]} document or one wrapped in the
// versioned envelope
inline Skeleton skeleton_from_json(const nlohmann::json& j) {
    const nlohmann::json& body = json::payload(j);
    if (!body.is_object() || !body.contains("strands")) {
        throw std::runtime_error("Skeleton JSON must contain a 'strands' array");
    }
    Skeleton skeleton;
    skeleton.strands = body["strands"].get<std::vector<Strand>>();
    return skeleton;
}

}  // namespace branchmesh

#endif // BRANCHMESH_SERIALIZATION_SKELETON_JSON_HPP
