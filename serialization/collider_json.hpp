#ifndef BRANCHMESH_SERIALIZATION_COLLIDER_JSON_HPP
#define BRANCHMESH_SERIALIZATION_COLLIDER_JSON_HPP

#include <nlohmann/json.hpp>
#include <collider/collider_builder.hpp>
#include "config_json.hpp"
#include <variant>

namespace branchmesh {

namespace shape {

// ColliderShape serialization. Lives beside the shape types so lookup on
// the variant finds it.
inline void to_json(nlohmann::json& j, const ColliderShape& s) {
    if (const auto* capsule = std::get_if<shape::Capsule>(&s)) {
        j = {
            {"shape", "capsule"},
            {"radius", capsule->radius},
            {"cylinder_length", capsule->cylinder_length}
        };
    } else {
        j = {
            {"shape", "sphere"},
            {"radius", std::get<shape::Sphere>(s).radius}
        };
    }
}

}  // namespace shape

// PositionedCollider serialization
inline void to_json(nlohmann::json& j, const PositionedCollider& collider) {
    j = collider.shape;
    j["translation"] = collider.transform.translation;
    j["rotation"] = collider.transform.rotation;
    j["length"] = collider.length;
    j["segment_radius"] = collider.radius;
}

inline nlohmann::json colliders_to_json(const std::vector<PositionedCollider>& colliders) {
    nlohmann::json j;
    j["colliders"] = colliders;
    return j;
}

// CompoundCollider serialization
inline nlohmann::json compound_to_json(const CompoundCollider& compound) {
    nlohmann::json children = nlohmann::json::array();
    for (const auto& child : compound.children) {
        nlohmann::json c = child.shape;
        c["translation"] = child.translation;
        c["rotation"] = child.rotation;
        children.push_back(std::move(c));
    }
    return {{"compound", children}};
}

}  // namespace branchmesh

#endif // BRANCHMESH_SERIALIZATION_COLLIDER_JSON_HPP
