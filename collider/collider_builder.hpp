#ifndef BRANCHMESH_COLLIDER_COLLIDER_BUILDER_HPP
#define BRANCHMESH_COLLIDER_COLLIDER_BUILDER_HPP

#include "skeleton.hpp"
#include "quat.hpp"
#include "vec3.hpp"
#include <optional>
#include <variant>
#include <vector>

namespace branchmesh {

namespace shape {

// Capsule aligned with the local Y axis.
// Total extent along the axis is cylinder_length + 2 * radius.
struct Capsule {
    float radius = 0.0f;
    float cylinder_length = 0.0f;
};

struct Sphere {
    float radius = 0.0f;
};

}  // namespace shape

using ColliderShape = std::variant<shape::Capsule, shape::Sphere>;

float shape_radius(const ColliderShape& s);

// Extent of the shape along its local Y axis
float shape_extent(const ColliderShape& s);

struct Transform {
    Vec3 translation;
    Quat rotation;
};

// One collision primitive placed in world space
struct PositionedCollider {
    Transform transform;
    ColliderShape shape;
    float radius = 0.0f;              // Average radius of the source segment
    float length = 0.0f;              // Length of the source segment
};

// Sub-shape of a compound body, relative to the body origin
struct CompoundChild {
    Vec3 translation;
    Quat rotation;
    ColliderShape shape;
};

struct CompoundCollider {
    std::vector<CompoundChild> children;
};

struct ColliderConfig {
    float min_radius = 0.0f;          // Segments thinner than this get no collider
};

// One collider per qualifying segment of every strand
std::vector<PositionedCollider> build_collider_parts(const Skeleton& skeleton,
                                                     const ColliderConfig& config = ColliderConfig{});

// Merge positioned colliders into a single compound shape.
// Returns nullopt when there is nothing to merge.
std::optional<CompoundCollider> make_compound(const std::vector<PositionedCollider>& parts);

// All qualifying segments as one compound body, nullopt when there are none
std::optional<CompoundCollider> build_compound_collider(const Skeleton& skeleton,
                                                        const ColliderConfig& config = ColliderConfig{});

}  // namespace branchmesh

#endif // BRANCHMESH_COLLIDER_COLLIDER_BUILDER_HPP
