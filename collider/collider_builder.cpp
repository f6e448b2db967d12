#include "collider_builder.hpp"
#include "frame_transport.hpp"
#include "point_filter.hpp"
#include "logging.hpp"
#include <algorithm>
#include <limits>

namespace branchmesh {

namespace {

void process_strand(const Strand& strand,
                    float min_radius,
                    std::vector<PositionedCollider>& colliders) {
    std::vector<SkeletonPoint> points = filter_points(strand);
    if (points.size() < 2) {
        return;
    }

    for (size_t i = 0; i + 1 < points.size(); ++i) {
        const SkeletonPoint& start = points[i];
        const SkeletonPoint& end = points[i + 1];

        float avg_radius = (start.radius + end.radius) * 0.5f;
        if (avg_radius < min_radius) {
            continue;
        }

        Vec3 segment = end.position - start.position;
        float length = segment.length();
        if (length < std::numeric_limits<float>::epsilon()) {
            continue;
        }

        Vec3 center = (start.position + end.position) * 0.5f;
        Vec3 direction = segment / length;

        // Shapes are authored along +Y
        Quat rotation = rotation_arc(FRAME_FORWARD, direction);

        // Segments shorter than the two caps become spheres
        ColliderShape collider_shape;
        if (length < 2.0f * avg_radius) {
            collider_shape = shape::Sphere{avg_radius};
        } else {
            collider_shape = shape::Capsule{avg_radius, length - 2.0f * avg_radius};
        }

        colliders.push_back(PositionedCollider{
            Transform{center, rotation},
            collider_shape,
            avg_radius,
            length
        });
    }
}

}  // namespace

float shape_radius(const ColliderShape& s) {
    return std::visit([](const auto& v) { return v.radius; }, s);
}

float shape_extent(const ColliderShape& s) {
    if (const auto* capsule = std::get_if<shape::Capsule>(&s)) {
        return capsule->cylinder_length + 2.0f * capsule->radius;
    }
    return 2.0f * std::get<shape::Sphere>(s).radius;
}

std::vector<PositionedCollider> build_collider_parts(const Skeleton& skeleton,
                                                     const ColliderConfig& config) {
    auto log = logging::get_logger();
    std::vector<PositionedCollider> colliders;
    float min_radius = std::max(0.0f, config.min_radius);

    for (const auto& strand : skeleton.strands) {
        if (strand.size() < 2) {
            continue;
        }
        process_strand(strand, min_radius, colliders);
    }

    log->debug("ColliderBuilder: {} colliders from {} strands (min radius {})",
               colliders.size(), skeleton.strands.size(), min_radius);
    return colliders;
}

std::optional<CompoundCollider> make_compound(const std::vector<PositionedCollider>& parts) {
    if (parts.empty()) {
        return std::nullopt;
    }

    CompoundCollider compound;
    compound.children.reserve(parts.size());
    for (const auto& part : parts) {
        compound.children.push_back(CompoundChild{
            part.transform.translation,
            part.transform.rotation,
            part.shape
        });
    }
    return compound;
}

std::optional<CompoundCollider> build_compound_collider(const Skeleton& skeleton,
                                                        const ColliderConfig& config) {
    return make_compound(build_collider_parts(skeleton, config));
}

}  // namespace branchmesh
