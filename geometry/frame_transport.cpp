#include "frame_transport.hpp"
#include <cmath>
#include <numbers>

namespace branchmesh {

namespace {

constexpr float PARALLEL_DOT_THRESHOLD = 0.9999f;
constexpr float FOLD_BACK_THRESHOLD = 0.001f;

Vec3 segment_direction(const SkeletonPoint& from, const SkeletonPoint& to) {
    return (to.position - from.position).normalized();
}

}  // namespace

Quat rotation_arc(const Vec3& from, const Vec3& to) {
    float dot = from.dot(to);
    if (dot > PARALLEL_DOT_THRESHOLD) {
        return Quat::identity();
    }
    if (dot < -PARALLEL_DOT_THRESHOLD) {
        // Any perpendicular works for a half turn; avoid an axis nearly
        // aligned with `from`
        Vec3 axis = std::abs(from.x) < 0.8f
            ? vec3::unit_x().cross(from).normalized()
            : vec3::unit_y().cross(from).normalized();
        return Quat::from_axis_angle(axis, std::numbers::pi_v<float>);
    }
    return Quat::from_rotation_arc(from, to);
}

Vec3 miter_tangent(const Vec3& incoming, const Vec3& outgoing) {
    Vec3 sum = incoming + outgoing;
    if (sum.length_squared() < FOLD_BACK_THRESHOLD) {
        return incoming;
    }
    return sum.normalized();
}

std::vector<Quat> compute_frames(const std::vector<SkeletonPoint>& points) {
    std::vector<Quat> frames;
    if (points.size() < 2) {
        return frames;
    }
    frames.reserve(points.size());

    // Seed: turn the declared orientation so its forward axis follows the
    // first segment
    Quat current = points[0].orientation.normalized();
    Vec3 first_tangent = segment_direction(points[0], points[1]);
    current = (rotation_arc(current * FRAME_FORWARD, first_tangent) * current).normalized();
    frames.push_back(current);

    for (size_t i = 1; i < points.size(); ++i) {
        Vec3 incoming = segment_direction(points[i - 1], points[i]);
        Vec3 tangent = incoming;
        if (i + 1 < points.size()) {
            tangent = miter_tangent(incoming, segment_direction(points[i], points[i + 1]));
        }

        Quat bend = rotation_arc(current * FRAME_FORWARD, tangent);
        current = (bend * current).normalized();
        frames.push_back(current);
    }

    return frames;
}

}  // namespace branchmesh
