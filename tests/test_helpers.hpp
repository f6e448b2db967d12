#ifndef BRANCHMESH_TEST_HELPERS_HPP
#define BRANCHMESH_TEST_HELPERS_HPP

#include "geometry.hpp"
#include <cstdint>
#include <vector>

namespace branchmesh {
namespace test {

inline SkeletonPoint make_point(const Vec3& position,
                                float radius = 0.1f,
                                MaterialId material_id = 0,
                                float uv_scale = 1.0f) {
    SkeletonPoint p;
    p.position = position;
    p.orientation = Quat::identity();
    p.radius = radius;
    p.color = Vec4::one();
    p.material_id = material_id;
    p.uv_scale = uv_scale;
    return p;
}

// Single strand skeleton from a list of points
inline Skeleton make_skeleton(const std::vector<SkeletonPoint>& points) {
    Skeleton s;
    for (size_t i = 0; i < points.size(); ++i) {
        s.add_node(points[i], i == 0);
    }
    return s;
}

// Straight vertical strand of `segments` unit-length segments
inline Skeleton vertical_strand(size_t segments, float radius = 0.1f, MaterialId material = 0) {
    std::vector<SkeletonPoint> points;
    for (size_t i = 0; i <= segments; ++i) {
        points.push_back(make_point(Vec3(0.0f, static_cast<float>(i), 0.0f), radius, material));
    }
    return make_skeleton(points);
}

inline bool all_finite(const std::vector<Vec3>& values) {
    for (const auto& v : values) {
        if (!v.is_finite()) return false;
    }
    return true;
}

inline uint32_t read_le_u32(const std::vector<uint8_t>& bytes, size_t offset) {
    return static_cast<uint32_t>(bytes[offset]) |
           (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
           (static_cast<uint32_t>(bytes[offset + 3]) << 24);
}

}  // namespace test
}  // namespace branchmesh

#endif // BRANCHMESH_TEST_HELPERS_HPP
