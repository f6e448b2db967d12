#ifndef BRANCHMESH_SKELETON_SKELETON_HPP
#define BRANCHMESH_SKELETON_SKELETON_HPP

#include "vec3.hpp"
#include "vec4.hpp"
#include "quat.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace branchmesh {

using MaterialId = uint8_t;

// One sample along a branch, as emitted by the upstream generator
struct SkeletonPoint {
    Vec3 position;
    Quat orientation;                  // Forward axis is +Y; seeds the first frame only
    float radius = 0.1f;
    Vec4 color = Vec4::one();
    MaterialId material_id = 0;        // Applies to the segment starting here
    float uv_scale = 1.0f;             // Multiplies V accumulated by that segment
};

using Strand = std::vector<SkeletonPoint>;

// Ordered strands of connected points
struct Skeleton {
    std::vector<Strand> strands;

    // Append a point to the last strand, opening a new strand first when
    // requested or when there is none yet
    void add_node(const SkeletonPoint& point, bool start_new_strand);

    size_t point_count() const;

    bool empty() const { return strands.empty(); }
};

}  // namespace branchmesh

#endif // BRANCHMESH_SKELETON_SKELETON_HPP
