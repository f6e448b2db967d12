#include "mesh_bucket.hpp"

namespace branchmesh {

std::pair<Vec3, Vec3> MeshBucket::bounding_box() const {
    if (positions.empty()) {
        return {vec3::zero(), vec3::zero()};
    }

    Vec3 min_pt = positions[0];
    Vec3 max_pt = positions[0];
    for (const auto& p : positions) {
        min_pt = component_min(min_pt, p);
        max_pt = component_max(max_pt, p);
    }
    return {min_pt, max_pt};
}

}  // namespace branchmesh
