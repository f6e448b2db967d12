#include "point_filter.hpp"

namespace branchmesh {

std::vector<SkeletonPoint> filter_points(const Strand& strand) {
    std::vector<SkeletonPoint> result;
    if (strand.empty()) {
        return result;
    }

    result.reserve(strand.size());
    result.push_back(strand.front());
    for (size_t i = 1; i < strand.size(); ++i) {
        const Vec3& last = result.back().position;
        if (last.distance_squared_to(strand[i].position) > DEGENERATE_DISTANCE_SQUARED) {
            result.push_back(strand[i]);
        }
    }
    return result;
}

}  // namespace branchmesh
