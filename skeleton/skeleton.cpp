#include "skeleton.hpp"

namespace branchmesh {

void Skeleton::add_node(const SkeletonPoint& point, bool start_new_strand) {
    if (start_new_strand || strands.empty()) {
        strands.emplace_back();
    }
    strands.back().push_back(point);
}

size_t Skeleton::point_count() const {
    size_t total = 0;
    for (const auto& strand : strands) {
        total += strand.size();
    }
    return total;
}

}  // namespace branchmesh
