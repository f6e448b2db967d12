#ifndef BRANCHMESH_GEOMETRY_POINT_FILTER_HPP
#define BRANCHMESH_GEOMETRY_POINT_FILTER_HPP

#include "skeleton.hpp"
#include <vector>

namespace branchmesh {

// Adjacent points closer than this (squared distance) collapse into one
constexpr float DEGENERATE_DISTANCE_SQUARED = 1e-6f;

// Drop points that coincide with the previously kept point.
// The first point is always kept; the result may be shorter than 2 points.
std::vector<SkeletonPoint> filter_points(const Strand& strand);

}  // namespace branchmesh

#endif // BRANCHMESH_GEOMETRY_POINT_FILTER_HPP
