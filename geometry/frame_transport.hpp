#ifndef BRANCHMESH_GEOMETRY_FRAME_TRANSPORT_HPP
#define BRANCHMESH_GEOMETRY_FRAME_TRANSPORT_HPP

#include "skeleton.hpp"
#include "quat.hpp"
#include "vec3.hpp"
#include <vector>

namespace branchmesh {

// Local forward axis of every frame; tube rings lie in the XZ plane
constexpr Vec3 FRAME_FORWARD = vec3::unit_y();

// Rotation taking unit vector `from` onto unit vector `to`.
// Nearly parallel inputs give the identity. Nearly opposite inputs give a half
// turn about an axis perpendicular to `from`, so the result never degrades to
// NaN the way a bare cross-product construction does.
Quat rotation_arc(const Vec3& from, const Vec3& to);

// Bisector of the incoming and outgoing directions at a bend. Falls back to
// the incoming direction when the two nearly cancel (fold-back).
Vec3 miter_tangent(const Vec3& incoming, const Vec3& outgoing);

// Parallel-transport frames along filtered points, one per point.
// Returns an empty vector when fewer than two points are given.
std::vector<Quat> compute_frames(const std::vector<SkeletonPoint>& points);

}  // namespace branchmesh

#endif // BRANCHMESH_GEOMETRY_FRAME_TRANSPORT_HPP
