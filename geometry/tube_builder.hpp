#ifndef BRANCHMESH_GEOMETRY_TUBE_BUILDER_HPP
#define BRANCHMESH_GEOMETRY_TUBE_BUILDER_HPP

#include "mesh_bucket.hpp"
#include "skeleton.hpp"
#include <vector>

namespace branchmesh {

constexpr int MIN_RESOLUTION = 3;
constexpr int MAX_RESOLUTION = 128;

// Circumference below which V falls back to a unit scale factor
constexpr float MIN_CIRCUMFERENCE = 1e-4f;

struct TubeMeshConfig {
    int resolution = 8;               // Vertices around each ring (before the wrap duplicate)
};

// Clamp a requested ring resolution to [MIN_RESOLUTION, MAX_RESOLUTION]
int clamp_resolution(int requested);

// Running V coordinate per point of a filtered strand.
// V[0] = 0 and each segment adds length / circumference * uv_scale of its
// start point, so V stays continuous where the radius tapers.
std::vector<float> accumulate_v(const std::vector<SkeletonPoint>& points);

// Append the tube for one strand to `buckets`.
// Consecutive segments with the same material share their boundary ring.
void build_strand_mesh(const Strand& strand, int resolution, MeshBuckets& buckets);

// Build tube meshes for every strand, one bucket per material id
MeshBuckets build_tube_meshes(const Skeleton& skeleton,
                              const TubeMeshConfig& config = TubeMeshConfig{});

}  // namespace branchmesh

#endif // BRANCHMESH_GEOMETRY_TUBE_BUILDER_HPP
