#ifndef BRANCHMESH_GEOMETRY_HPP
#define BRANCHMESH_GEOMETRY_HPP

// Geometry layer public API
// Turns a branching Skeleton into tube meshes and collision primitives

#include "vec3.hpp"
#include "vec4.hpp"
#include "quat.hpp"
#include "skeleton.hpp"
#include "point_filter.hpp"
#include "frame_transport.hpp"
#include "mesh_bucket.hpp"
#include "tube_builder.hpp"
#include "collider_builder.hpp"

namespace branchmesh {

// Main entry points
//
// Usage:
//   Skeleton skeleton = /* from the generator */;
//
//   TubeMeshConfig tube;
//   tube.resolution = 12;
//   MeshBuckets meshes = build_tube_meshes(skeleton, tube);
//
//   ColliderConfig colliders;
//   colliders.min_radius = 0.05f;
//   auto body = build_compound_collider(skeleton, colliders);
//
//   // Export for other tools
//   std::string obj = meshes_to_obj(meshes, "tree");
//   std::vector<uint8_t> glb = meshes_to_glb(meshes, default_material_palette());

} // namespace branchmesh

#endif // BRANCHMESH_GEOMETRY_HPP
