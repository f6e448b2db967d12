#ifndef BRANCHMESH_GEOMETRY_MESH_BUCKET_HPP
#define BRANCHMESH_GEOMETRY_MESH_BUCKET_HPP

#include "skeleton.hpp"
#include "vec3.hpp"
#include "vec4.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace branchmesh {

// Vertex and triangle data for all segments sharing one material.
// Indices refer to vertices of the same bucket only.
struct MeshBucket {
    std::vector<Vec3> positions;
    std::vector<Vec3> normals;
    std::vector<Vec4> colors;
    std::vector<Vec2> uvs;
    std::vector<uint32_t> indices;

    size_t vertex_count() const { return positions.size(); }
    size_t triangle_count() const { return indices.size() / 3; }
    bool empty() const { return positions.empty(); }

    // Normals are only usable when there is one per vertex
    bool has_normals() const {
        return !normals.empty() && normals.size() == positions.size();
    }

    bool has_colors() const {
        return !colors.empty() && colors.size() == positions.size();
    }

    // Axis-aligned bounds of the positions, zero box when empty
    std::pair<Vec3, Vec3> bounding_box() const;
};

// Buckets keyed by material id, iterated in ascending id order
using MeshBuckets = std::map<MaterialId, MeshBucket>;

}  // namespace branchmesh

#endif // BRANCHMESH_GEOMETRY_MESH_BUCKET_HPP
