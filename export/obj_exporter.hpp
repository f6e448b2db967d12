#ifndef BRANCHMESH_EXPORT_OBJ_EXPORTER_HPP
#define BRANCHMESH_EXPORT_OBJ_EXPORTER_HPP

#include "mesh_bucket.hpp"
#include <cstdint>
#include <string>

namespace branchmesh {

// One bucket as an OBJ object. `vertex_offset` is added to every face index
// so several objects can share one file; pass 0 for a standalone mesh.
std::string mesh_to_obj(const MeshBucket& bucket,
                        const std::string& object_name,
                        uint32_t vertex_offset = 0);

// All buckets in one OBJ text, objects named "{base_name}_mat{id}".
// No header comments are written.
std::string meshes_to_obj(const MeshBuckets& buckets, const std::string& base_name);

}  // namespace branchmesh

#endif // BRANCHMESH_EXPORT_OBJ_EXPORTER_HPP
