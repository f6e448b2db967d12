#include "obj_exporter.hpp"
#include <iomanip>
#include <sstream>

namespace branchmesh {

std::string mesh_to_obj(const MeshBucket& bucket,
                        const std::string& object_name,
                        uint32_t vertex_offset) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6);

    ss << "o " << object_name << "\n";

    for (const auto& p : bucket.positions) {
        ss << "v " << p.x << " " << p.y << " " << p.z << "\n";
    }

    bool with_normals = bucket.has_normals();
    if (with_normals) {
        for (const auto& n : bucket.normals) {
            ss << "vn " << n.x << " " << n.y << " " << n.z << "\n";
        }
    }

    // OBJ indices are 1-based; normals share the vertex index
    for (size_t i = 0; i + 2 < bucket.indices.size(); i += 3) {
        uint32_t a = bucket.indices[i] + 1 + vertex_offset;
        uint32_t b = bucket.indices[i + 1] + 1 + vertex_offset;
        uint32_t c = bucket.indices[i + 2] + 1 + vertex_offset;
        if (with_normals) {
            ss << "f " << a << "//" << a << " " << b << "//" << b << " " << c << "//" << c << "\n";
        } else {
            ss << "f " << a << " " << b << " " << c << "\n";
        }
    }

    return ss.str();
}

std::string meshes_to_obj(const MeshBuckets& buckets, const std::string& base_name) {
    std::string combined;
    uint32_t vertex_offset = 0;

    for (const auto& [material_id, bucket] : buckets) {
        std::string object_name = base_name + "_mat" + std::to_string(material_id);
        combined += mesh_to_obj(bucket, object_name, vertex_offset);
        vertex_offset += static_cast<uint32_t>(bucket.vertex_count());
    }

    return combined;
}

}  // namespace branchmesh
