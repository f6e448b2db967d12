#ifndef BRANCHMESH_EXPORT_GLB_EXPORTER_HPP
#define BRANCHMESH_EXPORT_GLB_EXPORTER_HPP

#include "mesh_bucket.hpp"
#include "material_settings.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace branchmesh {

namespace glb {
    constexpr uint32_t MAGIC = 0x46546C67;        // "glTF"
    constexpr uint32_t VERSION = 2;
    constexpr uint32_t CHUNK_JSON = 0x4E4F534A;   // "JSON"
    constexpr uint32_t CHUNK_BIN = 0x004E4942;    // "BIN\0"
    constexpr uint32_t HEADER_SIZE = 12;
    constexpr uint32_t CHUNK_HEADER_SIZE = 8;

    // bufferView targets
    constexpr int ARRAY_BUFFER = 34962;
    constexpr int ELEMENT_ARRAY_BUFFER = 34963;

    // accessor component types
    constexpr int FLOAT = 5126;
    constexpr int UNSIGNED_INT = 5125;
}

// Serialize mesh buckets to a binary glTF 2.0 container.
// Each bucket becomes one mesh, node and PBR material; ids missing from
// `settings` use default MaterialSettings.
std::vector<uint8_t> meshes_to_glb(const MeshBuckets& buckets,
                                   const MaterialSettingsMap& settings);

// Wrap a JSON document and binary payload in the GLB header and chunks.
// The BIN chunk is omitted when `bin` is empty.
std::vector<uint8_t> pack_glb(const std::string& json_text, const std::vector<uint8_t>& bin);

// Decoded GLB container
struct GlbContents {
    nlohmann::json json;
    std::vector<uint8_t> bin;
};

// Parse a GLB container, throws std::runtime_error when malformed
GlbContents read_glb(const std::vector<uint8_t>& bytes);

}  // namespace branchmesh

#endif // BRANCHMESH_EXPORT_GLB_EXPORTER_HPP
