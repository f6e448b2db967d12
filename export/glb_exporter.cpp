#include "glb_exporter.hpp"
#include "logging.hpp"
#include <bit>
#include <limits>
#include <stdexcept>

namespace branchmesh {

namespace {

void append_u32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

void append_f32(std::vector<uint8_t>& out, float value) {
    append_u32(out, std::bit_cast<uint32_t>(value));
}

void pad_to_4(std::vector<uint8_t>& out, uint8_t fill) {
    while (out.size() % 4 != 0) {
        out.push_back(fill);
    }
}

uint32_t read_u32(const std::vector<uint8_t>& bytes, size_t offset) {
    if (offset + 4 > bytes.size()) {
        throw std::runtime_error("GLB truncated at offset " + std::to_string(offset));
    }
    return static_cast<uint32_t>(bytes[offset]) |
           (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
           (static_cast<uint32_t>(bytes[offset + 3]) << 24);
}

nlohmann::json asset_json() {
    return {{"version", "2.0"}, {"generator", "branchmesh"}};
}

// Accumulates the binary buffer together with its views and accessors
struct BufferBuilder {
    std::vector<uint8_t> bin;
    nlohmann::json buffer_views = nlohmann::json::array();
    nlohmann::json accessors = nlohmann::json::array();

    // Start a 4-byte aligned region and return its offset
    size_t begin_region() {
        pad_to_4(bin, 0);
        return bin.size();
    }

    size_t add_view(size_t offset, int target) {
        buffer_views.push_back({
            {"buffer", 0},
            {"byteOffset", offset},
            {"byteLength", bin.size() - offset},
            {"target", target}
        });
        return buffer_views.size() - 1;
    }

    size_t add_accessor(nlohmann::json accessor) {
        accessors.push_back(std::move(accessor));
        return accessors.size() - 1;
    }

    size_t add_vec3(const std::vector<Vec3>& values, bool with_bounds) {
        size_t offset = begin_region();
        for (const auto& v : values) {
            append_f32(bin, v.x);
            append_f32(bin, v.y);
            append_f32(bin, v.z);
        }
        size_t view = add_view(offset, glb::ARRAY_BUFFER);

        nlohmann::json accessor = {
            {"bufferView", view},
            {"componentType", glb::FLOAT},
            {"count", values.size()},
            {"type", "VEC3"}
        };
        if (with_bounds) {
            Vec3 min_pt(std::numeric_limits<float>::max(),
                        std::numeric_limits<float>::max(),
                        std::numeric_limits<float>::max());
            Vec3 max_pt = -min_pt;
            for (const auto& v : values) {
                min_pt = component_min(min_pt, v);
                max_pt = component_max(max_pt, v);
            }
            accessor["min"] = {min_pt.x, min_pt.y, min_pt.z};
            accessor["max"] = {max_pt.x, max_pt.y, max_pt.z};
        }
        return add_accessor(std::move(accessor));
    }

    size_t add_vec4(const std::vector<Vec4>& values) {
        size_t offset = begin_region();
        for (const auto& v : values) {
            append_f32(bin, v.x);
            append_f32(bin, v.y);
            append_f32(bin, v.z);
            append_f32(bin, v.w);
        }
        size_t view = add_view(offset, glb::ARRAY_BUFFER);
        return add_accessor({
            {"bufferView", view},
            {"componentType", glb::FLOAT},
            {"count", values.size()},
            {"type", "VEC4"}
        });
    }

    size_t add_indices(const std::vector<uint32_t>& indices) {
        size_t offset = begin_region();
        for (uint32_t i : indices) {
            append_u32(bin, i);
        }
        size_t view = add_view(offset, glb::ELEMENT_ARRAY_BUFFER);
        return add_accessor({
            {"bufferView", view},
            {"componentType", glb::UNSIGNED_INT},
            {"count", indices.size()},
            {"type", "SCALAR"}
        });
    }
};

nlohmann::json material_json(MaterialId id, const MaterialSettings& s) {
    Vec3 emissive = emissive_factor(s);
    return {
        {"name", "Material_" + std::to_string(id)},
        {"pbrMetallicRoughness", {
            {"baseColorFactor", {s.base_color.x, s.base_color.y, s.base_color.z, 1.0f}},
            {"metallicFactor", s.metallic},
            {"roughnessFactor", s.roughness}
        }},
        {"emissiveFactor", {emissive.x, emissive.y, emissive.z}}
    };
}

std::vector<uint8_t> build_empty_glb() {
    nlohmann::json doc = {
        {"asset", asset_json()},
        {"scene", 0},
        {"scenes", nlohmann::json::array({{{"name", "Empty"}}})}
    };
    return pack_glb(doc.dump(), {});
}

}  // namespace

std::vector<uint8_t> meshes_to_glb(const MeshBuckets& buckets,
                                   const MaterialSettingsMap& settings) {
    auto log = logging::get_logger();

    BufferBuilder buffer;
    nlohmann::json materials = nlohmann::json::array();
    nlohmann::json meshes = nlohmann::json::array();
    nlohmann::json nodes = nlohmann::json::array();

    // One material per bucket, indexed in ascending id order
    for (const auto& [id, bucket] : buckets) {
        materials.push_back(material_json(id, settings_for(settings, id)));
    }

    size_t material_index = 0;
    for (const auto& [id, bucket] : buckets) {
        size_t this_material = material_index++;
        if (bucket.empty()) {
            continue;
        }

        nlohmann::json attributes;
        attributes["POSITION"] = buffer.add_vec3(bucket.positions, true);
        if (bucket.has_normals()) {
            attributes["NORMAL"] = buffer.add_vec3(bucket.normals, false);
        }
        if (bucket.has_colors()) {
            attributes["COLOR_0"] = buffer.add_vec4(bucket.colors);
        }

        nlohmann::json primitive = {
            {"attributes", attributes},
            {"material", this_material}
        };
        if (!bucket.indices.empty()) {
            primitive["indices"] = buffer.add_indices(bucket.indices);
        }

        std::string suffix = "mat" + std::to_string(id);
        meshes.push_back({
            {"name", "mesh_" + suffix},
            {"primitives", nlohmann::json::array({primitive})}
        });
        nodes.push_back({
            {"name", "node_" + suffix},
            {"mesh", meshes.size() - 1}
        });
    }

    if (nodes.empty()) {
        log->debug("GLB export: no geometry, writing empty scene");
        return build_empty_glb();
    }

    nlohmann::json node_indices = nlohmann::json::array();
    for (size_t i = 0; i < nodes.size(); ++i) {
        node_indices.push_back(i);
    }

    buffer.begin_region();
    nlohmann::json doc = {
        {"asset", asset_json()},
        {"scene", 0},
        {"scenes", nlohmann::json::array({{{"name", "LSystem"}, {"nodes", node_indices}}})},
        {"nodes", nodes},
        {"meshes", meshes},
        {"materials", materials},
        {"accessors", buffer.accessors},
        {"bufferViews", buffer.buffer_views},
        {"buffers", nlohmann::json::array({{{"byteLength", buffer.bin.size()}}})}
    };

    log->debug("GLB export: {} meshes, {} accessors, {} binary bytes",
               meshes.size(), buffer.accessors.size(), buffer.bin.size());
    return pack_glb(doc.dump(), buffer.bin);
}

std::vector<uint8_t> pack_glb(const std::string& json_text, const std::vector<uint8_t>& bin) {
    size_t json_padded = (json_text.size() + 3) & ~static_cast<size_t>(3);
    size_t bin_padded = (bin.size() + 3) & ~static_cast<size_t>(3);
    bool has_bin = !bin.empty();

    size_t total_length = glb::HEADER_SIZE + glb::CHUNK_HEADER_SIZE + json_padded;
    if (has_bin) {
        total_length += glb::CHUNK_HEADER_SIZE + bin_padded;
    }

    std::vector<uint8_t> out;
    out.reserve(total_length);

    append_u32(out, glb::MAGIC);
    append_u32(out, glb::VERSION);
    append_u32(out, static_cast<uint32_t>(total_length));

    append_u32(out, static_cast<uint32_t>(json_padded));
    append_u32(out, glb::CHUNK_JSON);
    out.insert(out.end(), json_text.begin(), json_text.end());
    pad_to_4(out, ' ');

    if (has_bin) {
        append_u32(out, static_cast<uint32_t>(bin_padded));
        append_u32(out, glb::CHUNK_BIN);
        out.insert(out.end(), bin.begin(), bin.end());
        pad_to_4(out, 0);
    }

    return out;
}

GlbContents read_glb(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < glb::HEADER_SIZE + glb::CHUNK_HEADER_SIZE) {
        throw std::runtime_error("GLB too short: " + std::to_string(bytes.size()) + " bytes");
    }
    if (read_u32(bytes, 0) != glb::MAGIC) {
        throw std::runtime_error("Not a GLB file (bad magic)");
    }
    uint32_t version = read_u32(bytes, 4);
    if (version != glb::VERSION) {
        throw std::runtime_error("Unsupported GLB version: " + std::to_string(version));
    }
    uint32_t total_length = read_u32(bytes, 8);
    if (total_length != bytes.size()) {
        throw std::runtime_error("GLB length mismatch: header says " +
                                 std::to_string(total_length) + ", got " +
                                 std::to_string(bytes.size()));
    }

    size_t offset = glb::HEADER_SIZE;
    uint32_t json_length = read_u32(bytes, offset);
    if (read_u32(bytes, offset + 4) != glb::CHUNK_JSON) {
        throw std::runtime_error("GLB first chunk is not JSON");
    }
    offset += glb::CHUNK_HEADER_SIZE;
    if (offset + json_length > bytes.size()) {
        throw std::runtime_error("GLB JSON chunk exceeds file length");
    }

    GlbContents contents;
    std::string json_text(bytes.begin() + offset, bytes.begin() + offset + json_length);
    try {
        contents.json = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("GLB JSON chunk is invalid: ") + e.what());
    }
    offset += json_length;

    if (offset < bytes.size()) {
        uint32_t bin_length = read_u32(bytes, offset);
        if (read_u32(bytes, offset + 4) != glb::CHUNK_BIN) {
            throw std::runtime_error("GLB second chunk is not BIN");
        }
        offset += glb::CHUNK_HEADER_SIZE;
        if (offset + bin_length > bytes.size()) {
            throw std::runtime_error("GLB BIN chunk exceeds file length");
        }
        contents.bin.assign(bytes.begin() + offset, bytes.begin() + offset + bin_length);
    }

    return contents;
}

}  // namespace branchmesh
