#include "tube_builder.hpp"
#include "frame_transport.hpp"
#include "point_filter.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <optional>

namespace branchmesh {

namespace {

// Emit resolution + 1 vertices around `center`; the last one repeats the
// first position at U = 1 so the texture wraps cleanly.
uint32_t add_ring(MeshBucket& bucket,
                  const SkeletonPoint& point,
                  const Quat& frame,
                  float v_coord,
                  int resolution) {
    constexpr float TAU = 2.0f * std::numbers::pi_v<float>;
    uint32_t start_index = static_cast<uint32_t>(bucket.positions.size());

    for (int j = 0; j <= resolution; ++j) {
        float u = static_cast<float>(j) / static_cast<float>(resolution);
        float theta = u * TAU;
        float c = std::cos(theta);
        float s = std::sin(theta);

        Vec3 local_normal(c, 0.0f, s);
        Vec3 local_pos = local_normal * point.radius;

        bucket.positions.push_back(point.position + frame * local_pos);
        bucket.normals.push_back(frame * local_normal);
        bucket.colors.push_back(point.color);
        bucket.uvs.emplace_back(u, v_coord);
    }
    return start_index;
}

void connect_rings(MeshBucket& bucket, uint32_t bottom_start, uint32_t top_start, int resolution) {
    for (uint32_t j = 0; j < static_cast<uint32_t>(resolution); ++j) {
        uint32_t bottom_curr = bottom_start + j;
        uint32_t bottom_next = bottom_start + j + 1;
        uint32_t top_curr = top_start + j;
        uint32_t top_next = top_start + j + 1;

        bucket.indices.insert(bucket.indices.end(), {bottom_curr, top_curr, bottom_next});
        bucket.indices.insert(bucket.indices.end(), {bottom_next, top_curr, top_next});
    }
}

}  // namespace

int clamp_resolution(int requested) {
    int clamped = std::clamp(requested, MIN_RESOLUTION, MAX_RESOLUTION);
    if (clamped != requested) {
        logging::get_logger()->warn("Tube resolution {} out of range [{}, {}], using {}",
                                    requested, MIN_RESOLUTION, MAX_RESOLUTION, clamped);
    }
    return clamped;
}

std::vector<float> accumulate_v(const std::vector<SkeletonPoint>& points) {
    constexpr float TAU = 2.0f * std::numbers::pi_v<float>;
    std::vector<float> v(points.size(), 0.0f);

    for (size_t i = 0; i + 1 < points.size(); ++i) {
        const SkeletonPoint& curr = points[i];
        const SkeletonPoint& next = points[i + 1];

        float segment_length = curr.position.distance_to(next.position);
        float circumference = (curr.radius + next.radius) * 0.5f * TAU;
        float v_scale = circumference > MIN_CIRCUMFERENCE ? 1.0f / circumference : 1.0f;

        v[i + 1] = v[i] + segment_length * v_scale * curr.uv_scale;
    }
    return v;
}

void build_strand_mesh(const Strand& strand, int resolution, MeshBuckets& buckets) {
    resolution = std::clamp(resolution, MIN_RESOLUTION, MAX_RESOLUTION);

    std::vector<SkeletonPoint> points = filter_points(strand);
    if (points.size() < 2) {
        return;
    }

    std::vector<Quat> frames = compute_frames(points);
    std::vector<float> v = accumulate_v(points);

    // Top ring of the previous segment, reusable while the material holds
    std::optional<uint32_t> previous_top;
    MaterialId previous_material = 0;

    for (size_t i = 0; i + 1 < points.size(); ++i) {
        const SkeletonPoint& curr = points[i];
        const SkeletonPoint& next = points[i + 1];

        MaterialId material = curr.material_id;
        MeshBucket& bucket = buckets[material];

        uint32_t bottom = 0;
        if (previous_top && previous_material == material) {
            bottom = *previous_top;
        } else {
            bottom = add_ring(bucket, curr, frames[i], v[i], resolution);
        }
        uint32_t top = add_ring(bucket, next, frames[i + 1], v[i + 1], resolution);

        connect_rings(bucket, bottom, top, resolution);

        previous_top = top;
        previous_material = material;
    }
}

MeshBuckets build_tube_meshes(const Skeleton& skeleton, const TubeMeshConfig& config) {
    auto log = logging::get_logger();
    MeshBuckets buckets;

    int resolution = clamp_resolution(config.resolution);
    log->debug("TubeBuilder: building {} strands at resolution {}",
               skeleton.strands.size(), resolution);

    for (const auto& strand : skeleton.strands) {
        if (strand.size() < 2) {
            continue;
        }
        build_strand_mesh(strand, resolution, buckets);
    }

    for (const auto& [material, bucket] : buckets) {
        log->debug("TubeBuilder: material {} -> {} vertices, {} triangles",
                   static_cast<int>(material), bucket.vertex_count(), bucket.triangle_count());
    }
    return buckets;
}

}  // namespace branchmesh
