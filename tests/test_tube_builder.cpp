#include <gtest/gtest.h>
#include "geometry.hpp"
#include "test_helpers.hpp"
#include <cmath>

using namespace branchmesh;
using namespace branchmesh::test;

// ============================================
// Basic mesh generation
// ============================================

TEST(TubeBuilderTest, EmptySkeleton) {
    Skeleton skeleton;
    MeshBuckets meshes = build_tube_meshes(skeleton);
    EXPECT_TRUE(meshes.empty());
}

TEST(TubeBuilderTest, SinglePointStrandIsSkipped) {
    Skeleton skeleton = make_skeleton({make_point(vec3::zero())});
    EXPECT_TRUE(build_tube_meshes(skeleton).empty());
}

TEST(TubeBuilderTest, SingleSegmentCounts) {
    Skeleton skeleton = vertical_strand(1);
    MeshBuckets meshes = build_tube_meshes(skeleton);

    ASSERT_EQ(meshes.count(0), 1u);
    const MeshBucket& mesh = meshes.at(0);

    // 2 rings * (8 resolution + 1 wrap duplicate)
    EXPECT_EQ(mesh.positions.size(), 18u);
    EXPECT_EQ(mesh.normals.size(), 18u);
    EXPECT_EQ(mesh.colors.size(), 18u);
    EXPECT_EQ(mesh.uvs.size(), 18u);
    EXPECT_EQ(mesh.indices.size(), 8u * 6u);
}

TEST(TubeBuilderTest, IndicesStayInBucket) {
    Skeleton skeleton = vertical_strand(5);
    for (const auto& [id, mesh] : build_tube_meshes(skeleton)) {
        for (uint32_t idx : mesh.indices) {
            EXPECT_LT(idx, mesh.vertex_count());
        }
    }
}

TEST(TubeBuilderTest, RingGeometry) {
    Skeleton skeleton = vertical_strand(1, 0.5f);
    TubeMeshConfig config;
    config.resolution = 4;
    MeshBucket mesh = build_tube_meshes(skeleton, config).at(0);

    ASSERT_EQ(mesh.vertex_count(), 10u);
    for (size_t i = 0; i < mesh.vertex_count(); ++i) {
        const Vec3& p = mesh.positions[i];
        float center_y = i < 5 ? 0.0f : 1.0f;
        // Ring lies in the plane perpendicular to the strand at the given radius
        EXPECT_NEAR(p.y, center_y, 1e-5f);
        EXPECT_NEAR(std::sqrt(p.x * p.x + p.z * p.z), 0.5f, 1e-5f);

        // Normal is the unit outward radial direction
        const Vec3& n = mesh.normals[i];
        EXPECT_NEAR(n.length(), 1.0f, 1e-5f);
        EXPECT_NEAR(n.y, 0.0f, 1e-5f);
        EXPECT_NEAR(n.x * 0.5f, p.x, 1e-5f);
        EXPECT_NEAR(n.z * 0.5f, p.z, 1e-5f);
    }

    // Wrap vertex duplicates the first vertex of its ring
    EXPECT_NEAR(mesh.positions[4].x, mesh.positions[0].x, 1e-5f);
    EXPECT_NEAR(mesh.positions[4].z, mesh.positions[0].z, 1e-5f);
}

TEST(TubeBuilderTest, TriangleWinding) {
    Skeleton skeleton = vertical_strand(1);
    TubeMeshConfig config;
    config.resolution = 3;
    MeshBucket mesh = build_tube_meshes(skeleton, config).at(0);

    // Bottom ring starts at 0, top ring at resolution + 1
    ASSERT_GE(mesh.indices.size(), 6u);
    EXPECT_EQ(mesh.indices[0], 0u);
    EXPECT_EQ(mesh.indices[1], 4u);
    EXPECT_EQ(mesh.indices[2], 1u);
    EXPECT_EQ(mesh.indices[3], 1u);
    EXPECT_EQ(mesh.indices[4], 4u);
    EXPECT_EQ(mesh.indices[5], 5u);
}

TEST(TubeBuilderTest, VertexColorsFollowPoints) {
    SkeletonPoint a = make_point(Vec3(0.0f, 0.0f, 0.0f));
    a.color = Vec4(1.0f, 0.0f, 0.0f, 1.0f);
    SkeletonPoint b = make_point(Vec3(0.0f, 1.0f, 0.0f));
    b.color = Vec4(0.0f, 0.0f, 1.0f, 0.5f);

    MeshBucket mesh = build_tube_meshes(make_skeleton({a, b})).at(0);
    ASSERT_EQ(mesh.colors.size(), 18u);
    EXPECT_EQ(mesh.colors.front(), a.color);
    EXPECT_EQ(mesh.colors[8], a.color);
    EXPECT_EQ(mesh.colors[9], b.color);
    EXPECT_EQ(mesh.colors.back(), b.color);
}

// ============================================
// Ring sharing
// ============================================

TEST(TubeBuilderTest, SameMaterialSharesRings) {
    // N segments of one material -> N + 1 rings
    const size_t segments = 4;
    Skeleton skeleton = vertical_strand(segments);
    TubeMeshConfig config;
    config.resolution = 6;
    MeshBucket mesh = build_tube_meshes(skeleton, config).at(0);

    EXPECT_EQ(mesh.vertex_count(), (segments + 1) * 7u);
    EXPECT_EQ(mesh.indices.size(), segments * 6u * 6u);
}

TEST(TubeBuilderTest, SeparateStrandsDoNotShare) {
    Skeleton skeleton;
    skeleton.add_node(make_point(Vec3(0.0f, 0.0f, 0.0f)), true);
    skeleton.add_node(make_point(Vec3(0.0f, 1.0f, 0.0f)), false);
    skeleton.add_node(make_point(Vec3(0.0f, 1.0f, 0.0f)), true);
    skeleton.add_node(make_point(Vec3(0.0f, 2.0f, 0.0f)), false);

    MeshBucket mesh = build_tube_meshes(skeleton).at(0);
    EXPECT_EQ(mesh.vertex_count(), 4u * 9u);
    EXPECT_EQ(mesh.indices.size(), 2u * 8u * 6u);
}

// ============================================
// Resolution clamping
// ============================================

TEST(TubeBuilderTest, ClampResolution) {
    EXPECT_EQ(clamp_resolution(0), 3);
    EXPECT_EQ(clamp_resolution(-5), 3);
    EXPECT_EQ(clamp_resolution(2), 3);
    EXPECT_EQ(clamp_resolution(3), 3);
    EXPECT_EQ(clamp_resolution(12), 12);
    EXPECT_EQ(clamp_resolution(128), 128);
    EXPECT_EQ(clamp_resolution(500), 128);
}

TEST(TubeBuilderTest, LowResolutionIsClampedNotRejected) {
    TubeMeshConfig config;
    config.resolution = 1;
    MeshBucket mesh = build_tube_meshes(vertical_strand(1), config).at(0);
    EXPECT_EQ(mesh.vertex_count(), 2u * 4u);
    EXPECT_EQ(mesh.indices.size(), 3u * 6u);
}

TEST(TubeBuilderTest, HighResolutionIsClamped) {
    TubeMeshConfig config;
    config.resolution = 1000;
    MeshBucket mesh = build_tube_meshes(vertical_strand(1), config).at(0);
    EXPECT_EQ(mesh.vertex_count(), 2u * 129u);
    EXPECT_EQ(mesh.indices.size(), 128u * 6u);
}

TEST(TubeBuilderTest, BuildIsRepeatable) {
    Skeleton skeleton = make_skeleton({
        make_point(Vec3(0.0f, 0.0f, 0.0f)),
        make_point(Vec3(0.3f, 1.0f, 0.0f), 0.08f),
        make_point(Vec3(0.1f, 2.0f, 0.4f), 0.05f, 1)
    });
    MeshBuckets first = build_tube_meshes(skeleton);
    MeshBuckets second = build_tube_meshes(skeleton);

    ASSERT_EQ(first.size(), second.size());
    for (const auto& [id, mesh] : first) {
        const MeshBucket& other = second.at(id);
        EXPECT_EQ(mesh.positions, other.positions);
        EXPECT_EQ(mesh.indices, other.indices);
    }
}

TEST(TubeBuilderTest, BoundingBox) {
    MeshBucket mesh = build_tube_meshes(vertical_strand(2, 0.25f)).at(0);
    auto [min_pt, max_pt] = mesh.bounding_box();
    EXPECT_NEAR(min_pt.y, 0.0f, 1e-5f);
    EXPECT_NEAR(max_pt.y, 2.0f, 1e-5f);
    EXPECT_NEAR(max_pt.x, 0.25f, 1e-5f);
    EXPECT_NEAR(min_pt.x, -0.25f, 1e-5f);
}
