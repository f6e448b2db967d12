#include <gtest/gtest.h>
#include "geometry.hpp"
#include "test_helpers.hpp"
#include <numbers>

using namespace branchmesh;
using namespace branchmesh::test;

static void expect_vec_near(const Vec3& a, const Vec3& b, float tol = 1e-4f) {
    EXPECT_NEAR(a.x, b.x, tol);
    EXPECT_NEAR(a.y, b.y, tol);
    EXPECT_NEAR(a.z, b.z, tol);
}

// ============================================
// rotation_arc
// ============================================

TEST(RotationArcTest, NearlyParallelIsIdentity) {
    Vec3 to = Vec3(0.001f, 1.0f, 0.0f).normalized();
    EXPECT_EQ(rotation_arc(vec3::unit_y(), to), Quat::identity());
}

TEST(RotationArcTest, AntiparallelIsHalfTurn) {
    Quat q = rotation_arc(vec3::unit_y(), -vec3::unit_y());
    EXPECT_TRUE(q.is_finite());
    expect_vec_near(q * vec3::unit_y(), -vec3::unit_y());
}

TEST(RotationArcTest, AntiparallelAlongX) {
    // |from.x| >= 0.8 must use the secondary reference axis
    Quat q = rotation_arc(vec3::unit_x(), -vec3::unit_x());
    EXPECT_TRUE(q.is_finite());
    expect_vec_near(q * vec3::unit_x(), -vec3::unit_x());
}

TEST(RotationArcTest, GeneralBend) {
    Vec3 to = Vec3(0.0f, 1.0f, 1.0f).normalized();
    Quat q = rotation_arc(vec3::unit_y(), to);
    expect_vec_near(q * vec3::unit_y(), to);
}

// ============================================
// miter_tangent
// ============================================

TEST(MiterTangentTest, BisectsBend) {
    Vec3 m = miter_tangent(vec3::unit_y(), vec3::unit_x());
    expect_vec_near(m, Vec3(1.0f, 1.0f, 0.0f).normalized());
}

TEST(MiterTangentTest, FoldBackUsesIncoming) {
    Vec3 m = miter_tangent(vec3::unit_y(), -vec3::unit_y());
    expect_vec_near(m, vec3::unit_y());
}

// ============================================
// compute_frames
// ============================================

TEST(FrameTransportTest, TooFewPoints) {
    EXPECT_TRUE(compute_frames({}).empty());
    EXPECT_TRUE(compute_frames({make_point(vec3::zero())}).empty());
}

TEST(FrameTransportTest, OneFramePerPoint) {
    std::vector<SkeletonPoint> points = {
        make_point(Vec3(0.0f, 0.0f, 0.0f)),
        make_point(Vec3(0.0f, 1.0f, 0.0f)),
        make_point(Vec3(1.0f, 2.0f, 0.0f)),
        make_point(Vec3(1.0f, 3.0f, 1.0f))
    };
    EXPECT_EQ(compute_frames(points).size(), points.size());
}

TEST(FrameTransportTest, SeedAlignsWithFirstSegment) {
    // Declared orientation points forward along +Y, segment runs along +X
    std::vector<SkeletonPoint> points = {
        make_point(Vec3(0.0f, 0.0f, 0.0f)),
        make_point(Vec3(2.0f, 0.0f, 0.0f))
    };
    auto frames = compute_frames(points);
    ASSERT_EQ(frames.size(), 2u);
    expect_vec_near(frames[0] * FRAME_FORWARD, vec3::unit_x());
    expect_vec_near(frames[1] * FRAME_FORWARD, vec3::unit_x());
}

TEST(FrameTransportTest, SeedKeepsDeclaredOrientationWhenAligned) {
    // Already aligned: the declared roll around the axis must survive
    Quat roll = Quat::from_axis_angle(vec3::unit_y(), 0.7f);
    SkeletonPoint a = make_point(Vec3(0.0f, 0.0f, 0.0f));
    a.orientation = roll;
    SkeletonPoint b = make_point(Vec3(0.0f, 1.0f, 0.0f));

    auto frames = compute_frames({a, b});
    ASSERT_EQ(frames.size(), 2u);
    expect_vec_near(frames[0] * vec3::unit_x(), roll * vec3::unit_x());
}

TEST(FrameTransportTest, InteriorFrameFollowsMiter) {
    std::vector<SkeletonPoint> points = {
        make_point(Vec3(0.0f, 0.0f, 0.0f)),
        make_point(Vec3(0.0f, 1.0f, 0.0f)),
        make_point(Vec3(1.0f, 1.0f, 0.0f))
    };
    auto frames = compute_frames(points);
    ASSERT_EQ(frames.size(), 3u);
    expect_vec_near(frames[1] * FRAME_FORWARD, Vec3(1.0f, 1.0f, 0.0f).normalized());
    // Last point uses the incoming direction only
    expect_vec_near(frames[2] * FRAME_FORWARD, vec3::unit_x());
}

TEST(FrameTransportTest, StraightStrandHasNoTwist) {
    std::vector<SkeletonPoint> points;
    for (int i = 0; i < 10; ++i) {
        points.push_back(make_point(Vec3(0.0f, static_cast<float>(i), 0.0f)));
    }
    auto frames = compute_frames(points);
    ASSERT_EQ(frames.size(), points.size());
    Vec3 side0 = frames.front() * vec3::unit_x();
    for (const auto& frame : frames) {
        expect_vec_near(frame * vec3::unit_x(), side0);
    }
}

TEST(FrameTransportTest, FramesStayOrthonormal) {
    std::vector<SkeletonPoint> points;
    for (int i = 0; i < 32; ++i) {
        float t = static_cast<float>(i) * 0.3f;
        points.push_back(make_point(Vec3(std::cos(t), t * 0.2f, std::sin(t))));
    }
    for (const auto& frame : compute_frames(points)) {
        EXPECT_NEAR(frame.length_squared(), 1.0f, 1e-4f);
        Vec3 fwd = frame * FRAME_FORWARD;
        Vec3 side = frame * vec3::unit_x();
        EXPECT_NEAR(fwd.dot(side), 0.0f, 1e-4f);
    }
}

TEST(FrameTransportTest, FoldBackStaysFinite) {
    std::vector<SkeletonPoint> points = {
        make_point(Vec3(0.0f, 0.0f, 0.0f)),
        make_point(Vec3(0.0f, 1.0f, 0.0f)),
        make_point(Vec3(0.0f, 0.0f, 0.0f))
    };
    auto frames = compute_frames(points);
    ASSERT_EQ(frames.size(), 3u);
    for (const auto& frame : frames) {
        EXPECT_TRUE(frame.is_finite());
    }
    expect_vec_near(frames[2] * FRAME_FORWARD, -vec3::unit_y());
}
