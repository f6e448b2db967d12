#include <gtest/gtest.h>
#include "geometry.hpp"
#include "obj_exporter.hpp"
#include "export_format.hpp"
#include "test_helpers.hpp"
#include <sstream>

using namespace branchmesh;
using namespace branchmesh::test;

namespace {

struct ObjCounts {
    size_t objects = 0;
    size_t vertices = 0;
    size_t normals = 0;
    size_t faces = 0;
};

ObjCounts count_lines(const std::string& obj) {
    ObjCounts counts;
    std::istringstream in(obj);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("o ", 0) == 0) counts.objects++;
        else if (line.rfind("v ", 0) == 0) counts.vertices++;
        else if (line.rfind("vn ", 0) == 0) counts.normals++;
        else if (line.rfind("f ", 0) == 0) counts.faces++;
    }
    return counts;
}

MeshBucket single_triangle() {
    MeshBucket bucket;
    bucket.positions = {Vec3(0.0f, 0.0f, 0.0f), Vec3(1.0f, 0.0f, 0.0f), Vec3(0.0f, 1.0f, 0.0f)};
    bucket.normals = {vec3::unit_z(), vec3::unit_z(), vec3::unit_z()};
    bucket.indices = {0, 1, 2};
    return bucket;
}

}  // namespace

TEST(ObjExportTest, SingleTriangle) {
    std::string obj = mesh_to_obj(single_triangle(), "tri");
    EXPECT_EQ(obj,
              "o tri\n"
              "v 0.000000 0.000000 0.000000\n"
              "v 1.000000 0.000000 0.000000\n"
              "v 0.000000 1.000000 0.000000\n"
              "vn 0.000000 0.000000 1.000000\n"
              "vn 0.000000 0.000000 1.000000\n"
              "vn 0.000000 0.000000 1.000000\n"
              "f 1//1 2//2 3//3\n");
}

TEST(ObjExportTest, OffsetShiftsFaceIndices) {
    std::string obj = mesh_to_obj(single_triangle(), "tri", 10);
    EXPECT_NE(obj.find("f 11//11 12//12 13//13\n"), std::string::npos);
}

TEST(ObjExportTest, WithoutNormals) {
    MeshBucket bucket = single_triangle();
    bucket.normals.clear();
    std::string obj = mesh_to_obj(bucket, "bare");
    EXPECT_EQ(obj.find("vn "), std::string::npos);
    EXPECT_NE(obj.find("f 1 2 3\n"), std::string::npos);
}

TEST(ObjExportTest, TubeCounts) {
    MeshBuckets meshes = build_tube_meshes(vertical_strand(2));
    std::string obj = meshes_to_obj(meshes, "tree");
    ObjCounts counts = count_lines(obj);
    EXPECT_EQ(counts.objects, 1u);
    EXPECT_EQ(counts.vertices, 27u);
    EXPECT_EQ(counts.normals, 27u);
    EXPECT_EQ(counts.faces, 2u * 8u * 2u);
    EXPECT_EQ(obj.rfind("o tree_mat0\n", 0), 0u);
}

TEST(ObjExportTest, MultipleBucketsAccumulateOffsets) {
    MeshBuckets meshes;
    meshes[0] = single_triangle();
    meshes[5] = single_triangle();
    std::string obj = meshes_to_obj(meshes, "lsystem");

    size_t first = obj.find("o lsystem_mat0\n");
    size_t second = obj.find("o lsystem_mat5\n");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);

    EXPECT_NE(obj.find("f 1//1 2//2 3//3\n"), std::string::npos);
    EXPECT_NE(obj.find("f 4//4 5//5 6//6\n"), std::string::npos);
}

TEST(ObjExportTest, EmptyBucketsGiveEmptyText) {
    EXPECT_TRUE(meshes_to_obj({}, "lsystem").empty());
}

TEST(ExportFormatTest, FromPath) {
    EXPECT_EQ(export_format_from_path("out/tree.obj"), ExportFormat::Obj);
    EXPECT_EQ(export_format_from_path("TREE.GLB"), ExportFormat::Glb);
    EXPECT_FALSE(export_format_from_path("tree.fbx").has_value());
    EXPECT_FALSE(export_format_from_path("dir.glb/tree").has_value());
    EXPECT_FALSE(export_format_from_path("tree").has_value());
}

TEST(ExportFormatTest, Names) {
    EXPECT_STREQ(export_format_name(ExportFormat::Glb), "GLB");
    EXPECT_STREQ(export_format_extension(ExportFormat::Obj), "obj");
}
