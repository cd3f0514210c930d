#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "hydro-mesh/src/Mesh/Mesh.hpp"
#include "hydro-mesh/test/Helpers/LogCapture.hpp"
#include "hydro-mesh/test/Helpers/TestMeshes.hpp"

using namespace hydro_mesh;

// ============================================================================
// Construction
// ============================================================================

TEST(MeshTest, FromArrays)
{
  Eigen::MatrixXd vertices(4, 3);
  vertices << 0, 0, 0,  //
    1, 0, 0,            //
    1, 1, 0,            //
    0, 1, 0;
  Eigen::MatrixXi faces(2, 4);
  faces << 0, 1, 2, 0,  //
    0, 2, 3, 0;

  const Mesh mesh = Mesh::fromArrays(vertices, faces, "square");

  EXPECT_EQ(mesh.getName(), "square");
  EXPECT_EQ(mesh.getVertexCount(), 4u);
  EXPECT_EQ(mesh.getFaceCount(), 2u);
  EXPECT_EQ(mesh.getTriangleCount(), 2u);
  EXPECT_NEAR(mesh.getSurfaceArea(), 1.0, 1e-12);
}

TEST(MeshTest, FromArraysRejectsWrongArity)
{
  const Eigen::MatrixXd vertices2d = Eigen::MatrixXd::Zero(3, 2);
  const Eigen::MatrixXd vertices = Eigen::MatrixXd::Zero(3, 3);
  const Eigen::MatrixXi triangles = Eigen::MatrixXi::Zero(1, 3);
  const Eigen::MatrixXi faces = Eigen::MatrixXi::Zero(1, 4);

  EXPECT_THROW(Mesh::fromArrays(vertices2d, faces), std::invalid_argument);
  EXPECT_THROW(Mesh::fromArrays(vertices, triangles), std::invalid_argument);
}

TEST(MeshTest, FromArraysRejectsNegativeIndex)
{
  const Eigen::MatrixXd vertices = Eigen::MatrixXd::Zero(3, 3);
  Eigen::MatrixXi faces(1, 4);
  faces << 0, 1, -2, 0;

  EXPECT_THROW(Mesh::fromArrays(vertices, faces), std::invalid_argument);
}

TEST(MeshTest, OutOfRangeVertexIndexThrows)
{
  EXPECT_THROW((Mesh{{Coordinate{0.0, 0.0, 0.0}}, {Face{0, 1, 2}}}),
               std::out_of_range);
}

// ============================================================================
// Face classification
// ============================================================================

TEST(MeshTest, TrianglesAndQuadranglesPartitionFaces)
{
  Mesh mesh = test::createUnitCube();
  std::vector<Face> faces = mesh.getFaces();
  faces.push_back(Face{0, 1, 2});
  mesh.setFaces(faces);

  EXPECT_EQ(mesh.getTriangleCount() + mesh.getQuadrangleCount(),
            mesh.getFaceCount());
  EXPECT_EQ(mesh.getTrianglesIds(), (std::vector<size_t>{6}));
  EXPECT_EQ(mesh.getQuadranglesIds().size(), 6u);
}

TEST(MeshTest, FaceAccessors)
{
  const Mesh mesh = test::createSingleTriangle();

  EXPECT_TRUE(mesh.isTriangle(0));
  EXPECT_EQ(mesh.getFace(0), (std::vector<size_t>{0, 1, 2}));
  EXPECT_THROW(static_cast<void>(mesh.getFace(1)), std::out_of_range);
  EXPECT_THROW(static_cast<void>(mesh.isTriangle(3)), std::out_of_range);
}

// ============================================================================
// Closed meshes and boundaries
// ============================================================================

TEST(MeshTest, UnitCubeVolumeAndClosure)
{
  const Mesh cube = test::createUnitCube();

  EXPECT_NEAR(cube.getVolume(), 1.0, 1e-12);
  EXPECT_NEAR(cube.getSurfaceArea(), 6.0, 1e-12);
  EXPECT_TRUE(cube.isMeshClosed());
  EXPECT_EQ(cube.getBoundaryCount(), 0u);
}

TEST(MeshTest, SingleTriangleHasNoVolume)
{
  const Mesh mesh = test::createSingleTriangle();
  const auto& vertices = mesh.getVertices();
  const double expectedArea =
    0.5 * (vertices[1] - vertices[0]).cross(vertices[2] - vertices[0]).norm();

  EXPECT_NEAR(mesh.getVolume(), 0.0, 1e-12);
  EXPECT_NEAR(mesh.getFacesAreas()[0], expectedArea, 1e-12);
  EXPECT_NEAR(mesh.getFacesAreas()[0], 6.0, 1e-12);
  EXPECT_FALSE(mesh.isMeshClosed());
  EXPECT_EQ(mesh.getBoundaryCount(), 1u);
}

TEST(MeshTest, OpenBoundariesMeanNotClosed)
{
  const Mesh mesh{{Coordinate{0.0, 0.0, 0.0},
                   Coordinate{1.0, 0.0, 0.0},
                   Coordinate{1.0, 1.0, 0.0},
                   Coordinate{0.0, 1.0, 0.0}},
                  {Face{0, 1, 2}, Face{0, 3, 2}}};
  test::LogCapture capture;

  EXPECT_FALSE(mesh.isMeshClosed());
  EXPECT_EQ(mesh.getBoundaryCount(), 0u);
  EXPECT_FALSE(mesh.getOpenBoundaries().empty());
}

TEST(MeshTest, PlateIsConformal)
{
  const Mesh plate = MeshFactory::createRectangularPlate(2.0, 1.0, 4, 2);
  test::LogCapture capture;

  EXPECT_TRUE(plate.isMeshConformal());
  EXPECT_EQ(capture.warnings(), 1u);
  EXPECT_TRUE(capture.contains("experimental"));
}

TEST(MeshTest, FoldedSheetIsNotConformal)
{
  // Two copies of the same triangle hinged on edge (0, 1): the boundary
  // 0 -> 2 -> 1 -> 3 collapses onto a curve
  const Mesh folded{{Coordinate{0.0, 0.0, 0.0},
                     Coordinate{1.0, 0.0, 0.0},
                     Coordinate{0.0, 1.0, 0.0},
                     Coordinate{0.0, 1.0, 0.0}},
                    {Face{0, 1, 2}, Face{1, 0, 3}}};
  test::LogCapture capture;

  ASSERT_EQ(folded.getBoundaryCount(), 1u);
  EXPECT_FALSE(folded.isMeshConformal());
  EXPECT_TRUE(capture.contains("experimental"));
}

// ============================================================================
// Bounding boxes and edges
// ============================================================================

TEST(MeshTest, AxisAlignedBoundingBox)
{
  const Mesh box =
    MeshFactory::createBox(2.0, 4.0, 6.0, Coordinate{1.0, 0.0, -1.0});

  const BoundingBox aabb = box.axisAlignedBBox();
  const BoundingBox squared = box.squaredAxisAlignedBBox();

  EXPECT_DOUBLE_EQ(aabb.xmin, 0.0);
  EXPECT_DOUBLE_EQ(aabb.xmax, 2.0);
  EXPECT_DOUBLE_EQ(aabb.ymin, -2.0);
  EXPECT_DOUBLE_EQ(aabb.ymax, 2.0);
  EXPECT_DOUBLE_EQ(aabb.zmin, -4.0);
  EXPECT_DOUBLE_EQ(aabb.zmax, 2.0);

  EXPECT_DOUBLE_EQ(squared.xmin, -2.0);
  EXPECT_DOUBLE_EQ(squared.xmax, 4.0);
  EXPECT_DOUBLE_EQ(squared.ymin, -3.0);
  EXPECT_DOUBLE_EQ(squared.ymax, 3.0);
  EXPECT_DOUBLE_EQ(squared.zmin, -4.0);
  EXPECT_DOUBLE_EQ(squared.zmax, 2.0);
}

TEST(MeshTest, EmptyMeshBoundingBoxIsZero)
{
  const Mesh empty{{}, {}};

  const BoundingBox aabb = empty.axisAlignedBBox();

  EXPECT_DOUBLE_EQ(aabb.xmin, 0.0);
  EXPECT_DOUBLE_EQ(aabb.zmax, 0.0);
  EXPECT_DOUBLE_EQ(empty.meanEdgeLength(), 0.0);
}

TEST(MeshTest, EdgeStatisticsOfBox)
{
  const Mesh box = MeshFactory::createBox(1.0, 2.0, 3.0);

  EXPECT_NEAR(box.minEdgeLength(), 1.0, 1e-12);
  EXPECT_NEAR(box.maxEdgeLength(), 3.0, 1e-12);
  EXPECT_NEAR(box.meanEdgeLength(), 2.0, 1e-12);
}

TEST(MeshTest, EdgeStatisticsIgnoreRepeatedTriangleSlot)
{
  const Mesh triangle = test::createSingleTriangle();

  EXPECT_NEAR(triangle.minEdgeLength(), 3.0, 1e-12);
  EXPECT_NEAR(triangle.maxEdgeLength(), 5.0, 1e-12);
  EXPECT_NEAR(triangle.meanEdgeLength(), 4.0, 1e-12);
}

TEST(MeshTest, ToStringSummarizesMesh)
{
  const Mesh cube = test::createUnitCube();

  const std::string summary = cube.toString();

  EXPECT_NE(summary.find("unit_cube"), std::string::npos);
  EXPECT_NE(summary.find("quadrangles: 6"), std::string::npos);
  EXPECT_NE(summary.find("zmax = 1.000000"), std::string::npos);
}
