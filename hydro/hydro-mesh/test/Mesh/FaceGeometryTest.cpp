#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "hydro-mesh/src/Mesh/FaceGeometry.hpp"
#include "hydro-mesh/test/Helpers/TestMeshes.hpp"

using namespace hydro_mesh;
using hydro_mesh::test::expectCoordinateNear;

namespace
{

constexpr double kTolerance = 1e-12;

}  // anonymous namespace

TEST(FaceGeometryTest, Triangle)
{
  const std::vector<Coordinate> vertices{Coordinate{0.0, 0.0, 0.0},
                                         Coordinate{2.0, 0.0, 0.0},
                                         Coordinate{0.0, 2.0, 0.0}};

  const FaceGeometry geometry = computeFaceGeometry(vertices, {Face{0, 1, 2}});

  ASSERT_EQ(geometry.areas.size(), 1u);
  EXPECT_NEAR(geometry.areas[0], 2.0, kTolerance);
  expectCoordinateNear(
    Coordinate{geometry.normals[0]}, Coordinate{0.0, 0.0, 1.0}, kTolerance);
  expectCoordinateNear(
    geometry.centers[0], Coordinate{2.0 / 3.0, 2.0 / 3.0, 0.0}, kTolerance);
}

TEST(FaceGeometryTest, PlanarQuadrangle)
{
  const std::vector<Coordinate> vertices{Coordinate{0.0, 0.0, 0.0},
                                         Coordinate{1.0, 0.0, 0.0},
                                         Coordinate{1.0, 1.0, 0.0},
                                         Coordinate{0.0, 1.0, 0.0}};

  const FaceGeometry geometry =
    computeFaceGeometry(vertices, {Face{0, 1, 2, 3}});

  EXPECT_NEAR(geometry.areas[0], 1.0, kTolerance);
  expectCoordinateNear(
    Coordinate{geometry.normals[0]}, Coordinate{0.0, 0.0, 1.0}, kTolerance);
  expectCoordinateNear(
    geometry.centers[0], Coordinate{0.5, 0.5, 0.0}, kTolerance);
}

TEST(FaceGeometryTest, NonPlanarQuadrangleUsesDiagonalSplit)
{
  // Vertex 2 lifted: both halves are right triangles of area sqrt(2)/2
  const std::vector<Coordinate> vertices{Coordinate{0.0, 0.0, 0.0},
                                         Coordinate{1.0, 0.0, 0.0},
                                         Coordinate{1.0, 1.0, 1.0},
                                         Coordinate{0.0, 1.0, 0.0}};

  const FaceGeometry geometry =
    computeFaceGeometry(vertices, {Face{0, 1, 2, 3}});

  EXPECT_NEAR(geometry.areas[0], std::sqrt(2.0), kTolerance);
  expectCoordinateNear(
    geometry.centers[0], Coordinate{0.5, 0.5, 1.0 / 3.0}, kTolerance);

  const double invSqrt6 = 1.0 / std::sqrt(6.0);
  expectCoordinateNear(Coordinate{geometry.normals[0]},
                       Coordinate{-invSqrt6, -invSqrt6, 2.0 * invSqrt6},
                       kTolerance);
}

TEST(FaceGeometryTest, DegenerateFacesHaveZeroNormal)
{
  const std::vector<Coordinate> vertices{Coordinate{0.0, 0.0, 0.0},
                                         Coordinate{1.0, 0.0, 0.0},
                                         Coordinate{2.0, 0.0, 0.0},
                                         Coordinate{3.0, 0.0, 0.0}};

  const FaceGeometry geometry =
    computeFaceGeometry(vertices, {Face{0, 1, 2}, Face{0, 1, 2, 3}});

  for (size_t faceId = 0; faceId < 2; ++faceId)
  {
    EXPECT_DOUBLE_EQ(geometry.areas[faceId], 0.0);
    EXPECT_TRUE(geometry.normals[faceId].isZero());
    EXPECT_FALSE(std::isnan(geometry.centers[faceId].x()));
  }
  expectCoordinateNear(
    geometry.centers[1], Coordinate{1.5, 0.0, 0.0}, kTolerance);
}

TEST(FaceGeometryTest, Radii)
{
  const std::vector<Coordinate> vertices{Coordinate{0.0, 0.0, 0.0},
                                         Coordinate{1.0, 0.0, 0.0},
                                         Coordinate{1.0, 1.0, 0.0},
                                         Coordinate{0.0, 1.0, 0.0}};
  const std::vector<Face> faces{Face{0, 1, 2, 3}};
  const FaceGeometry geometry = computeFaceGeometry(vertices, faces);

  const auto radii = computeFaceRadii(vertices, faces, geometry.centers);

  ASSERT_EQ(radii.size(), 1u);
  EXPECT_NEAR(radii[0], std::sqrt(0.5), kTolerance);
}
