#include <gtest/gtest.h>

#include <stdexcept>

#include "hydro-mesh/src/RigidBody/InertialCalculations.hpp"
#include "hydro-mesh/test/Helpers/TestMeshes.hpp"

using namespace hydro_mesh;

namespace
{

constexpr double kTolerance = 1e-10;

}  // anonymous namespace

// ============================================================================
// Plain (solid) inertia
// ============================================================================

TEST(InertialCalculationsTest, UnitCubeAtOrigin)
{
  // Arrange: cube [0, 1]^3, density 1
  const Mesh cube = test::createUnitCube();

  // Analytical solution at the origin:
  // Ixx = int (y^2 + z^2) dV = 2/3, Ixy = int x y dV = 1/4
  const RigidBodyInertia inertia =
    InertialCalculations::evalPlainMeshInertias(cube, 1.0);

  EXPECT_NEAR(inertia.getMass(), 1.0, kTolerance);
  test::expectCoordinateNear(
    inertia.getCenterOfGravity(), Coordinate{0.5, 0.5, 0.5}, kTolerance);
  EXPECT_NEAR(inertia.getXX(), 2.0 / 3.0, kTolerance);
  EXPECT_NEAR(inertia.getYY(), 2.0 / 3.0, kTolerance);
  EXPECT_NEAR(inertia.getZZ(), 2.0 / 3.0, kTolerance);
  EXPECT_NEAR(inertia.getXY(), 0.25, kTolerance);
  EXPECT_NEAR(inertia.getYZ(), 0.25, kTolerance);
  EXPECT_NEAR(inertia.getXZ(), 0.25, kTolerance);
}

TEST(InertialCalculationsTest, UnitCubeAtCenterOfGravity)
{
  const Mesh cube = test::createUnitCube();

  const Eigen::Matrix3d I = InertialCalculations::evalPlainMeshInertias(cube, 1.0)
                              .atCenterOfGravity()
                              .getInertiaMatrix();

  // Ixx = Iyy = Izz = m/6, no products of inertia
  EXPECT_TRUE(I.isApprox(Eigen::Matrix3d::Identity() / 6.0, kTolerance));
}

TEST(InertialCalculationsTest, RectangularBoxAnalytical)
{
  // Arrange: box 2 x 3 x 4 centered at the origin
  const double a = 2.0;
  const double b = 3.0;
  const double c = 4.0;
  const double density = 2.5;
  const Mesh box = MeshFactory::createBox(a, b, c);
  const double mass = density * a * b * c;

  const RigidBodyInertia inertia =
    InertialCalculations::evalPlainMeshInertias(box, density);

  EXPECT_NEAR(inertia.getMass(), mass, kTolerance);
  EXPECT_NEAR(inertia.getXX(), mass * (b * b + c * c) / 12.0, 1e-9);
  EXPECT_NEAR(inertia.getYY(), mass * (a * a + c * c) / 12.0, 1e-9);
  EXPECT_NEAR(inertia.getZZ(), mass * (a * a + b * b) / 12.0, 1e-9);
  EXPECT_NEAR(inertia.getXY(), 0.0, 1e-9);
  EXPECT_NEAR(inertia.getYZ(), 0.0, 1e-9);
  EXPECT_NEAR(inertia.getXZ(), 0.0, 1e-9);
}

TEST(InertialCalculationsTest, TriangulatedBoxMatchesQuadrangleBox)
{
  const Coordinate center{1.0, -2.0, 0.5};
  const Mesh quads = MeshFactory::createBox(1.0, 2.0, 3.0, center);
  const Mesh triangles = MeshFactory::createTriangulatedBox(1.0, 2.0, 3.0, center);

  const auto fromQuads = InertialCalculations::evalPlainMeshInertias(quads);
  const auto fromTriangles =
    InertialCalculations::evalPlainMeshInertias(triangles);

  EXPECT_NEAR(fromQuads.getMass(), 6.0 * InertialCalculations::kSeaWaterDensity, 1e-8);
  EXPECT_TRUE(fromTriangles.getInertiaMatrix().isApprox(
    fromQuads.getInertiaMatrix(), 1e-10));
  test::expectCoordinateNear(fromTriangles.getCenterOfGravity(), center, 1e-10);
}

TEST(InertialCalculationsTest, PlainInertiaRejectsInvalidInput)
{
  Mesh cube = test::createUnitCube();

  EXPECT_THROW(InertialCalculations::evalPlainMeshInertias(cube, 0.0),
               std::invalid_argument);

  cube.flipNormals();
  EXPECT_THROW(InertialCalculations::evalPlainMeshInertias(cube, 1.0),
               std::runtime_error);

  EXPECT_THROW(InertialCalculations::evalPlainMeshInertias(
                 test::createSingleTriangle(), 1.0),
               std::runtime_error);
}

// ============================================================================
// Shell inertia
// ============================================================================

TEST(InertialCalculationsTest, UnitCubeShell)
{
  const Mesh cube = test::createUnitCube();

  // Surface integrals over the 6 sides: int y^2 dS = 7/3, int x y dS = 3/2
  const RigidBodyInertia inertia =
    InertialCalculations::evalShellMeshInertias(cube, 1.0, 1.0);

  EXPECT_NEAR(inertia.getMass(), 6.0, kTolerance);
  test::expectCoordinateNear(
    inertia.getCenterOfGravity(), Coordinate{0.5, 0.5, 0.5}, kTolerance);
  EXPECT_NEAR(inertia.getXX(), 14.0 / 3.0, kTolerance);
  EXPECT_NEAR(inertia.getYY(), 14.0 / 3.0, kTolerance);
  EXPECT_NEAR(inertia.getZZ(), 14.0 / 3.0, kTolerance);
  EXPECT_NEAR(inertia.getXY(), 1.5, kTolerance);
  EXPECT_NEAR(inertia.getYZ(), 1.5, kTolerance);
  EXPECT_NEAR(inertia.getXZ(), 1.5, kTolerance);
}

TEST(InertialCalculationsTest, PlateShell)
{
  // Plate [0, 2] x [0, 1], sigma = 0.5: m = 1, Ixx = sigma int y^2 dS
  const Mesh plate = MeshFactory::createRectangularPlate(2.0, 1.0, 4, 2);

  const RigidBodyInertia inertia =
    InertialCalculations::evalShellMeshInertias(plate, 1.0, 0.5);

  EXPECT_NEAR(inertia.getMass(), 1.0, kTolerance);
  test::expectCoordinateNear(
    inertia.getCenterOfGravity(), Coordinate{1.0, 0.5, 0.0}, kTolerance);
  EXPECT_NEAR(inertia.getXX(), 0.5 * 2.0 / 3.0, kTolerance);
  EXPECT_NEAR(inertia.getYY(), 0.5 * 8.0 / 3.0, kTolerance);
  EXPECT_NEAR(inertia.getXY(), 0.5 * 1.0, kTolerance);
}

TEST(InertialCalculationsTest, ShellInertiaRejectsInvalidInput)
{
  const Mesh cube = test::createUnitCube();
  const Mesh empty{{}, {}};

  EXPECT_THROW(InertialCalculations::evalShellMeshInertias(cube, -1.0),
               std::invalid_argument);
  EXPECT_THROW(InertialCalculations::evalShellMeshInertias(cube, 1.0, 0.0),
               std::invalid_argument);
  EXPECT_THROW(InertialCalculations::evalShellMeshInertias(empty),
               std::runtime_error);
}
