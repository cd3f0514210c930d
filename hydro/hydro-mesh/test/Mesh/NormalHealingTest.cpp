#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <vector>

#include "hydro-mesh/src/Mesh/NormalHealing.hpp"
#include "hydro-mesh/test/Helpers/LogCapture.hpp"
#include "hydro-mesh/test/Helpers/TestMeshes.hpp"

using namespace hydro_mesh;

// ============================================================================
// Flood fill
// ============================================================================

TEST(NormalHealerTest, FloodFillRestoresSeedOrientation)
{
  const Mesh cube = test::createUnitCube();
  const Mesh mixed = test::createMixedWindingCube();
  std::vector<Face> faces = mixed.getFaces();

  const auto result = NormalHealer::floodFill(faces, mixed.getFaceFaces());

  EXPECT_EQ(result.reversedFaces, 3u);
  EXPECT_EQ(result.componentCount, 1u);
  EXPECT_EQ(faces, cube.getFaces());
}

TEST(NormalHealerTest, FloodFillCountsDisjointComponents)
{
  Mesh shifted = test::createUnitCube();
  shifted.translateX(5.0);
  const Mesh twoCubes = test::createUnitCube() + shifted;
  std::vector<Face> faces = twoCubes.getFaces();
  faces[7].reverse();

  const auto result = NormalHealer::floodFill(faces, twoCubes.getFaceFaces());

  EXPECT_EQ(result.componentCount, 2u);
  EXPECT_EQ(result.reversedFaces, 1u);
  EXPECT_EQ(faces, twoCubes.getFaces());
}

TEST(NormalHealerTest, AdjacencyWithoutSharedEdgeIsSkipped)
{
  // Same three vertices, wrongly declared adjacent
  std::vector<Face> faces{Face{0, 1, 2}, Face{0, 2, 1}};
  const std::vector<std::set<size_t>> faceFaces{{1}, {0}};
  test::LogCapture capture;

  const auto result = NormalHealer::floodFill(faces, faceFaces);

  EXPECT_EQ(capture.warnings(), 1u);
  EXPECT_EQ(result.reversedFaces, 0u);
  EXPECT_EQ(result.componentCount, 2u);
  EXPECT_EQ(faces[1], (Face{0, 2, 1}));
}

TEST(NormalHealerTest, AdjacencySizeMismatchThrows)
{
  std::vector<Face> faces{Face{0, 1, 2}};

  EXPECT_THROW(NormalHealer::floodFill(faces, {}), std::invalid_argument);
}

TEST(NormalHealerTest, TraversesEdge)
{
  const Face quad{0, 1, 2, 3};

  EXPECT_TRUE(NormalHealer::traversesEdge(quad, 3, 0));
  EXPECT_FALSE(NormalHealer::traversesEdge(quad, 0, 3));
  EXPECT_FALSE(NormalHealer::traversesEdge(quad, 0, 2));
}

// ============================================================================
// Mesh::healNormals
// ============================================================================

TEST(HealNormalsTest, MixedCubeBecomesConsistentAndOutward)
{
  Mesh mesh = test::createMixedWindingCube();

  const NormalHealingReport report = mesh.healNormals();

  EXPECT_EQ(report.reversedFaces, 3u);
  EXPECT_TRUE(report.outwardChecked);
  EXPECT_FALSE(report.flippedOutward);
  EXPECT_TRUE(report.watertight);
  EXPECT_TRUE(test::hasConsistentWinding(mesh));
  EXPECT_NEAR(mesh.getVolume(), 1.0, 1e-12);
}

TEST(HealNormalsTest, InwardSeedIsFlippedOutward)
{
  Mesh mesh = test::createUnitCube();
  std::vector<Face> faces = mesh.getFaces();
  faces[0].reverse();
  mesh.setFaces(faces);

  const NormalHealingReport report = mesh.healNormals();

  EXPECT_EQ(report.reversedFaces, 5u);
  EXPECT_TRUE(report.flippedOutward);
  EXPECT_NEAR(mesh.getVolume(), 1.0, 1e-12);
}

TEST(HealNormalsTest, WarpedClosedMeshIsNotWatertight)
{
  // Raising one corner warps the three quadrangles around it: the mesh stays
  // topologically closed but the horizontal sanity components no longer cancel
  Mesh mesh = test::createUnitCube();
  std::vector<Coordinate> vertices = mesh.getVertices();
  vertices[6] = Coordinate{1.0, 1.0, 1.5};
  mesh.setVertices(vertices);
  ASSERT_TRUE(mesh.isMeshClosed());
  test::LogCapture capture;

  const NormalHealingReport report = mesh.healNormals();

  EXPECT_TRUE(report.outwardChecked);
  EXPECT_FALSE(report.watertight);
  EXPECT_FALSE(report.flippedOutward);
  EXPECT_EQ(capture.warnings(), 1u);
  EXPECT_TRUE(capture.contains("watertight"));
}

TEST(HealNormalsTest, SecondPassChangesNothing)
{
  Mesh mesh = test::createMixedWindingCube();
  mesh.healNormals();
  const std::vector<Face> healed = mesh.getFaces();

  const NormalHealingReport report = mesh.healNormals();

  EXPECT_EQ(report.reversedFaces, 0u);
  EXPECT_FALSE(report.flippedOutward);
  EXPECT_EQ(mesh.getFaces(), healed);
}

TEST(HealNormalsTest, OpenMeshSkipsOutwardCheck)
{
  Mesh plate = MeshFactory::createRectangularPlate(1.0, 1.0, 2, 2);
  plate.flipNormals();

  const NormalHealingReport report = plate.healNormals();

  EXPECT_FALSE(report.outwardChecked);
  EXPECT_FALSE(report.flippedOutward);
  EXPECT_NEAR(plate.getFacesNormals()[0].z(), -1.0, 1e-12);
}

TEST(HealNormalsTest, NonManifoldMeshThrows)
{
  Mesh mesh{{Coordinate{0.0, 0.0, 0.0},
             Coordinate{1.0, 0.0, 0.0},
             Coordinate{0.0, 1.0, 0.0},
             Coordinate{0.0, -1.0, 0.0},
             Coordinate{0.0, 0.0, 1.0}},
            {Face{0, 1, 2}, Face{1, 0, 3}, Face{0, 1, 4}}};

  EXPECT_THROW(mesh.healNormals(), std::runtime_error);
}
