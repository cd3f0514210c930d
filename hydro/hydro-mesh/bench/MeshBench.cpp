#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <vector>

#include "hydro-mesh/src/Mesh/Connectivity.hpp"
#include "hydro-mesh/src/Mesh/FaceGeometry.hpp"
#include "hydro-mesh/src/Mesh/Mesh.hpp"
#include "hydro-mesh/src/Mesh/VertexMerging.hpp"
#include "hydro-mesh/src/RigidBody/InertialCalculations.hpp"
#include "hydro-mesh/src/Utils/MeshFactory.hpp"

using namespace hydro_mesh;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

// Square plate of n x n quadrangles
Mesh createPlate(benchmark::State& state)
{
  const auto n = static_cast<size_t>(state.range(0));
  return MeshFactory::createRectangularPlate(10.0, 10.0, n, n);
}

// Plate vertices with every vertex duplicated once
std::vector<Coordinate> createDuplicatedVertices(const Mesh& plate)
{
  std::vector<Coordinate> vertices = plate.getVertices();
  vertices.insert(
    vertices.end(), plate.getVertices().begin(), plate.getVertices().end());
  return vertices;
}

}  // namespace

// ============================================================================
// Benchmarks
// ============================================================================

/**
 * @brief Areas, normals and centers of every face
 */
static void BM_FaceGeometry(benchmark::State& state)
{
  const Mesh plate = createPlate(state);
  for (auto _ : state)
  {
    FaceGeometry geometry = computeFaceGeometry(plate.getVertices(),
                                                plate.getFaces());
    benchmark::DoNotOptimize(geometry);
  }
  state.SetComplexityN(static_cast<int64_t>(plate.getFaceCount()));
}
BENCHMARK(BM_FaceGeometry)->Args({16})->Args({64})->Args({256})->Complexity();

/**
 * @brief Vertex/face adjacency and boundary extraction
 *
 * The plate has a single boundary loop of 4n edges.
 */
static void BM_Connectivity(benchmark::State& state)
{
  const Mesh plate = createPlate(state);
  for (auto _ : state)
  {
    Connectivity connectivity =
      computeConnectivity(plate.getVertexCount(), plate.getFaces());
    benchmark::DoNotOptimize(connectivity);
  }
  state.SetComplexityN(static_cast<int64_t>(plate.getFaceCount()));
}
BENCHMARK(BM_Connectivity)->Args({16})->Args({64})->Args({256})->Complexity();

/**
 * @brief Sweep-and-merge of fully duplicated vertex arrays
 */
static void BM_MergeDuplicateVertices(benchmark::State& state)
{
  const Mesh plate = createPlate(state);
  const std::vector<Coordinate> vertices = createDuplicatedVertices(plate);
  for (auto _ : state)
  {
    VertexMergeResult result =
      mergeDuplicateVertices(vertices, kDefaultMergeTolerance);
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(static_cast<int64_t>(vertices.size()));
}
BENCHMARK(BM_MergeDuplicateVertices)
  ->Args({16})
  ->Args({64})
  ->Args({256})
  ->Complexity();

/**
 * @brief Surface integrals and plain inertia of a triangulated box, cache
 * cleared every iteration
 */
static void BM_PlainInertia(benchmark::State& state)
{
  const Mesh box = MeshFactory::createTriangulatedBox(1.0, 2.0, 3.0);
  for (auto _ : state)
  {
    Mesh mesh = box;
    RigidBodyInertia inertia = InertialCalculations::evalPlainMeshInertias(mesh);
    benchmark::DoNotOptimize(inertia);
  }
}
BENCHMARK(BM_PlainInertia);

BENCHMARK_MAIN();
