#ifndef HYDRO_MESH_CONNECTIVITY_HPP
#define HYDRO_MESH_CONNECTIVITY_HPP

#include <cstddef>
#include <set>
#include <vector>

#include "hydro-mesh/src/DataTypes/Face.hpp"

namespace hydro_mesh
{

/// Ordered cyclic sequence of vertex ids (first vertex not repeated at the end)
using BoundaryLoop = std::vector<size_t>;

/**
 * @brief Topological connectivity of a surface mesh.
 *
 * Valid for edge-manifold meshes only (each edge shared by at most 2 faces).
 */
struct Connectivity
{
  std::vector<std::set<size_t>> vertexVertices;  ///< vertex -> adjacent vertices
  std::vector<std::set<size_t>> vertexFaces;     ///< vertex -> incident faces
  std::vector<std::set<size_t>> faceFaces;       ///< face -> edge-adjacent faces

  /// Closed boundary loops, traversed against the winding of their faces
  std::vector<BoundaryLoop> boundaries;

  /// Boundary chains that could not be closed (malformed boundaries)
  std::vector<BoundaryLoop> openBoundaries;
};

/**
 * @brief Build vertex/vertex, vertex/face and face/face connectivity and
 * extract the boundary loops.
 *
 * Every mesh edge is classified by the number of faces incident to both of its
 * vertices: 2 faces make a face adjacency, 1 face makes a directed boundary
 * edge. Boundary edges are then chained into loops.
 *
 * A chain that cannot be closed is logged as a warning and returned in
 * Connectivity::openBoundaries.
 *
 * @param vertexCount Number of mesh vertices
 * @param faces Mesh faces
 * @return The connectivity graph
 * @throws std::runtime_error if an edge is shared by more than 2 faces
 */
Connectivity computeConnectivity(size_t vertexCount,
                                 const std::vector<Face>& faces);

}  // namespace hydro_mesh

#endif  // HYDRO_MESH_CONNECTIVITY_HPP
