#ifndef HYDRO_MESH_VERTEX_MERGING_HPP
#define HYDRO_MESH_VERTEX_MERGING_HPP

#include <cstddef>
#include <vector>

#include "hydro-mesh/src/DataTypes/Coordinate.hpp"

namespace hydro_mesh
{

/**
 * @brief Result of a duplicate vertex merge.
 */
struct VertexMergeResult
{
  std::vector<Coordinate> uniqueVertices;  ///< Compacted vertex array
  std::vector<size_t> oldToNew;            ///< Old vertex id -> new vertex id
};

/**
 * @brief Identify vertices lying within an absolute tolerance of each other.
 *
 * Two vertices are duplicates when every coordinate differs by at most atol.
 * Duplicates are merged transitively. Unique vertices keep the position and
 * the relative order of the first occurrence of their group.
 *
 * @param vertices Vertex array
 * @param atol Absolute tolerance (>= 0)
 * @return Unique vertices and the old -> new index map
 * @throws std::invalid_argument if atol is negative
 */
VertexMergeResult mergeDuplicateVertices(const std::vector<Coordinate>& vertices,
                                         double atol);

}  // namespace hydro_mesh

#endif  // HYDRO_MESH_VERTEX_MERGING_HPP
