#ifndef HYDRO_MESH_NORMAL_HEALING_HPP
#define HYDRO_MESH_NORMAL_HEALING_HPP

#include <cstddef>
#include <set>
#include <vector>

#include "hydro-mesh/src/DataTypes/Face.hpp"

namespace hydro_mesh
{

/**
 * @brief Outcome of a normal healing pass
 */
struct NormalHealingReport
{
  size_t reversedFaces{0};    ///< Faces reversed by the flood fill
  size_t componentCount{0};   ///< Connected components flooded
  bool outwardChecked{false}; ///< Mesh was closed, outward test was run
  bool flippedOutward{false}; ///< Whole mesh was flipped to point outward
  bool watertight{true};      ///< Horizontal sanity components were small
};

/**
 * @brief Makes face windings consistent across edge-adjacent faces.
 *
 * Works on a face array and an immutable face adjacency (as produced by
 * computeConnectivity()). Two adjacent faces are consistently wound when they
 * traverse their shared edge in opposite directions.
 */
class NormalHealer
{
public:
  /**
   * @brief Tunables of Mesh::healNormals()
   */
  struct Config
  {
    /// Bound on the horizontal components of the closed-mesh sanity vector
    double watertightTolerance{1e-9};
  };

  struct FloodFillResult
  {
    size_t reversedFaces{0};
    size_t componentCount{0};
  };

  /**
   * @brief Propagate the winding of a seed face to its whole component.
   *
   * Faces are visited with an explicit stack, starting at face 0 and
   * restarting at the lowest unvisited face whenever a component is
   * exhausted. Each component is made internally consistent; components are
   * not reconciled with each other.
   *
   * An adjacency whose faces do not share exactly 2 vertices is logged and
   * skipped; the neighbor stays unvisited and may be reached through another
   * face.
   *
   * @param faces Faces to heal, reversed in place
   * @param faceFaces Face adjacency, one set per face
   * @return Number of reversed faces and of flooded components
   * @throws std::invalid_argument if faceFaces and faces differ in size
   */
  static FloodFillResult floodFill(std::vector<Face>& faces,
                                   const std::vector<std::set<size_t>>& faceFaces);

  /**
   * @brief True if face traverses the directed edge (from, to)
   */
  static bool traversesEdge(const Face& face, size_t from, size_t to);

  NormalHealer() = delete;
};

}  // namespace hydro_mesh

#endif  // HYDRO_MESH_NORMAL_HEALING_HPP
