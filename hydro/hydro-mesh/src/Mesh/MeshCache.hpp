#ifndef HYDRO_MESH_MESH_CACHE_HPP
#define HYDRO_MESH_MESH_CACHE_HPP

#include <bitset>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include <Eigen/Dense>

#include "hydro-mesh/src/Geometry/TriangleIntegrals.hpp"
#include "hydro-mesh/src/Mesh/Connectivity.hpp"
#include "hydro-mesh/src/Mesh/FaceGeometry.hpp"

namespace hydro_mesh
{

/**
 * @brief Derived aggregates a Mesh computes lazily and memoizes.
 */
enum class CachedProperty : size_t
{
  FaceClassification = 0,  ///< Triangle / quadrangle ids
  FaceGeometry,            ///< Areas, normals, centers
  FaceRadii,               ///< Max vertex-to-center distance per face
  Connectivity,            ///< Adjacency maps and boundary loops
  SurfaceIntegrals,        ///< 15 x nbFaces polynomial integrals
  Count
};

constexpr size_t kCachedPropertyCount =
  static_cast<size_t>(CachedProperty::Count);

using CachedPropertySet = std::bitset<kCachedPropertyCount>;

/**
 * @brief Kinds of mesh mutation, each mapped to the aggregates it invalidates.
 */
enum class MeshChange
{
  VerticesReplaced,   ///< Vertex array replaced wholesale
  FacesReplaced,      ///< Face array replaced, faces added or removed
  RigidMotion,        ///< Rotation / translation (geometry updated in place)
  VertexPositions,    ///< Non-rigid change of vertex positions (scaling)
  Winding,            ///< Some faces reversed
  GlobalFlip,         ///< Every face reversed (normals negated in place)
  VertexRenumbering   ///< Vertex ids remapped, per-face positions unchanged
};

/**
 * @brief Per-mesh store of lazily computed aggregates.
 *
 * Every aggregate is an independent optional field. MeshCache::invalidatedBy()
 * is the single table mapping a mutation kind to the fields it invalidates;
 * Mesh routes every mutation through apply().
 */
class MeshCache
{
public:
  /// Partition of face ids into triangles and quadrangles (ascending)
  struct FaceClassification
  {
    std::vector<size_t> triangleIds;
    std::vector<size_t> quadrangleIds;
  };

  /// Per-face surface integrals, one column per face
  using SurfaceIntegrals =
    Eigen::Matrix<double, kSurfaceIntegralCount, Eigen::Dynamic>;

  /**
   * @brief Set of aggregates a mutation kind invalidates.
   */
  [[nodiscard]] static CachedPropertySet invalidatedBy(MeshChange change);

  /**
   * @brief Invalidate the aggregates listed for a mutation kind.
   */
  void apply(MeshChange change);

  void invalidate(CachedProperty property);

  void invalidate(const CachedPropertySet& properties);

  void clear();

  [[nodiscard]] bool has(CachedProperty property) const;

  /// Set of aggregates currently cached
  [[nodiscard]] CachedPropertySet cached() const;

  std::optional<FaceClassification> faceClassification;
  std::optional<FaceGeometry> faceGeometry;
  std::optional<std::vector<double>> faceRadii;
  std::optional<Connectivity> connectivity;
  std::optional<SurfaceIntegrals> surfaceIntegrals;
};

/// Human readable name of a cached aggregate
std::string_view toString(CachedProperty property);

}  // namespace hydro_mesh

#endif  // HYDRO_MESH_MESH_CACHE_HPP
