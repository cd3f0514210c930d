#ifndef HYDRO_MESH_MESH_HPP
#define HYDRO_MESH_MESH_HPP

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "hydro-mesh/src/DataTypes/Coordinate.hpp"
#include "hydro-mesh/src/DataTypes/Face.hpp"
#include "hydro-mesh/src/DataTypes/Vector3D.hpp"
#include "hydro-mesh/src/Geometry/Plane.hpp"
#include "hydro-mesh/src/Mesh/Connectivity.hpp"
#include "hydro-mesh/src/Mesh/MeshCache.hpp"
#include "hydro-mesh/src/Mesh/NormalHealing.hpp"

namespace hydro_mesh
{

/// Absolute tolerance under which two vertices are merged
constexpr double kDefaultMergeTolerance = 1e-8;

/// Relative tolerance (to the mean face area) under which a face is degenerate
constexpr double kDefaultDegenerateTolerance = 1e-5;

/// Projected boundary area under which a boundary loop is considered collapsed
constexpr double kConformalTolerance = 1e-7;

/**
 * @brief Axis aligned bounding box
 */
struct BoundingBox
{
  double xmin{0.0};
  double xmax{0.0};
  double ymin{0.0};
  double ymax{0.0};
  double zmin{0.0};
  double zmax{0.0};
};

/**
 * @brief Tunables of Mesh::healMesh()
 */
struct MeshHealConfig
{
  double mergeTolerance{kDefaultMergeTolerance};
  double degenerateTolerance{kDefaultDegenerateTolerance};
  NormalHealer::Config normals{};
};

/**
 * @brief What Mesh::healMesh() changed
 */
struct MeshHealReport
{
  size_t removedUnusedVertices{0};
  size_t removedDegeneratedFaces{0};
  size_t mergedVertices{0};
  size_t healedTriangles{0};
  NormalHealingReport normals{};
};

/**
 * @brief Unstructured surface mesh of triangles and quadrangles.
 *
 * Owns the vertex and face arrays plus a lazily filled cache of derived
 * aggregates (face geometry, connectivity, surface integrals). Faces are
 * wound counterclockwise as seen from outside, so that normals point outward.
 *
 * Getters for derived aggregates compute on first access and memoize. Every
 * mutation invalidates exactly the cached aggregates it makes stale, through
 * MeshCache::apply().
 *
 * Not safe for concurrent access: lazy getters write to the cache.
 */
class Mesh
{
public:
  /**
   * @brief Construct a mesh from vertex and face arrays.
   *
   * @param vertices Vertex coordinates
   * @param faces Faces (triangles repeat their first index in the last slot)
   * @param name Mesh name
   * @throws std::out_of_range if a face references a missing vertex
   */
  Mesh(std::vector<Coordinate> vertices,
       std::vector<Face> faces,
       std::string name = "mesh");

  /**
   * @brief Construct a mesh from row-major arrays.
   *
   * @param vertices nv x 3 coordinates
   * @param faces nf x 4 vertex indices
   * @param name Mesh name
   * @throws std::invalid_argument if vertices do not have 3 columns, faces do
   *         not have 4 columns or an index is negative
   * @throws std::out_of_range if a face references a missing vertex
   */
  static Mesh fromArrays(const Eigen::MatrixXd& vertices,
                         const Eigen::MatrixXi& faces,
                         std::string name = "mesh");

  [[nodiscard]] const std::string& getName() const;
  void setName(std::string name);

  /**
   * @brief Multi-line summary: name, counts and bounding box
   */
  [[nodiscard]] std::string toString() const;

  // ===== Raw arrays =====

  [[nodiscard]] size_t getVertexCount() const;
  [[nodiscard]] size_t getFaceCount() const;

  [[nodiscard]] const std::vector<Coordinate>& getVertices() const;
  [[nodiscard]] const std::vector<Face>& getFaces() const;

  /**
   * @brief Replace the vertex array, clearing every cached aggregate
   * @throws std::out_of_range if a face references a missing vertex
   */
  void setVertices(std::vector<Coordinate> vertices);

  /**
   * @brief Replace the face array, clearing every cached aggregate
   * @throws std::out_of_range if a face references a missing vertex
   */
  void setFaces(std::vector<Face> faces);

  // ===== Face classification =====

  /// @throws std::out_of_range for an invalid face id
  [[nodiscard]] bool isTriangle(size_t faceId) const;

  /**
   * @brief Geometric vertex ids of a face (3 for a triangle, 4 for a quad)
   * @throws std::out_of_range for an invalid face id
   */
  [[nodiscard]] std::vector<size_t> getFace(size_t faceId) const;

  [[nodiscard]] const std::vector<size_t>& getTrianglesIds() const;
  [[nodiscard]] const std::vector<size_t>& getQuadranglesIds() const;
  [[nodiscard]] size_t getTriangleCount() const;
  [[nodiscard]] size_t getQuadrangleCount() const;

  // ===== Face geometry =====

  [[nodiscard]] const std::vector<double>& getFacesAreas() const;
  [[nodiscard]] const std::vector<Vector3D>& getFacesNormals() const;
  [[nodiscard]] const std::vector<Coordinate>& getFacesCenters() const;
  [[nodiscard]] const std::vector<double>& getFacesRadii() const;

  /// Sum of the face areas
  [[nodiscard]] double getSurfaceArea() const;

  // ===== Connectivity =====

  /**
   * @brief Connectivity graph, computed on first access
   * @throws std::runtime_error if an edge is shared by more than 2 faces
   */
  [[nodiscard]] const Connectivity& getConnectivity() const;

  [[nodiscard]] const std::vector<std::set<size_t>>& getVertexVertices() const;
  [[nodiscard]] const std::vector<std::set<size_t>>& getVertexFaces() const;
  [[nodiscard]] const std::vector<std::set<size_t>>& getFaceFaces() const;

  /// Closed boundary loops
  [[nodiscard]] const std::vector<BoundaryLoop>& getBoundaries() const;

  /// Boundary chains that could not be closed
  [[nodiscard]] const std::vector<BoundaryLoop>& getOpenBoundaries() const;

  [[nodiscard]] size_t getBoundaryCount() const;

  /// True if the mesh has neither closed nor open boundaries
  [[nodiscard]] bool isMeshClosed() const;

  /**
   * @brief Heuristic conformality check (experimental).
   *
   * A mesh is reported non conformal when one of its boundary loops has a
   * projected area below kConformalTolerance on the three coordinate planes
   * at once, i.e. the loop is collapsed onto a curve. May misclassify.
   */
  [[nodiscard]] bool isMeshConformal() const;

  // ===== Bounding boxes and edges =====

  [[nodiscard]] BoundingBox axisAlignedBBox() const;

  /**
   * @brief Cube sharing the center of the axis aligned box, with the largest
   * extent as side
   */
  [[nodiscard]] BoundingBox squaredAxisAlignedBBox() const;

  [[nodiscard]] double minEdgeLength() const;
  [[nodiscard]] double maxEdgeLength() const;
  [[nodiscard]] double meanEdgeLength() const;

  // ===== Integrals =====

  /**
   * @brief Polynomial surface integrals, one 15-row column per face
   *
   * Quadrangles are split into (v0, v1, v2) and (v0, v2, v3).
   */
  [[nodiscard]] const MeshCache::SurfaceIntegrals& getSurfaceIntegrals() const;

  /**
   * @brief Enclosed volume, (1/3) sum of n . int(x, y, z) dS over faces
   *
   * Meaningful for closed, outward oriented meshes.
   */
  [[nodiscard]] double getVolume() const;

  [[nodiscard]] bool hasCached(CachedProperty property) const;

  // ===== Rigid motion and scaling =====

  /**
   * @brief Rotate about the origin by a rotation vector.
   *
   * @param angles Rotation vector: angle |angles| about angles / |angles|
   * @return The applied rotation matrix (identity for a zero vector)
   */
  Eigen::Matrix3d rotate(const Vector3D& angles);
  Eigen::Matrix3d rotateX(double theta);
  Eigen::Matrix3d rotateY(double theta);
  Eigen::Matrix3d rotateZ(double theta);

  void translate(const Vector3D& t);
  void translateX(double tx);
  void translateY(double ty);
  void translateZ(double tz);

  /// @throws std::invalid_argument if alpha <= 0
  void scale(double alpha);
  /// @throws std::invalid_argument if alpha <= 0
  void scaleX(double alpha);
  /// @throws std::invalid_argument if alpha <= 0
  void scaleY(double alpha);
  /// @throws std::invalid_argument if alpha <= 0
  void scaleZ(double alpha);

  /// Reverse the winding of every face
  void flipNormals();

  // ===== Plane operations =====

  /**
   * @brief Replace the mesh with its mirror image about a plane.
   *
   * Windings are reversed so that normals stay outward.
   */
  void mirror(const Plane& plane);

  /**
   * @brief Append the mirror image about a plane and merge duplicates.
   */
  void symmetrize(const Plane& plane);

  // ===== Compaction =====

  /**
   * @brief Merge vertices closer than atol on every coordinate
   *
   * @return Old vertex id -> new vertex id
   * @throws std::invalid_argument if atol is negative
   */
  std::vector<size_t> mergeDuplicates(double atol = kDefaultMergeTolerance);

  /**
   * @brief New mesh made of a selection of faces and the vertices they use.
   *
   * Vertices keep their relative order. The source mesh is unchanged.
   *
   * @param faceIds Faces to extract
   * @param oldToNew Optional output: old vertex id -> new id, kUnusedVertex
   *        for vertices that are not extracted
   * @throws std::out_of_range for an invalid face id
   */
  [[nodiscard]] Mesh extractFaces(const std::vector<size_t>& faceIds,
                                  std::vector<size_t>* oldToNew = nullptr) const;

  /**
   * @brief Drop vertices referenced by no face
   * @return Old vertex id -> new vertex id (kUnusedVertex for removed ones)
   */
  std::vector<size_t> removeUnusedVertices();

  /**
   * @brief Drop faces whose area is below mean area * rtol
   * @return Removed face ids, ascending
   * @throws std::invalid_argument if rtol <= 0
   */
  std::vector<size_t> removeDegeneratedFaces(
    double rtol = kDefaultDegenerateTolerance);

  // ===== Repair =====

  /**
   * @brief Rotate triangle records so that the repeated index sits in slots
   * 0 and 3
   *
   * Records whose repeated indices are not adjacent in the cycle, such as
   * (a, b, a, c), cannot be rotated into that form; they are left unchanged
   * with a warning.
   *
   * @return Number of faces fixed
   */
  size_t healTriangles();

  /**
   * @brief Make face windings consistent, then outward for closed meshes.
   *
   * @throws std::runtime_error if an edge is shared by more than 2 faces
   */
  NormalHealingReport healNormals(const NormalHealer::Config& config = {});

  /**
   * @brief Unused vertices, degenerated faces, duplicates, triangles and
   * normals, in this order
   */
  MeshHealReport healMesh(const MeshHealConfig& config = {});

  /**
   * @brief Split every quadrangle along its (v0, v2) diagonal.
   *
   * (v0, v1, v2, v3) becomes (v0, v2, v3) in place and (v0, v1, v2) is
   * appended after the existing faces.
   */
  void triangulateQuadrangles();

  /**
   * @brief Concatenation of two meshes with duplicate vertices merged
   */
  Mesh operator+(const Mesh& other) const;

private:
  void validateFaces() const;

  const FaceGeometry& faceGeometry() const;
  const MeshCache::FaceClassification& faceClassification() const;

  /**
   * @brief Renumber face indices and install a new vertex array
   * @return True if a face lost one of its distinct vertices
   */
  bool remapVertices(const std::vector<size_t>& oldToNew,
                     std::vector<Coordinate> newVertices);

  void scaleAxes(const Eigen::Vector3d& factors);

  std::vector<Coordinate> vertices_;
  std::vector<Face> faces_;
  std::string name_;

  mutable MeshCache cache_;
};

}  // namespace hydro_mesh

#endif  // HYDRO_MESH_MESH_HPP
