#ifndef HYDRO_MESH_FACE_GEOMETRY_HPP
#define HYDRO_MESH_FACE_GEOMETRY_HPP

#include <vector>

#include "hydro-mesh/src/DataTypes/Coordinate.hpp"
#include "hydro-mesh/src/DataTypes/Face.hpp"
#include "hydro-mesh/src/DataTypes/Vector3D.hpp"

namespace hydro_mesh
{

/**
 * @brief Per-face differential geometry, computed and cached together.
 *
 * All three arrays are indexed by face id.
 */
struct FaceGeometry
{
  std::vector<double> areas;        ///< Face areas (>= 0)
  std::vector<Vector3D> normals;    ///< Unit outward normals (zero if degenerate)
  std::vector<Coordinate> centers;  ///< Area-weighted face centroids
};

/**
 * @brief Compute areas, unit normals and centroids of every face.
 *
 * Triangles: n = (v1 - v0) x (v2 - v0), area = |n| / 2, centroid = vertex
 * mean.
 *
 * Quadrangles: n = (v2 - v0) x (v3 - v1). The area is the sum of the areas of
 * (v0, v1, v2) and (v0, v2, v3) and the centroid is the area-weighted mean of
 * their centroids, so mildly non-planar quadrangles stay well defined.
 *
 * @param vertices Mesh vertices
 * @param faces Mesh faces (indices assumed valid)
 * @return Face geometry arrays, one entry per face
 */
FaceGeometry computeFaceGeometry(const std::vector<Coordinate>& vertices,
                                 const std::vector<Face>& faces);

/**
 * @brief Compute the radius of every face.
 *
 * The radius is the maximal distance between the face centroid and one of the
 * face vertices.
 *
 * @param vertices Mesh vertices
 * @param faces Mesh faces
 * @param centers Face centroids, as returned by computeFaceGeometry()
 * @return One radius per face
 */
std::vector<double> computeFaceRadii(const std::vector<Coordinate>& vertices,
                                     const std::vector<Face>& faces,
                                     const std::vector<Coordinate>& centers);

}  // namespace hydro_mesh

#endif  // HYDRO_MESH_FACE_GEOMETRY_HPP
